// traffic_types.hpp
#pragma once

#include <cstdint>
#include <string>

namespace traffic {

struct SimulationStep {
  double time_s = 0.0;
};

// Per lane, per step. Created by a bridge, discarded after aggregation.
struct LaneSample {
  int vehicle_count = 0;
  double mean_speed_mps = 0.0;
  double mean_wait_s = 0.0;
  int halting_count = 0;
  double occupancy = 0.0;  // ratio of lane length covered by vehicles
};

// Aggregated per intersection, per step. Use make() so the ranges hold:
// queue_length >= 0, mean_wait_s >= 0, occupancy in [0,1].
struct IntersectionFeature {
  std::string intersection_id;
  double queue_length = 0.0;
  double mean_wait_s = 0.0;
  double occupancy = 0.0;
  int vehicle_count = 0;

  static IntersectionFeature make(std::string id, double queue_length, double mean_wait_s,
                                  double occupancy, int vehicle_count);

  bool is_empty() const {
    return vehicle_count == 0 && queue_length == 0.0 && mean_wait_s == 0.0 && occupancy == 0.0;
  }
};

enum class CongestionLabel : int { Low = 0, Medium = 1, High = 2 };

constexpr int kLabelCount = 3;

inline int label_level(CongestionLabel l) { return static_cast<int>(l); }

const char* label_str(CongestionLabel l);

enum class Decision { Hold, Extend, Switch, Rejected };

const char* decision_str(Decision d);

// Outgoing command. duration_s is the total green granted to phase_index,
// elapsed_s the part of it that already ran.
struct SignalProgramUpdate {
  std::string intersection_id;
  int phase_index = 0;
  double duration_s = 0.0;
  double elapsed_s = 0.0;

  double remaining_s() const { return duration_s > elapsed_s ? duration_s - elapsed_s : 0.0; }

  bool operator==(const SignalProgramUpdate& o) const {
    return intersection_id == o.intersection_id && phase_index == o.phase_index &&
           duration_s == o.duration_s && elapsed_s == o.elapsed_s;
  }
};

struct LogRecord {
  double step_time_s = 0.0;
  std::string intersection_id;
  double queue_length = 0.0;
  double mean_wait_s = 0.0;
  double occupancy = 0.0;
  CongestionLabel label = CongestionLabel::Low;
  int phase_index = 0;
  Decision decision = Decision::Hold;
};

} // namespace traffic
