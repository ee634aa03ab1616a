// phase_controller.hpp
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "label_history.hpp"
#include "traffic_types.hpp"

namespace traffic {

struct ControllerConfig {
  double min_green_s = 10.0;   // hard floor before any change
  double max_green_s = 60.0;   // hard cap, switch regardless of congestion
  double extension_s = 10.0;   // green added per granted extension
  int trend_window = 5;        // labels kept for the anti-oscillation check
  double transition_s = 3.0;   // fixed length of non-green phases (yellow, all-red)
};

struct PhaseState {
  int phase_index = 0;
  int phase_count = 1;
  double elapsed_s = 0.0;
  double planned_s = 0.0;  // time currently granted to phase_index
  LabelHistory history;

  bool operator==(const PhaseState& o) const {
    return phase_index == o.phase_index && phase_count == o.phase_count &&
           elapsed_s == o.elapsed_s && planned_s == o.planned_s && history == o.history;
  }
};

// Result of evaluating one step. Nothing is stored until commit().
struct PhaseProposal {
  std::string intersection_id;
  PhaseState next;
  Decision decision = Decision::Hold;
  std::optional<SignalProgramUpdate> update;  // empty for Hold
  std::string reason;
};

// Per-intersection green-time state machine. Owns every PhaseState.
class PhaseController {
public:
  // Throws ConfigError on inconsistent limits.
  explicit PhaseController(ControllerConfig cfg);

  // green_phases lists the phases subject to minGreen/maxGreen and extension;
  // empty means every phase. The intersection starts in its first green phase.
  void add_intersection(const std::string& id, int phase_count, const std::vector<int>& green_phases = {});
  bool has(const std::string& id) const { return states_.count(id) > 0; }
  bool is_green(const std::string& id, int phase_index) const;

  // The program matching the initial state, to be applied before the first step.
  SignalProgramUpdate initial_update(const std::string& id) const;

  // Throws std::out_of_range for unknown ids.
  const PhaseState& state(const std::string& id) const { return states_.at(id); }

  PhaseProposal propose(const std::string& id, double dt_s, CongestionLabel label) const;
  void commit(const PhaseProposal& p);

  std::vector<std::string> intersections() const;
  const ControllerConfig& config() const { return cfg_; }

private:
  PhaseProposal switch_(const std::string& id, PhaseState s, std::string reason) const;
  PhaseProposal extend_(const std::string& id, PhaseState s) const;
  double grant_for_(const std::string& id, int phase_index) const;

  ControllerConfig cfg_;
  std::map<std::string, PhaseState> states_;
  std::map<std::string, std::vector<bool>> green_;
};

} // namespace traffic
