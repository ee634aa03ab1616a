// scenario_bridge.hpp
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "simulation_bridge.hpp"
#include "topology.hpp"

namespace traffic {

enum class ScenarioId { Idle, Steady, Rush, Waves };

const char* scenario_name(ScenarioId id);
std::optional<ScenarioId> parse_scenario(const std::string& s);

struct ImperfectDataConfig {
  bool enable_missing = false;
  int drop_every_n = 10;  // a lane's sample is dropped every n-th step
};

struct ScenarioConfig {
  ScenarioId id = ScenarioId::Steady;
  double duration_s = 3600.0;
  double step_s = 1.0;
  ImperfectDataConfig imp;
  std::optional<double> disconnect_at_s;            // simulated link loss
  std::map<std::string, int> phase_count_override;  // program differs from topology
  bool record_applied = false;                      // keep every accepted update for applied()
};

// Deterministic single-queue-per-lane model of the network in the topology.
// Lane i of an intersection is served while its (i mod greens)-th green phase
// is active; non-green phases serve nobody.
class ScenarioBridge : public SimulationBridge {
public:
  ScenarioBridge(const Topology& topology, ScenarioConfig cfg);

  std::optional<SimulationStep> advance() override;
  std::map<std::string, LaneSample> read_lane_state(const std::vector<std::string>& lane_ids) override;
  ApplyResult apply_program(const SignalProgramUpdate& update) override;
  void close() override { closed_ = true; }

  double arrival_rate(int group, double t) const;
  int current_phase(const std::string& intersection) const;
  // Empty unless record_applied is set.
  const std::vector<SignalProgramUpdate>& applied() const { return applied_; }
  double now() const { return t_; }

private:
  struct LaneState {
    std::string intersection;
    int group = 0;
    double queue = 0.0;     // halted or discharging vehicles
    double wait_sum = 0.0;  // accumulated waiting seconds of queued vehicles
  };

  struct SignalState {
    int phase_count = 1;
    int phase = 0;
  };

  bool green_(const LaneState& l) const;
  LaneSample sample_(const LaneState& l) const;
  void ensure_open_() const;

  ScenarioConfig cfg_;
  std::map<std::string, LaneState> lanes_;
  std::map<std::string, SignalState> signals_;
  std::vector<SignalProgramUpdate> applied_;
  double t_ = 0.0;
  long step_no_ = 0;
  bool closed_ = false;
};

} // namespace traffic
