// simulation_bridge.hpp
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "traffic_types.hpp"

namespace traffic {

enum class ApplyResult { Ok, IntersectionNotFound, InvalidPhase };

const char* apply_result_str(ApplyResult r);

// Link to the external simulator. Every call may throw ConnectionLost.
class SimulationBridge {
public:
  virtual ~SimulationBridge() = default;

  // Runs one simulation step. std::nullopt once the simulation has ended.
  virtual std::optional<SimulationStep> advance() = 0;

  // Lanes the simulator does not report are left out of the result.
  virtual std::map<std::string, LaneSample> read_lane_state(const std::vector<std::string>& lane_ids) = 0;

  // Never clamps: an out-of-range phase index is InvalidPhase.
  virtual ApplyResult apply_program(const SignalProgramUpdate& update) = 0;

  virtual void close() = 0;
};

} // namespace traffic
