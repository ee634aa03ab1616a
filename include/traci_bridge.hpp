// traci_bridge.hpp
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "simulation_bridge.hpp"
#include "topology.hpp"

namespace traffic {

struct TraciConfig {
  std::string host = "localhost";
  int port = 8813;
  int connect_retries = 10;   // startup only
  double step_slack_s = 1.0;  // simulator holds a phase this much past the grant
};

// Bridge to a running SUMO instance over libtraci. The topology is the
// bridge's knowledge of each signal program (ids and phase counts).
// A lost or failed connection throws ConnectionLost.
class TraciBridge : public SimulationBridge {
public:
  TraciBridge(const Topology& topology, TraciConfig cfg);
  ~TraciBridge() override;

  TraciBridge(const TraciBridge&) = delete;
  TraciBridge& operator=(const TraciBridge&) = delete;

  std::optional<SimulationStep> advance() override;
  std::map<std::string, LaneSample> read_lane_state(const std::vector<std::string>& lane_ids) override;
  ApplyResult apply_program(const SignalProgramUpdate& update) override;
  void close() override;

private:
  void ensure_open_() const;
  ConnectionLost lost_(const std::string& what);

  const Topology& topology_;
  TraciConfig cfg_;
  bool open_ = false;
  std::map<std::string, int> last_phase_;
};

} // namespace traffic
