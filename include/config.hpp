// config.hpp
#pragma once

#include <iosfwd>
#include <optional>
#include <string>

#include "congestion_classifier.hpp"
#include "phase_controller.hpp"
#include "run_logger.hpp"
#include "scenario_bridge.hpp"
#include "traci_bridge.hpp"

namespace traffic {

enum class SimulatorKind { Scenario, Traci };

struct SimulationConfig {
  SimulatorKind kind = SimulatorKind::Scenario;
  TraciConfig traci;
  ScenarioConfig scenario;
};

struct AgentConfig {
  std::string topology_file;
  std::string output_dir = "output";
  std::optional<long> step_budget;
  std::optional<double> wall_clock_budget_s;

  ControllerConfig controller;
  ClassifierConfig classifier;
  LoggerConfig logger;
  SimulationConfig simulation;
};

// "key = value" per line, '#' comments. Relative paths are resolved against
// base_dir. Throws ConfigError naming the line on any bad or unknown key.
AgentConfig parse_config(std::istream& in, const std::string& source_name, const std::string& base_dir);
AgentConfig load_config(const std::string& path);

} // namespace traffic
