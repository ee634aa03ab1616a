// config.cpp
#include "config.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <vector>

#include "errors.hpp"

namespace traffic {

namespace {

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r");
  if (b == std::string::npos) return "";
  const auto e = s.find_last_not_of(" \t\r");
  return s.substr(b, e - b + 1);
}

double parse_double(const std::string& v, const std::string& where) {
  try {
    size_t used = 0;
    const double d = std::stod(v, &used);
    if (used != v.size() || !std::isfinite(d)) throw std::invalid_argument(v);
    return d;
  } catch (const std::exception&) {
    throw ConfigError(where + ": invalid number '" + v + "'");
  }
}

long parse_long(const std::string& v, const std::string& where) {
  try {
    size_t used = 0;
    const long n = std::stol(v, &used);
    if (used != v.size()) throw std::invalid_argument(v);
    return n;
  } catch (const std::exception&) {
    throw ConfigError(where + ": invalid integer '" + v + "'");
  }
}

std::vector<double> parse_list(const std::string& v, size_t expected, const std::string& where) {
  std::vector<double> out;
  std::stringstream ss(v);
  std::string item;
  while (std::getline(ss, item, ',')) out.push_back(parse_double(trim(item), where));
  if (out.size() != expected) {
    throw ConfigError(where + ": expected " + std::to_string(expected) + " comma-separated numbers");
  }
  return out;
}

std::string resolve(const std::string& path, const std::string& base_dir) {
  const std::filesystem::path p(path);
  if (p.is_absolute() || base_dir.empty()) return path;
  return (std::filesystem::path(base_dir) / p).lexically_normal().string();
}

} // namespace

AgentConfig parse_config(std::istream& in, const std::string& source_name, const std::string& base_dir) {
  AgentConfig cfg;
  std::set<std::string> seen;
  bool have_thresholds = false;
  bool have_clusters = false;

  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const auto hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);
    line = trim(line);
    if (line.empty()) continue;

    const auto where = source_name + ":" + std::to_string(line_no);
    const auto eq = line.find('=');
    if (eq == std::string::npos) throw ConfigError(where + ": expected 'key = value'");
    const std::string key = trim(line.substr(0, eq));
    const std::string value = trim(line.substr(eq + 1));
    if (key.empty() || value.empty()) throw ConfigError(where + ": expected 'key = value'");
    if (!seen.insert(key).second) throw ConfigError(where + ": duplicate key '" + key + "'");

    if (key == "networkTopologyFile") {
      cfg.topology_file = resolve(value, base_dir);
    } else if (key == "minGreen") {
      cfg.controller.min_green_s = parse_double(value, where);
    } else if (key == "maxGreen") {
      cfg.controller.max_green_s = parse_double(value, where);
    } else if (key == "extensionIncrement") {
      cfg.controller.extension_s = parse_double(value, where);
    } else if (key == "transitionDuration") {
      cfg.controller.transition_s = parse_double(value, where);
    } else if (key == "trendWindow") {
      cfg.controller.trend_window = static_cast<int>(parse_long(value, where));
    } else if (key == "congestionThresholds") {
      const auto t = parse_list(value, 2, where);
      cfg.classifier.medium_threshold = t[0];
      cfg.classifier.high_threshold = t[1];
      have_thresholds = true;
    } else if (key == "clusterModelPath") {
      cfg.classifier.cluster_model_path = resolve(value, base_dir);
      have_clusters = true;
    } else if (key == "queueScale") {
      cfg.classifier.score.queue_scale = parse_double(value, where);
    } else if (key == "waitScale") {
      cfg.classifier.score.wait_scale_s = parse_double(value, where);
    } else if (key == "scoreWeights") {
      const auto w = parse_list(value, 3, where);
      cfg.classifier.score.w_queue = w[0];
      cfg.classifier.score.w_wait = w[1];
      cfg.classifier.score.w_occupancy = w[2];
    } else if (key == "outputDirectory") {
      cfg.output_dir = resolve(value, base_dir);
    } else if (key == "stepBudget") {
      const long n = parse_long(value, where);
      if (n <= 0) throw ConfigError(where + ": stepBudget must be positive");
      cfg.step_budget = n;
    } else if (key == "wallClockBudget") {
      const double s = parse_double(value, where);
      if (s <= 0.0) throw ConfigError(where + ": wallClockBudget must be positive");
      cfg.wall_clock_budget_s = s;
    } else if (key == "logFlushEvery") {
      const long n = parse_long(value, where);
      if (n <= 0) throw ConfigError(where + ": logFlushEvery must be positive");
      cfg.logger.flush_every = static_cast<int>(n);
    } else if (key == "simulator") {
      if (value == "scenario") cfg.simulation.kind = SimulatorKind::Scenario;
      else if (value == "traci") cfg.simulation.kind = SimulatorKind::Traci;
      else throw ConfigError(where + ": simulator must be 'scenario' or 'traci'");
    } else if (key == "traciHost") {
      cfg.simulation.traci.host = value;
    } else if (key == "traciPort") {
      const long p = parse_long(value, where);
      if (p <= 0 || p > 65535) throw ConfigError(where + ": traciPort out of range");
      cfg.simulation.traci.port = static_cast<int>(p);
    } else if (key == "traciConnectRetries") {
      cfg.simulation.traci.connect_retries = static_cast<int>(parse_long(value, where));
    } else if (key == "scenario") {
      auto id = parse_scenario(value);
      if (!id) throw ConfigError(where + ": unknown scenario '" + value + "' (use idle|steady|rush|waves)");
      cfg.simulation.scenario.id = *id;
    } else if (key == "scenarioDuration") {
      cfg.simulation.scenario.duration_s = parse_double(value, where);
    } else if (key == "scenarioDropEvery") {
      const long n = parse_long(value, where);
      cfg.simulation.scenario.imp.enable_missing = n > 0;
      cfg.simulation.scenario.imp.drop_every_n = static_cast<int>(n);
    } else if (key == "scenarioDisconnectAt") {
      const double t = parse_double(value, where);
      if (t <= 0.0) throw ConfigError(where + ": scenarioDisconnectAt must be positive");
      cfg.simulation.scenario.disconnect_at_s = t;
    } else if (key == "stepLength") {
      const double s = parse_double(value, where);
      if (s <= 0.0) throw ConfigError(where + ": stepLength must be positive");
      cfg.simulation.scenario.step_s = s;
      cfg.simulation.traci.step_slack_s = s;
    } else {
      throw ConfigError(where + ": unknown key '" + key + "'");
    }
  }

  if (cfg.topology_file.empty()) throw ConfigError(source_name + ": networkTopologyFile is required");
  if (have_thresholds && have_clusters) {
    throw ConfigError(source_name + ": set either congestionThresholds or clusterModelPath, not both");
  }
  cfg.classifier.mode = have_clusters ? ClassifierConfig::Mode::Clusters : ClassifierConfig::Mode::Thresholds;

  const auto& c = cfg.controller;
  if (!(c.min_green_s > 0.0)) throw ConfigError(source_name + ": minGreen must be positive");
  if (c.max_green_s < c.min_green_s) throw ConfigError(source_name + ": maxGreen must be >= minGreen");
  if (!(c.extension_s > 0.0)) throw ConfigError(source_name + ": extensionIncrement must be positive");
  if (c.trend_window < 2) throw ConfigError(source_name + ": trendWindow must be at least 2");
  if (!(c.transition_s > 0.0)) throw ConfigError(source_name + ": transitionDuration must be positive");
  return cfg;
}

AgentConfig load_config(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw ConfigError("cannot open config file '" + path + "'");
  const auto base = std::filesystem::path(path).parent_path().string();
  return parse_config(in, path, base);
}

} // namespace traffic
