#include <cassert>
#include <cmath>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "topology.hpp"

using namespace traffic;

static bool eq(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

static bool config_error(const std::string& text, const std::string& expect_in_message) {
  std::istringstream in(text);
  try {
    (void)parse_config(in, "agent.cfg", "");
  } catch (const ConfigError& e) {
    return std::string(e.what()).find(expect_in_message) != std::string::npos;
  }
  return false;
}

static bool topology_error(const std::string& text, const std::string& expect_in_message) {
  std::istringstream in(text);
  try {
    (void)parse_topology(in, "net.topo");
  } catch (const ConfigError& e) {
    return std::string(e.what()).find(expect_in_message) != std::string::npos;
  }
  return false;
}

int main() {
  // Topology file.
  {
    std::istringstream in(
        "# id phases lanes...\n"
        "J1 2 n_in s_in e_in w_in\n"
        "\n"
        "J2 3 a_in b_in   # trailing comment\n");
    auto topo = parse_topology(in, "net.topo");
    assert(topo.intersections().size() == 2);
    assert(topo.find("J1")->phase_count == 2);
    assert(topo.find("J2")->incoming_lanes.size() == 2);
    assert(topo.find("J3") == nullptr);
    assert(topo.intersection_of("e_in").value() == "J1");
    assert(!topo.intersection_of("zz").has_value());
    assert(topo.all_lanes().size() == 6);
    assert(topo.find("J1")->green_phases.empty());
  }

  // Green phase lists.
  {
    std::istringstream in("J3 4 green=0,2 n_in s_in\n");
    auto topo = parse_topology(in, "net.topo");
    assert((topo.find("J3")->green_phases == std::vector<int>{0, 2}));
    assert(topo.find("J3")->incoming_lanes.size() == 2);
    assert(topo.intersection_of("n_in").value() == "J3");
  }
  assert(topology_error("J3 4 green=0,4 a\n", "outside its 4 phases"));
  assert(topology_error("J3 4 green=1,1 a\n", "listed twice"));
  assert(topology_error("J3 4 green=x a\n", "invalid green phase"));

  assert(topology_error("J1 2 a b\nJ1 2 c\n", "net.topo:2"));
  assert(topology_error("J1 2 a b\nJ2 2 b\n", "already feeds"));
  assert(topology_error("J1 x a\n", "invalid phase count"));
  assert(topology_error("J1 0 a\n", "at least one phase"));
  assert(topology_error("J1 2\n", "no incoming lanes"));
  assert(topology_error("# nothing\n", "no intersections"));

  // Full config.
  {
    std::istringstream in(
        "networkTopologyFile = net.topo\n"
        "minGreen = 15\n"
        "maxGreen = 90   # seconds\n"
        "extensionIncrement = 5\n"
        "trendWindow = 4\n"
        "transitionDuration = 4\n"
        "congestionThresholds = 0.25, 0.7\n"
        "scoreWeights = 0.5,0.25,0.25\n"
        "outputDirectory = out\n"
        "stepBudget = 1000\n"
        "wallClockBudget = 30.5\n"
        "simulator = traci\n"
        "traciHost = sumo.local\n"
        "traciPort = 9999\n"
        "stepLength = 0.5\n");
    auto cfg = parse_config(in, "agent.cfg", "/etc/traffic");
    assert(cfg.topology_file == "/etc/traffic/net.topo");
    assert(cfg.output_dir == "/etc/traffic/out");
    assert(eq(cfg.controller.min_green_s, 15.0));
    assert(eq(cfg.controller.max_green_s, 90.0));
    assert(eq(cfg.controller.extension_s, 5.0));
    assert(cfg.controller.trend_window == 4);
    assert(eq(cfg.controller.transition_s, 4.0));
    assert(cfg.classifier.mode == ClassifierConfig::Mode::Thresholds);
    assert(eq(cfg.classifier.medium_threshold, 0.25));
    assert(eq(cfg.classifier.high_threshold, 0.7));
    assert(eq(cfg.classifier.score.w_queue, 0.5));
    assert(cfg.step_budget.value() == 1000);
    assert(eq(cfg.wall_clock_budget_s.value(), 30.5));
    assert(cfg.simulation.kind == SimulatorKind::Traci);
    assert(cfg.simulation.traci.host == "sumo.local");
    assert(cfg.simulation.traci.port == 9999);
    assert(eq(cfg.simulation.scenario.step_s, 0.5));
  }

  // Defaults and cluster mode.
  {
    std::istringstream in(
        "networkTopologyFile = /abs/net.topo\n"
        "clusterModelPath = history.csv\n"
        "scenario = rush\n"
        "scenarioDropEvery = 7\n"
        "scenarioDisconnectAt = 120\n");
    auto cfg = parse_config(in, "agent.cfg", "conf");
    assert(cfg.topology_file == "/abs/net.topo");
    assert(cfg.classifier.mode == ClassifierConfig::Mode::Clusters);
    assert(cfg.classifier.cluster_model_path == "conf/history.csv");
    assert(eq(cfg.controller.min_green_s, 10.0));
    assert(eq(cfg.controller.max_green_s, 60.0));
    assert(!cfg.step_budget.has_value());
    assert(cfg.simulation.kind == SimulatorKind::Scenario);
    assert(cfg.simulation.scenario.id == ScenarioId::Rush);
    assert(cfg.simulation.scenario.imp.enable_missing);
    assert(cfg.simulation.scenario.imp.drop_every_n == 7);
    assert(eq(cfg.simulation.scenario.disconnect_at_s.value(), 120.0));
    assert(eq(cfg.controller.transition_s, 3.0));
  }

  assert(config_error("minGreen = 10\n", "networkTopologyFile is required"));
  assert(config_error("networkTopologyFile = n\nbogus = 1\n", "agent.cfg:2: unknown key 'bogus'"));
  assert(config_error("networkTopologyFile = n\nminGreen = 5\nminGreen = 6\n", "duplicate key"));
  assert(config_error("networkTopologyFile = n\nminGreen = ten\n", "invalid number"));
  assert(config_error("networkTopologyFile = n\nminGreen = 30\nmaxGreen = 20\n", "maxGreen must be >= minGreen"));
  assert(config_error("networkTopologyFile = n\ncongestionThresholds = 0.5\n", "comma-separated"));
  assert(config_error("networkTopologyFile = n\ncongestionThresholds = 0.3,0.6\nclusterModelPath = h.csv\n",
                      "not both"));
  assert(config_error("networkTopologyFile = n\nsimulator = vissim\n", "simulator must be"));
  assert(config_error("networkTopologyFile = n\ntraciPort = 70000\n", "out of range"));
  assert(config_error("networkTopologyFile = n\nno equals sign\n", "expected 'key = value'"));
  assert(config_error("networkTopologyFile = n\ntransitionDuration = 0\n", "transitionDuration must be positive"));
  assert(config_error("networkTopologyFile = n\nscenarioDisconnectAt = -1\n", "must be positive"));

  // Missing files.
  {
    bool threw = false;
    try {
      (void)load_config("no/such/agent.cfg");
    } catch (const ConfigError&) {
      threw = true;
    }
    assert(threw);

    threw = false;
    try {
      (void)load_topology("no/such/net.topo");
    } catch (const ConfigError&) {
      threw = true;
    }
    assert(threw);
  }

  std::cout << "test_config_topology OK\n";
  return 0;
}
