// traffic_agent_cli.cpp
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "control_loop.hpp"
#include "errors.hpp"
#include "scenario_bridge.hpp"
#include "topology.hpp"
#include "traci_bridge.hpp"

using namespace traffic;

namespace {

volatile std::sig_atomic_t g_stop = 0;

void on_signal(int) { g_stop = 1; }

void usage() {
  std::cerr << "Usage: traffic_agent_cli run --config <file> [--steps N] [--progress-every SECONDS]\n";
}

void print_table(double t, const std::vector<IntersectionSnapshot>& snaps) {
  std::cout << "\n[t=" << std::fixed << std::setprecision(1) << t << "s] Intersection states\n";
  std::cout << std::left
            << std::setw(14) << "intersection"
            << std::setw(8)  << "label"
            << std::setw(8)  << "score"
            << std::setw(8)  << "queue"
            << std::setw(10) << "wait(s)"
            << std::setw(8)  << "occ"
            << std::setw(7)  << "phase"
            << std::setw(10) << "green(s)"
            << "decision\n";
  std::cout << std::string(82, '-') << "\n";

  auto ordered = snaps;
  std::sort(ordered.begin(), ordered.end(),
            [](const auto& a, const auto& b) { return a.intersection_id < b.intersection_id; });

  for (const auto& s : ordered) {
    std::cout << std::left
              << std::setw(14) << s.intersection_id
              << std::setw(8)  << label_str(s.label)
              << std::setw(8)  << std::fixed << std::setprecision(3) << s.score
              << std::setw(8)  << std::fixed << std::setprecision(0) << s.feature.queue_length
              << std::setw(10) << std::fixed << std::setprecision(1) << s.feature.mean_wait_s
              << std::setw(8)  << std::fixed << std::setprecision(2) << s.feature.occupancy
              << std::setw(7)  << s.phase_index
              << std::setw(10) << std::fixed << std::setprecision(1) << s.elapsed_s
              << decision_str(s.decision) << "\n";
  }
}

void print_summary(const std::vector<ControlLoop::RunSummaryItem>& items) {
  std::cout << "\n=== End-of-run summary (rank by mean wait) ===\n";
  for (const auto& s : items) {
    std::cout << "  " << s.intersection_id << std::fixed << std::setprecision(2)
              << " mean_wait=" << s.mean_wait_s
              << " mean_queue=" << s.mean_queue
              << " high=" << std::setprecision(1) << s.high_share * 100.0 << "%"
              << " switches=" << s.switches
              << " extensions=" << s.extensions
              << " rejected=" << s.rejected
              << " suggested_green=" << std::setprecision(0) << s.suggested_green_s << "s\n";
  }
}

std::unique_ptr<SimulationBridge> make_bridge(const Topology& topo, const SimulationConfig& sim) {
  if (sim.kind == SimulatorKind::Traci) {
    std::cout << "Connecting to TraCI at " << sim.traci.host << ":" << sim.traci.port << "\n";
    return std::make_unique<TraciBridge>(topo, sim.traci);
  }
  std::cout << "Scenario '" << scenario_name(sim.scenario.id) << "', " << sim.scenario.duration_s
            << "s at " << sim.scenario.step_s << "s steps\n";
  return std::make_unique<ScenarioBridge>(topo, sim.scenario);
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2 || std::string(argv[1]) != "run") {
    usage();
    return 2;
  }

  std::string config_path;
  std::optional<long> steps_arg;
  double progress_every = 0.0;
  for (int i = 2; i < argc; i++) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (a == "--steps" && i + 1 < argc) {
      char* end = nullptr;
      const long n = std::strtol(argv[++i], &end, 10);
      if (*end != '\0' || n <= 0) {
        std::cerr << "error: --steps expects a positive integer\n";
        return 2;
      }
      steps_arg = n;
    } else if (a == "--progress-every" && i + 1 < argc) {
      char* end = nullptr;
      progress_every = std::strtod(argv[++i], &end);
      if (*end != '\0' || progress_every <= 0.0) {
        std::cerr << "error: --progress-every expects a positive number of seconds\n";
        return 2;
      }
    } else {
      std::cerr << "error: unexpected argument '" << a << "'\n";
      usage();
      return 2;
    }
  }
  if (config_path.empty()) {
    usage();
    return 2;
  }

  AgentConfig cfg;
  Topology topo;
  try {
    cfg = load_config(config_path);
    topo = load_topology(cfg.topology_file);
    if (topo.empty()) throw ConfigError(cfg.topology_file + ": no intersections");
  } catch (const ConfigError& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }
  if (steps_arg) cfg.step_budget = steps_arg;

  std::optional<CongestionClassifier> classifier;
  try {
    classifier = CongestionClassifier::fit(cfg.classifier);
  } catch (const ClassifierFitFailure& e) {
    std::cerr << "error: classifier fit failed: " << e.what() << "\n";
    return 3;
  }

  RunMetadata meta;
  stamp_run_start(meta, std::chrono::system_clock::now());
  meta.config_file = config_path;
  meta.output_dir = cfg.output_dir;
  meta.simulator = cfg.simulation.kind == SimulatorKind::Traci ? "traci" : "scenario";
  meta.intersections = topo.intersections().size();

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  RunLogger logger = RunLogger::open(cfg.output_dir, cfg.logger);

  std::unique_ptr<SimulationBridge> bridge;
  try {
    bridge = make_bridge(topo, cfg.simulation);
  } catch (const ConnectionLost& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  ControlLoop loop(topo, *classifier, cfg.controller, *bridge, logger);

  RunOptions opts;
  opts.step_budget = cfg.step_budget;
  opts.wall_clock_budget_s = cfg.wall_clock_budget_s;
  opts.stop_requested = [] { return g_stop != 0; };
  double next_progress = progress_every;
  opts.on_step = [&](double t, const std::vector<IntersectionSnapshot>& snaps) {
    for (const auto& f : loop.drain_faults()) {
      std::cout << "  REJECTED [" << std::fixed << std::setprecision(1) << f.time_s << "s] "
                << f.intersection_id << " | " << apply_result_str(f.result) << "\n";
    }
    if (progress_every > 0.0 && t >= next_progress) {
      print_table(t, snaps);
      while (next_progress <= t) next_progress += progress_every;
    }
  };

  int rc = 0;
  try {
    const RunOutcome out = loop.run(opts);
    std::cout << "\nStopped after " << out.steps << " steps at t=" << std::fixed << std::setprecision(1)
              << out.last_time_s << "s: " << stop_reason_str(out.reason) << "\n";
    meta.stop_reason = stop_reason_str(out.reason);
  } catch (const ConnectionLost& e) {
    std::cerr << "error: " << e.what() << "\n";
    meta.stop_reason = "connection lost";
    rc = 1;
  }

  const auto ranked = loop.summary_ranked();
  print_summary(ranked);
  write_run_summary(cfg.output_dir, ranked);

  logger.close();
  if (logger.failed()) std::cerr << "warning: run log incomplete\n";
  else std::cout << "Run log: " << logger.rows_written() << " rows in " << cfg.output_dir << "/"
                 << RunLogger::kFileName << "\n";

  meta.steps = loop.steps_done();
  meta.last_time_s = loop.now();
  meta.rows_logged = logger.rows_written();
  write_run_metadata(cfg.output_dir, meta);
  return rc;
}
