// Simple benchmark for ControlLoop + ScenarioBridge.
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "control_loop.hpp"
#include "scenario_bridge.hpp"

using namespace traffic;

struct Options {
  ScenarioId scenario = ScenarioId::Rush;
  int seconds = 3600;
  int runs = 5;
  int intersections = 16;
  int lanes = 4;
  bool missing = false;
  int drop_every_n = 10;
  bool log = false;
};

static int parse_int(const std::string& s, const char* name) {
  try {
    size_t used = 0;
    const int v = std::stoi(s, &used);
    if (used != s.size() || v <= 0) throw std::invalid_argument(s);
    return v;
  } catch (const std::exception&) {
    std::cerr << "Invalid positive integer for " << name << ": " << s << "\n";
    std::exit(2);
  }
}

static Options parse_args(int argc, char** argv) {
  Options opt;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--scenario" && i + 1 < argc) {
      auto sid = parse_scenario(argv[++i]);
      if (!sid) {
        std::cerr << "Unknown scenario: " << argv[i] << " (use idle|steady|rush|waves)\n";
        std::exit(2);
      }
      opt.scenario = *sid;
    } else if (a == "--seconds" && i + 1 < argc) {
      opt.seconds = parse_int(argv[++i], "--seconds");
    } else if (a == "--runs" && i + 1 < argc) {
      opt.runs = parse_int(argv[++i], "--runs");
    } else if (a == "--intersections" && i + 1 < argc) {
      opt.intersections = parse_int(argv[++i], "--intersections");
    } else if (a == "--lanes" && i + 1 < argc) {
      opt.lanes = parse_int(argv[++i], "--lanes");
    } else if (a == "--missing") {
      opt.missing = true;
    } else if (a == "--drop-every" && i + 1 < argc) {
      opt.drop_every_n = parse_int(argv[++i], "--drop-every");
    } else if (a == "--log") {
      opt.log = true;
    } else if (a == "--help" || a == "-h") {
      std::cout << "Usage: benchmark_control_loop [--scenario idle|steady|rush|waves] [--seconds N] [--runs N]\n"
                << "                              [--intersections N] [--lanes N]\n"
                << "                              [--missing] [--drop-every N] [--log]\n";
      std::exit(0);
    } else {
      std::cerr << "Unknown arg: " << a << "\n";
      std::exit(2);
    }
  }
  return opt;
}

int main(int argc, char** argv) {
  const Options opt = parse_args(argc, argv);

  Topology topo;
  for (int j = 0; j < opt.intersections; ++j) {
    IntersectionSpec spec;
    spec.id = "J" + std::to_string(j);
    spec.phase_count = 2 + j % 3;
    for (int l = 0; l < opt.lanes; ++l) spec.incoming_lanes.push_back(spec.id + "_in" + std::to_string(l));
    topo.add(std::move(spec));
  }

  const auto classifier = CongestionClassifier::from_thresholds(ClassifierConfig{});
  int64_t total_decisions = 0;
  std::chrono::duration<double> total_time{0};

  for (int run = 0; run < opt.runs; ++run) {
    ScenarioConfig sc;
    sc.id = opt.scenario;
    sc.duration_s = opt.seconds;
    sc.imp.enable_missing = opt.missing;
    sc.imp.drop_every_n = opt.drop_every_n;

    std::ostringstream sink;
    RunLogger logger = opt.log ? RunLogger(sink, LoggerConfig{}) : RunLogger();
    ScenarioBridge bridge(topo, sc);
    ControlLoop loop(topo, classifier, ControllerConfig{}, bridge, logger);

    const auto start = std::chrono::steady_clock::now();
    const RunOutcome out = loop.run(RunOptions{});
    const auto end = std::chrono::steady_clock::now();

    total_time += (end - start);
    total_decisions += out.steps * opt.intersections;
  }

  const double avg_sec = total_time.count() / std::max(1, opt.runs);
  const double decisions_per_sec = (total_time.count() > 0.0)
    ? (double)total_decisions / total_time.count()
    : 0.0;

  std::cout << "benchmark_control_loop\n";
  std::cout << "  runs=" << opt.runs
            << " seconds=" << opt.seconds
            << " scenario=" << scenario_name(opt.scenario)
            << " intersections=" << opt.intersections
            << " lanes=" << opt.lanes
            << " missing=" << (opt.missing ? "true" : "false")
            << " log=" << (opt.log ? "true" : "false")
            << "\n";
  std::cout << "  total_time_s=" << total_time.count()
            << " avg_time_s=" << avg_sec
            << " total_decisions=" << total_decisions
            << " decisions_per_s=" << decisions_per_sec
            << "\n";

  return 0;
}
