#include <algorithm>
#include <cassert>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "control_loop.hpp"
#include "errors.hpp"
#include "scenario_bridge.hpp"

using namespace traffic;

static bool eq(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

static Topology network() {
  Topology t;
  t.add(IntersectionSpec{"J1", 2, {"j1_n", "j1_s", "j1_e", "j1_w"}});
  t.add(IntersectionSpec{"J2", 3, {"j2_a", "j2_b", "j2_c"}});
  return t;
}

static std::vector<std::string> log_lines(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) out.push_back(line);
  return out;
}

struct RunResult {
  std::string log;
  std::vector<SignalProgramUpdate> applied;
  RunOutcome outcome;
};

static RunResult run_scenario(const Topology& topo, ScenarioConfig sc, RunOptions opts = {}) {
  sc.record_applied = true;
  const auto classifier = CongestionClassifier::from_thresholds(ClassifierConfig{});
  std::ostringstream sink;
  RunLogger logger(sink, LoggerConfig{.flush_every = 16});
  ScenarioBridge bridge(topo, sc);
  ControlLoop loop(topo, classifier, ControllerConfig{}, bridge, logger);
  RunResult r;
  r.outcome = loop.run(opts);
  r.log = sink.str();
  r.applied = bridge.applied();
  return r;
}

int main() {
  const Topology topo = network();

  // Idle network: always Low, every intersection switches at each minGreen.
  {
    ScenarioConfig sc{.id = ScenarioId::Idle, .duration_s = 35.0, .step_s = 1.0};
    auto r = run_scenario(topo, sc);
    assert(r.outcome.reason == StopReason::EndOfSimulation);
    assert(r.outcome.steps == 35);

    const auto lines = log_lines(r.log);
    assert(lines.size() == 1 + 35 * 2);
    assert(lines[0] == RunLogger::kHeader);
    assert(lines[1] == "1.000,J1,0.000,0.000,0.000,low,0,hold");
    assert(lines[2] == "1.000,J2,0.000,0.000,0.000,low,0,hold");
    assert(lines[19] == "10.000,J1,0.000,0.000,0.000,low,1,switch");
    for (size_t i = 1; i < lines.size(); ++i) assert(lines[i].find(",low,") != std::string::npos);

    // Initial programs first, then one switch per intersection every 10 s.
    assert(r.applied.size() == 8);
    const std::vector<int> j1 = {0, 1, 0, 1};
    const std::vector<int> j2 = {0, 1, 2, 0};
    for (size_t k = 0; k < 4; ++k) {
      assert(r.applied[2 * k].intersection_id == "J1");
      assert(r.applied[2 * k].phase_index == j1[k]);
      assert(r.applied[2 * k + 1].intersection_id == "J2");
      assert(r.applied[2 * k + 1].phase_index == j2[k]);
      assert(eq(r.applied[2 * k].duration_s, 10.0));
      assert(eq(r.applied[2 * k].elapsed_s, 0.0));
    }
  }

  // Same idle network at 0.1 s steps: switches land on the 10 s steps, not one late.
  {
    ScenarioConfig sc{.id = ScenarioId::Idle, .duration_s = 25.0, .step_s = 0.1};
    auto r = run_scenario(topo, sc);
    assert(r.outcome.steps == 250);

    const auto lines = log_lines(r.log);
    assert(lines.size() == 1 + 250 * 2);
    assert(lines[197] == "9.900,J1,0.000,0.000,0.000,low,0,hold");
    assert(lines[199] == "10.000,J1,0.000,0.000,0.000,low,1,switch");
    assert(lines[200] == "10.000,J2,0.000,0.000,0.000,low,1,switch");
    assert(lines[399] == "20.000,J1,0.000,0.000,0.000,low,0,switch");
    assert(lines[400] == "20.000,J2,0.000,0.000,0.000,low,2,switch");

    size_t switches = 0;
    for (size_t i = 1; i < lines.size(); ++i) {
      if (lines[i].find(",switch") != std::string::npos) ++switches;
    }
    assert(switches == 4);
    assert(r.applied.size() == 2 + 4);
  }

  // The first step puts every signal in the controller's initial phase.
  {
    Topology t;
    t.add(IntersectionSpec{"J1", 2, {"j1_n", "j1_s"}});
    t.add(IntersectionSpec{"J4", 3, {"j4_a", "j4_b"}, {1, 2}});
    ScenarioConfig sc{.id = ScenarioId::Idle, .duration_s = 30.0};
    sc.record_applied = true;
    sc.phase_count_override["J1"] = 1;
    const auto classifier = CongestionClassifier::from_thresholds(ClassifierConfig{});
    RunLogger logger;
    ScenarioBridge bridge(t, sc);
    ControlLoop loop(t, classifier, ControllerConfig{}, bridge, logger);
    assert(bridge.current_phase("J4") == 0);
    assert(bridge.applied().empty());

    const bool stepped = loop.step();
    assert(stepped);
    assert(bridge.current_phase("J4") == 1);
    assert(loop.controller().state("J4").phase_index == 1);
    assert(bridge.applied().size() == 2);
    assert(bridge.applied()[0] == (SignalProgramUpdate{"J1", 0, 10.0, 0.0}));
    assert(bridge.applied()[1] == (SignalProgramUpdate{"J4", 1, 10.0, 0.0}));
    assert(loop.drain_faults().empty());

    // J4 cycles 1, 2, 0 after minGreen like any other program.
    for (int i = 0; i < 9; ++i) loop.step();
    assert(loop.controller().state("J4").phase_index == 2);
    assert(bridge.current_phase("J4") == 2);
  }

  // An initial program the simulator refuses is reported like any rejected update.
  {
    Topology t;
    t.add(IntersectionSpec{"J5", 3, {"j5_a"}, {2}});
    ScenarioConfig sc{.id = ScenarioId::Idle, .duration_s = 5.0};
    sc.phase_count_override["J5"] = 2;
    const auto classifier = CongestionClassifier::from_thresholds(ClassifierConfig{});
    RunLogger logger;
    ScenarioBridge bridge(t, sc);
    ControlLoop loop(t, classifier, ControllerConfig{}, bridge, logger);
    const bool stepped = loop.step();
    assert(stepped);
    const auto faults = loop.drain_faults();
    assert(faults.size() == 1);
    assert(faults[0].intersection_id == "J5");
    assert(faults[0].result == ApplyResult::InvalidPhase);
    assert(eq(faults[0].time_s, 0.0));
    assert(loop.controller().state("J5").phase_index == 2);
  }

  // Same inputs, same commands and the same log.
  {
    ScenarioConfig sc{.id = ScenarioId::Rush, .duration_s = 600.0};
    auto a = run_scenario(topo, sc);
    auto b = run_scenario(topo, sc);
    assert(a.applied == b.applied);
    assert(a.log == b.log);
    assert(!a.applied.empty());
    // Rush traffic builds queues that earn extensions somewhere.
    assert(a.log.find(",high,") != std::string::npos);
    assert(a.log.find(",extend") != std::string::npos);
  }

  // Green bounds hold in the applied commands under load.
  {
    ScenarioConfig sc{.id = ScenarioId::Waves, .duration_s = 900.0};
    sc.record_applied = true;
    const auto classifier = CongestionClassifier::from_thresholds(ClassifierConfig{});
    RunLogger logger;
    ScenarioBridge bridge(topo, sc);
    ControlLoop loop(topo, classifier, ControllerConfig{}, bridge, logger);
    while (loop.step()) {
      for (const auto& id : loop.controller().intersections()) {
        const auto& s = loop.controller().state(id);
        assert(s.elapsed_s < 60.0);
        assert(s.planned_s >= 10.0 && s.planned_s <= 60.0);
        assert(bridge.current_phase(id) == s.phase_index);
      }
    }
    for (const auto& u : bridge.applied()) {
      assert(u.duration_s >= 10.0 && u.duration_s <= 60.0);
      assert(u.elapsed_s <= u.duration_s);
    }
  }

  // Rejected program: prior state is kept and other intersections carry on.
  {
    ScenarioConfig sc{.id = ScenarioId::Idle, .duration_s = 25.0};
    sc.phase_count_override["J1"] = 1;
    const auto classifier = CongestionClassifier::from_thresholds(ClassifierConfig{});
    std::ostringstream sink;
    RunLogger logger(sink, LoggerConfig{});
    ScenarioBridge bridge(topo, sc);
    ControlLoop loop(topo, classifier, ControllerConfig{}, bridge, logger);

    for (int i = 0; i < 9; ++i) loop.step();
    const PhaseState before = loop.controller().state("J1");
    const bool stepped = loop.step();  // t=10: J1 tries phase 1, which the simulator does not have
    assert(stepped);
    assert(loop.controller().state("J1") == before);

    auto faults = loop.drain_faults();
    assert(faults.size() == 1);
    assert(faults[0].intersection_id == "J1");
    assert(faults[0].result == ApplyResult::InvalidPhase);
    assert(loop.drain_faults().empty());
    assert(loop.controller().state("J2").phase_index == 1);

    RunOptions opts;
    loop.run(opts);
    assert(loop.controller().state("J1").phase_index == 0);
    assert(loop.controller().state("J2").phase_index == 2);
    assert(bridge.current_phase("J1") == 0);

    logger.flush();
    const auto lines = log_lines(sink.str());
    assert(lines[19] == "10.000,J1,0.000,0.000,0.000,low,0,rejected");
    auto ranked = loop.summary_ranked();
    for (const auto& s : ranked) {
      if (s.intersection_id == "J1") assert(s.rejected == 16 && s.switches == 0);
      if (s.intersection_id == "J2") assert(s.rejected == 0 && s.switches == 2);
    }
  }

  // Step budget and stop request end the run between steps.
  {
    ScenarioConfig sc{.id = ScenarioId::Steady, .duration_s = 3600.0};
    RunOptions budget;
    budget.step_budget = 42;
    auto r = run_scenario(topo, sc, budget);
    assert(r.outcome.reason == StopReason::StepBudget);
    assert(r.outcome.steps == 42);
    assert(eq(r.outcome.last_time_s, 42.0));
    assert(log_lines(r.log).size() == 1 + 42 * 2);

    int polls = 0;
    RunOptions cancel;
    cancel.stop_requested = [&polls] { return ++polls >= 7; };
    r = run_scenario(topo, sc, cancel);
    assert(r.outcome.reason == StopReason::Cancelled);
    assert(r.outcome.steps == 7);
    assert(log_lines(r.log).size() == 1 + 7 * 2);

    RunOptions no_time;
    no_time.wall_clock_budget_s = 0.0;
    r = run_scenario(topo, sc, no_time);
    assert(r.outcome.reason == StopReason::WallClockBudget);
    assert(r.outcome.steps == 0);
    assert(log_lines(r.log).size() == 1);

    RunOptions short_time;
    short_time.wall_clock_budget_s = 0.05;
    sc.duration_s = 1e9;
    r = run_scenario(topo, sc, short_time);
    assert(r.outcome.reason == StopReason::WallClockBudget);
    assert(log_lines(r.log).size() == 1 + static_cast<size_t>(r.outcome.steps) * 2);
  }

  // Lost link: log flushed up to the last completed step, bridge closed, error propagated.
  {
    ScenarioConfig sc{.id = ScenarioId::Steady, .duration_s = 100.0};
    sc.disconnect_at_s = 20.0;
    const auto classifier = CongestionClassifier::from_thresholds(ClassifierConfig{});
    std::ostringstream sink;
    RunLogger logger(sink, LoggerConfig{.flush_every = 1000});
    ScenarioBridge bridge(topo, sc);
    ControlLoop loop(topo, classifier, ControllerConfig{}, bridge, logger);

    bool lost = false;
    try {
      loop.run(RunOptions{});
    } catch (const ConnectionLost&) {
      lost = true;
    }
    assert(lost);
    assert(log_lines(sink.str()).size() == 1 + 19 * 2);
    assert(logger.rows_pending() == 0);

    lost = false;
    try {
      (void)bridge.advance();
    } catch (const ConnectionLost&) {
      lost = true;
    }
    assert(lost);
  }

  // Summary ranks by mean wait and caps the suggested green.
  {
    ScenarioConfig sc{.id = ScenarioId::Rush, .duration_s = 300.0};
    const auto classifier = CongestionClassifier::from_thresholds(ClassifierConfig{});
    RunLogger logger;
    ScenarioBridge bridge(topo, sc);
    ControlLoop loop(topo, classifier, ControllerConfig{}, bridge, logger);
    loop.run(RunOptions{});
    auto ranked = loop.summary_ranked();
    assert(ranked.size() == 2);
    assert(ranked[0].mean_wait_s >= ranked[1].mean_wait_s);
    for (const auto& s : ranked) {
      assert(s.steps == 300);
      assert(s.suggested_green_s >= 30.0 && s.suggested_green_s <= 90.0);
      assert(eq(s.suggested_green_s, std::min(90.0, 30.0 * (1.0 + s.mean_wait_s / 45.0))));
    }
    const auto snaps = loop.snapshots();
    assert(snaps.size() == 2);
    assert(eq(snaps[0].time_s, 300.0));
  }

  // Run metadata: one key,value row per field.
  {
    RunMetadata meta;
    stamp_run_start(meta, std::chrono::system_clock::now());
    assert(meta.run_id.size() == 15 && meta.run_id[8] == '_');
    assert(meta.started_at.size() == 19 && meta.started_at[10] == 'T');
    assert(meta.run_id.substr(0, 4) == meta.started_at.substr(0, 4));

    meta.config_file = "cfg/run,1.cfg";
    meta.output_dir = "meta_out";
    meta.simulator = "scenario";
    meta.intersections = 2;
    meta.steps = 42;
    meta.last_time_s = 42.0;
    meta.stop_reason = stop_reason_str(StopReason::StepBudget);
    meta.rows_logged = 84;
    const bool written = write_run_metadata("meta_out", meta);
    assert(written);

    std::ifstream in(std::filesystem::path("meta_out") / "run_meta.csv");
    assert(in);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    assert(lines.size() == 11);
    assert(lines[0] == "key,value");
    assert(lines[1] == "runId," + meta.run_id);
    assert(lines[3] == "configFile,\"cfg/run,1.cfg\"");
    assert(lines[5] == "simulator,scenario");
    assert(lines[6] == "intersections,2");
    assert(lines[7] == "steps,42");
    assert(lines[8] == "lastStepTime,42.000");
    assert(lines[9] == "stopReason,step budget exhausted");
    assert(lines[10] == "rowsLogged,84");
  }

  std::cout << "test_control_loop OK\n";
  return 0;
}
