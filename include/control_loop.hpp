// control_loop.hpp
#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "congestion_classifier.hpp"
#include "phase_controller.hpp"
#include "run_logger.hpp"
#include "simulation_bridge.hpp"
#include "telemetry_aggregator.hpp"
#include "topology.hpp"

namespace traffic {

enum class StopReason { EndOfSimulation, StepBudget, WallClockBudget, Cancelled };

const char* stop_reason_str(StopReason r);

struct IntersectionSnapshot {
  std::string intersection_id;
  double time_s = 0.0;
  IntersectionFeature feature;
  CongestionLabel label = CongestionLabel::Low;
  double score = 0.0;
  int phase_index = 0;
  double elapsed_s = 0.0;
  Decision decision = Decision::Hold;
};

// An update the simulator refused. The intersection kept its prior state.
struct StepFault {
  double time_s = 0.0;
  std::string intersection_id;
  ApplyResult result = ApplyResult::Ok;
};

struct RunOptions {
  std::optional<long> step_budget;
  std::optional<double> wall_clock_budget_s;
  std::function<bool()> stop_requested;  // polled after every completed step
  std::function<void(double, const std::vector<IntersectionSnapshot>&)> on_step;
};

struct RunOutcome {
  StopReason reason = StopReason::EndOfSimulation;
  long steps = 0;
  double last_time_s = 0.0;
};

// One synchronous control cycle per simulation step:
// advance -> read lanes -> aggregate -> classify -> decide -> apply -> log.
class ControlLoop {
public:
  ControlLoop(const Topology& topology, const CongestionClassifier& classifier,
              ControllerConfig controller_cfg, SimulationBridge& bridge, RunLogger& logger);

  // Runs until the simulation ends, a budget expires or a stop is requested;
  // then flushes the log and closes the bridge. ConnectionLost is rethrown
  // after the same best-effort flush and close.
  RunOutcome run(const RunOptions& opts);

  // Advances and processes a single step. false once the simulation ended.
  // The first call applies every intersection's initial program beforehand.
  bool step();

  std::vector<IntersectionSnapshot> snapshots() const;
  std::vector<StepFault> drain_faults();
  const PhaseController& controller() const { return controller_; }
  double now() const { return last_time_s_; }
  long steps_done() const { return steps_done_; }

  struct RunSummaryItem {
    std::string intersection_id;
    long steps = 0;
    double mean_queue = 0.0;
    double max_queue = 0.0;
    double mean_wait_s = 0.0;
    double high_share = 0.0;
    long switches = 0;
    long extensions = 0;
    long rejected = 0;
    double suggested_green_s = 0.0;  // static green this intersection would need
  };

  // Ranked by mean wait, worst first.
  std::vector<RunSummaryItem> summary_ranked() const;

private:
  struct Totals {
    long steps = 0;
    double queue_sum = 0.0;
    double queue_max = 0.0;
    double wait_sum = 0.0;
    long high = 0;
    long switches = 0;
    long extensions = 0;
    long rejected = 0;
  };

  void apply_initial_programs_();
  void process_(const SimulationStep& st);
  void report_lanes_(double t, const AggregateResult& agg);

  const Topology& topology_;
  const CongestionClassifier& classifier_;
  TelemetryAggregator aggregator_;
  PhaseController controller_;
  SimulationBridge& bridge_;
  RunLogger& logger_;

  std::vector<std::string> lanes_;
  double last_time_s_ = 0.0;
  long steps_done_ = 0;
  bool started_ = false;
  std::map<std::string, IntersectionSnapshot> last_snapshot_;
  std::map<std::string, Totals> totals_;
  std::vector<StepFault> pending_faults_;
  std::set<std::string> reported_lanes_;
};

// Writes <output_dir>/run_summary.csv. Returns false (after a warning) on failure.
bool write_run_summary(const std::string& output_dir, const std::vector<ControlLoop::RunSummaryItem>& items);

struct RunMetadata {
  std::string run_id;      // start time as YYYYmmdd_HHMMSS
  std::string started_at;  // local time, ISO 8601
  std::string config_file;
  std::string output_dir;
  std::string simulator;
  size_t intersections = 0;
  long steps = 0;
  double last_time_s = 0.0;
  std::string stop_reason;
  size_t rows_logged = 0;
};

// Stamps run_id and started_at from the given wall-clock time.
void stamp_run_start(RunMetadata& meta, std::chrono::system_clock::time_point started);

// Writes <output_dir>/run_meta.csv as key,value rows. Returns false (after a warning) on failure.
bool write_run_metadata(const std::string& output_dir, const RunMetadata& meta);

} // namespace traffic
