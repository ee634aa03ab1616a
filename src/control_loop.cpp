// control_loop.cpp
#include "control_loop.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "csv.hpp"
#include "errors.hpp"

namespace traffic {

const char* stop_reason_str(StopReason r) {
  switch (r) {
    case StopReason::EndOfSimulation: return "end of simulation";
    case StopReason::StepBudget:      return "step budget exhausted";
    case StopReason::WallClockBudget: return "wall-clock budget exhausted";
    case StopReason::Cancelled:       return "stop requested";
  }
  return "unknown";
}

ControlLoop::ControlLoop(const Topology& topology, const CongestionClassifier& classifier,
                         ControllerConfig controller_cfg, SimulationBridge& bridge, RunLogger& logger)
  : topology_(topology),
    classifier_(classifier),
    aggregator_(topology),
    controller_(controller_cfg),
    bridge_(bridge),
    logger_(logger),
    lanes_(topology.all_lanes()) {
  for (const auto& spec : topology_.intersections()) {
    controller_.add_intersection(spec.id, spec.phase_count, spec.green_phases);
    totals_[spec.id] = Totals{};
  }
}

void ControlLoop::report_lanes_(double t, const AggregateResult& agg) {
  for (const auto& lane : agg.missing_lanes) {
    if (!reported_lanes_.insert(lane).second) continue;
    std::cerr << "warning: t=" << t << " lane '" << lane << "' of intersection '"
              << topology_.intersection_of(lane).value_or("?")
              << "' missing from telemetry; counted as empty (reported once)\n";
  }
  for (const auto& lane : agg.unmapped_lanes) {
    if (!reported_lanes_.insert(lane).second) continue;
    std::cerr << "warning: t=" << t << " lane '" << lane
              << "' has no topology entry; ignored (reported once)\n";
  }
}

void ControlLoop::process_(const SimulationStep& st) {
  double dt = st.time_s - last_time_s_;
  if (!(dt > 0.0)) {
    std::cerr << "warning: t=" << st.time_s << " simulation time did not advance (previous "
              << last_time_s_ << "); phases not aged this step\n";
    dt = 0.0;
  }
  last_time_s_ = st.time_s;

  const auto samples = bridge_.read_lane_state(lanes_);
  const auto agg = aggregator_.aggregate(samples);
  report_lanes_(st.time_s, agg);

  for (const auto& feature : agg.features) {
    const auto& id = feature.intersection_id;
    const CongestionLabel label = classifier_.classify(feature);
    auto proposal = controller_.propose(id, dt, label);

    Decision decision = proposal.decision;
    if (proposal.update) {
      const ApplyResult res = bridge_.apply_program(*proposal.update);
      if (res != ApplyResult::Ok) {
        std::cerr << "warning: t=" << st.time_s << " intersection '" << id << "': "
                  << apply_result_str(res) << " for phase " << proposal.update->phase_index
                  << "; update skipped, state kept\n";
        pending_faults_.push_back(StepFault{st.time_s, id, res});
        decision = Decision::Rejected;
      }
    }
    if (decision != Decision::Rejected) controller_.commit(proposal);

    const PhaseState& ps = controller_.state(id);
    logger_.append(LogRecord{st.time_s, id, feature.queue_length, feature.mean_wait_s, feature.occupancy,
                             label, ps.phase_index, decision});

    last_snapshot_[id] = IntersectionSnapshot{id, st.time_s, feature, label, classifier_.score(feature),
                                              ps.phase_index, ps.elapsed_s, decision};

    auto& tot = totals_[id];
    tot.steps++;
    tot.queue_sum += feature.queue_length;
    tot.queue_max = std::max(tot.queue_max, feature.queue_length);
    tot.wait_sum += feature.mean_wait_s;
    if (label == CongestionLabel::High) tot.high++;
    if (decision == Decision::Switch) tot.switches++;
    if (decision == Decision::Extend) tot.extensions++;
    if (decision == Decision::Rejected) tot.rejected++;
  }
}

void ControlLoop::apply_initial_programs_() {
  for (const auto& id : controller_.intersections()) {
    const auto update = controller_.initial_update(id);
    const ApplyResult res = bridge_.apply_program(update);
    if (res == ApplyResult::Ok) continue;
    std::cerr << "warning: t=" << last_time_s_ << " intersection '" << id << "': " << apply_result_str(res)
              << " for initial phase " << update.phase_index << "\n";
    pending_faults_.push_back(StepFault{last_time_s_, id, res});
  }
}

bool ControlLoop::step() {
  if (!started_) {
    started_ = true;
    apply_initial_programs_();
  }
  auto st = bridge_.advance();
  if (!st) return false;
  process_(*st);
  ++steps_done_;
  return true;
}

RunOutcome ControlLoop::run(const RunOptions& opts) {
  using clock = std::chrono::steady_clock;
  const auto started = clock::now();
  RunOutcome out;

  try {
    for (;;) {
      if (opts.step_budget && out.steps >= *opts.step_budget) {
        out.reason = StopReason::StepBudget;
        break;
      }
      if (opts.wall_clock_budget_s) {
        const std::chrono::duration<double> spent = clock::now() - started;
        if (spent.count() >= *opts.wall_clock_budget_s) {
          out.reason = StopReason::WallClockBudget;
          break;
        }
      }
      if (!step()) {
        out.reason = StopReason::EndOfSimulation;
        break;
      }
      ++out.steps;
      out.last_time_s = last_time_s_;
      if (opts.on_step) opts.on_step(last_time_s_, snapshots());
      if (opts.stop_requested && opts.stop_requested()) {
        out.reason = StopReason::Cancelled;
        break;
      }
    }
  } catch (const ConnectionLost&) {
    logger_.flush();
    bridge_.close();
    throw;
  }

  logger_.flush();
  bridge_.close();
  return out;
}

std::vector<IntersectionSnapshot> ControlLoop::snapshots() const {
  std::vector<IntersectionSnapshot> out;
  out.reserve(last_snapshot_.size());
  for (const auto& [id, s] : last_snapshot_) out.push_back(s);
  return out;
}

std::vector<StepFault> ControlLoop::drain_faults() {
  auto out = pending_faults_;
  pending_faults_.clear();
  return out;
}

std::vector<ControlLoop::RunSummaryItem> ControlLoop::summary_ranked() const {
  std::vector<RunSummaryItem> out;
  out.reserve(totals_.size());
  for (const auto& [id, t] : totals_) {
    RunSummaryItem item;
    item.intersection_id = id;
    item.steps = t.steps;
    if (t.steps > 0) {
      item.mean_queue = t.queue_sum / t.steps;
      item.mean_wait_s = t.wait_sum / t.steps;
      item.high_share = static_cast<double>(t.high) / t.steps;
    }
    item.max_queue = t.queue_max;
    item.switches = t.switches;
    item.extensions = t.extensions;
    item.rejected = t.rejected;
    item.suggested_green_s = std::min(90.0, 30.0 * (1.0 + item.mean_wait_s / 45.0));
    out.push_back(item);
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const auto& a, const auto& b) { return a.mean_wait_s > b.mean_wait_s; });
  return out;
}

bool write_run_summary(const std::string& output_dir, const std::vector<ControlLoop::RunSummaryItem>& items) {
  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  const auto path = (std::filesystem::path(output_dir) / "run_summary.csv").string();
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (ec || !out) {
    std::cerr << "warning: cannot write run summary '" << path << "'\n";
    return false;
  }

  out << "intersectionId,steps,meanQueue,maxQueue,meanWait,highShare,switches,extensions,rejected,"
         "suggestedGreen\n";
  out << std::fixed << std::setprecision(3);
  for (const auto& s : items) {
    out << csv_escape(s.intersection_id) << ',' << s.steps << ',' << s.mean_queue << ',' << s.max_queue << ','
        << s.mean_wait_s << ',' << s.high_share << ',' << s.switches << ',' << s.extensions << ','
        << s.rejected << ',' << s.suggested_green_s << '\n';
  }
  out.flush();
  if (!out) {
    std::cerr << "warning: write to run summary '" << path << "' failed\n";
    return false;
  }
  return true;
}

void stamp_run_start(RunMetadata& meta, std::chrono::system_clock::time_point started) {
  const std::time_t t = std::chrono::system_clock::to_time_t(started);
  std::tm local{};
  localtime_r(&t, &local);

  std::ostringstream id;
  id << std::put_time(&local, "%Y%m%d_%H%M%S");
  meta.run_id = id.str();

  std::ostringstream at;
  at << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
  meta.started_at = at.str();
}

bool write_run_metadata(const std::string& output_dir, const RunMetadata& meta) {
  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  const auto path = (std::filesystem::path(output_dir) / "run_meta.csv").string();
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (ec || !out) {
    std::cerr << "warning: cannot write run metadata '" << path << "'\n";
    return false;
  }

  out << "key,value\n";
  out << "runId," << csv_escape(meta.run_id) << '\n';
  out << "startedAt," << csv_escape(meta.started_at) << '\n';
  out << "configFile," << csv_escape(meta.config_file) << '\n';
  out << "outputDirectory," << csv_escape(meta.output_dir) << '\n';
  out << "simulator," << csv_escape(meta.simulator) << '\n';
  out << "intersections," << meta.intersections << '\n';
  out << "steps," << meta.steps << '\n';
  out << "lastStepTime," << std::fixed << std::setprecision(3) << meta.last_time_s << '\n';
  out << "stopReason," << csv_escape(meta.stop_reason) << '\n';
  out << "rowsLogged," << meta.rows_logged << '\n';
  out.flush();
  if (!out) {
    std::cerr << "warning: write to run metadata '" << path << "' failed\n";
    return false;
  }
  return true;
}

} // namespace traffic
