// phase_controller.cpp
#include "phase_controller.hpp"

#include <algorithm>
#include <cmath>

#include "errors.hpp"

namespace traffic {

namespace {
// Elapsed time is a sum of step lengths; sub-second steps do not add up exactly.
constexpr double kTimeEps = 1e-6;

bool reached(double elapsed_s, double limit_s) {
  return elapsed_s + kTimeEps >= limit_s;
}
} // namespace

PhaseController::PhaseController(ControllerConfig cfg) : cfg_(cfg) {
  if (!(cfg_.min_green_s > 0.0)) throw ConfigError("minGreen must be positive");
  if (!(cfg_.max_green_s >= cfg_.min_green_s)) throw ConfigError("maxGreen must be >= minGreen");
  if (!(cfg_.extension_s > 0.0)) throw ConfigError("extensionIncrement must be positive");
  if (cfg_.trend_window < 2) throw ConfigError("trendWindow must be at least 2");
  if (!(cfg_.transition_s > 0.0)) throw ConfigError("transitionDuration must be positive");
}

void PhaseController::add_intersection(const std::string& id, int phase_count,
                                       const std::vector<int>& green_phases) {
  const int count = std::max(1, phase_count);
  std::vector<bool> green(static_cast<size_t>(count), green_phases.empty());
  for (int p : green_phases) {
    if (p < 0 || p >= count) {
      throw ConfigError("intersection '" + id + "': green phase " + std::to_string(p) + " out of range");
    }
    green[static_cast<size_t>(p)] = true;
  }
  green_[id] = green;

  PhaseState s;
  s.phase_index = static_cast<int>(std::find(green.begin(), green.end(), true) - green.begin());
  s.phase_count = count;
  s.elapsed_s = 0.0;
  s.planned_s = cfg_.min_green_s;
  s.history = LabelHistory(cfg_.trend_window);
  states_[id] = s;
}

bool PhaseController::is_green(const std::string& id, int phase_index) const {
  const auto& green = green_.at(id);
  return phase_index >= 0 && phase_index < static_cast<int>(green.size()) && green[phase_index];
}

double PhaseController::grant_for_(const std::string& id, int phase_index) const {
  return is_green(id, phase_index) ? cfg_.min_green_s : cfg_.transition_s;
}

SignalProgramUpdate PhaseController::initial_update(const std::string& id) const {
  const PhaseState& s = states_.at(id);
  return SignalProgramUpdate{id, s.phase_index, s.planned_s, 0.0};
}

std::vector<std::string> PhaseController::intersections() const {
  std::vector<std::string> out;
  out.reserve(states_.size());
  for (const auto& [id, s] : states_) out.push_back(id);
  return out;
}

PhaseProposal PhaseController::switch_(const std::string& id, PhaseState s, std::string reason) const {
  s.phase_index = (s.phase_index + 1) % s.phase_count;
  s.elapsed_s = 0.0;
  s.planned_s = grant_for_(id, s.phase_index);

  PhaseProposal p;
  p.intersection_id = id;
  p.decision = Decision::Switch;
  p.update = SignalProgramUpdate{id, s.phase_index, s.planned_s, 0.0};
  p.reason = std::move(reason);
  p.next = std::move(s);
  return p;
}

PhaseProposal PhaseController::extend_(const std::string& id, PhaseState s) const {
  s.planned_s = std::min(s.elapsed_s + cfg_.extension_s, cfg_.max_green_s);

  PhaseProposal p;
  p.intersection_id = id;
  p.decision = Decision::Extend;
  p.update = SignalProgramUpdate{id, s.phase_index, s.planned_s, s.elapsed_s};
  p.reason = "high congestion, extension granted";
  p.next = std::move(s);
  return p;
}

PhaseProposal PhaseController::propose(const std::string& id, double dt_s, CongestionLabel label) const {
  PhaseState s = states_.at(id);
  if (std::isfinite(dt_s) && dt_s > 0.0) s.elapsed_s += dt_s;

  // The trend is judged on the labels before this one.
  const bool trending_down = s.history.trending_down();
  s.history.push(label);

  if (!is_green(id, s.phase_index)) {
    if (reached(s.elapsed_s, s.planned_s)) return switch_(id, std::move(s), "transition served");
    return PhaseProposal{id, std::move(s), Decision::Hold, std::nullopt, "transition phase"};
  }

  if (!reached(s.elapsed_s, cfg_.min_green_s)) {
    return PhaseProposal{id, std::move(s), Decision::Hold, std::nullopt, "below minGreen"};
  }

  if (reached(s.elapsed_s, cfg_.max_green_s)) {
    return switch_(id, std::move(s), "maxGreen reached");
  }

  if (label != CongestionLabel::High) {
    return switch_(id, std::move(s), std::string("congestion ") + label_str(label) + ", minGreen served");
  }

  if (!trending_down) return extend_(id, std::move(s));

  // Extension refused: keep the current grant, switch once it runs out.
  if (!reached(s.elapsed_s, s.planned_s)) {
    return PhaseProposal{id, std::move(s), Decision::Hold, std::nullopt,
                         "labels trending down, extension refused"};
  }
  return switch_(id, std::move(s), "labels trending down, grant exhausted");
}

void PhaseController::commit(const PhaseProposal& p) {
  auto it = states_.find(p.intersection_id);
  if (it == states_.end()) return;
  it->second = p.next;
}

} // namespace traffic
