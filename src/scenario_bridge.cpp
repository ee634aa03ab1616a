// scenario_bridge.cpp
#include "scenario_bridge.hpp"

#include <algorithm>
#include <cmath>

#include "errors.hpp"

namespace traffic {

namespace {
constexpr double kSaturationFlow = 0.5;   // veh/s leaving a green lane
constexpr double kStartupLoss = 4.0;      // s of queue still standing after green starts
constexpr double kApproachTime = 10.0;    // s a vehicle spends approaching the stop line
constexpr double kFreeSpeed = 13.89;      // m/s
constexpr double kVehicleSpace = 7.5;     // m per vehicle incl. gap
constexpr double kLaneLength = 150.0;     // m
} // namespace

const char* scenario_name(ScenarioId id) {
  switch (id) {
    case ScenarioId::Idle:   return "idle";
    case ScenarioId::Steady: return "steady";
    case ScenarioId::Rush:   return "rush";
    case ScenarioId::Waves:  return "waves";
  }
  return "?";
}

std::optional<ScenarioId> parse_scenario(const std::string& s) {
  if (s == "idle") return ScenarioId::Idle;
  if (s == "steady") return ScenarioId::Steady;
  if (s == "rush") return ScenarioId::Rush;
  if (s == "waves") return ScenarioId::Waves;
  return std::nullopt;
}

ScenarioBridge::ScenarioBridge(const Topology& topology, ScenarioConfig cfg)
  : cfg_(std::move(cfg)) {
  if (!(cfg_.step_s > 0.0)) cfg_.step_s = 1.0;
  for (const auto& spec : topology.intersections()) {
    SignalState sig;
    auto ov = cfg_.phase_count_override.find(spec.id);
    sig.phase_count = std::max(1, ov != cfg_.phase_count_override.end() ? ov->second : spec.phase_count);
    signals_[spec.id] = sig;

    std::vector<int> greens = spec.green_phases;
    if (greens.empty()) {
      for (int p = 0; p < sig.phase_count; ++p) greens.push_back(p);
    }
    for (size_t i = 0; i < spec.incoming_lanes.size(); ++i) {
      LaneState l;
      l.intersection = spec.id;
      l.group = greens[i % greens.size()];
      lanes_[spec.incoming_lanes[i]] = l;
    }
  }
}

void ScenarioBridge::ensure_open_() const {
  if (closed_) throw ConnectionLost("scenario link already closed");
}

double ScenarioBridge::arrival_rate(int group, double t) const {
  switch (cfg_.id) {
    case ScenarioId::Idle:
      return 0.0;
    case ScenarioId::Steady:
      return 0.12;
    case ScenarioId::Rush:
      return group == 0 ? 0.4 : 0.08;
    case ScenarioId::Waves: {
      const double in_period = std::fmod(t, 90.0);
      return in_period < 20.0 ? 0.45 : 0.05;
    }
  }
  return 0.0;
}

int ScenarioBridge::current_phase(const std::string& intersection) const {
  auto it = signals_.find(intersection);
  return it == signals_.end() ? -1 : it->second.phase;
}

bool ScenarioBridge::green_(const LaneState& l) const {
  return signals_.at(l.intersection).phase == l.group;
}

std::optional<SimulationStep> ScenarioBridge::advance() {
  ensure_open_();
  const double next = static_cast<double>(step_no_ + 1) * cfg_.step_s;
  if (next > cfg_.duration_s + 1e-9) return std::nullopt;
  if (cfg_.disconnect_at_s && next >= *cfg_.disconnect_at_s) {
    closed_ = true;
    throw ConnectionLost("scenario link dropped at t=" + std::to_string(next));
  }

  const double dt = cfg_.step_s;
  for (auto& [id, l] : lanes_) {
    const double arrivals = arrival_rate(l.group, t_) * dt;
    const double standing = l.queue;
    l.wait_sum += standing * dt;

    double served = 0.0;
    if (green_(l)) served = std::min(standing + arrivals, kSaturationFlow * dt);
    if (standing > 0.0) {
      // Departing vehicles take their share of the accumulated wait with them.
      const double leaving = std::min(served, standing);
      l.wait_sum *= (1.0 - leaving / standing);
    }
    l.queue = std::max(0.0, standing + arrivals - served);
    if (l.queue < 1e-9) {
      l.queue = 0.0;
      l.wait_sum = 0.0;
    }
  }

  t_ = next;
  ++step_no_;
  return SimulationStep{t_};
}

LaneSample ScenarioBridge::sample_(const LaneState& l) const {
  const double approaching = arrival_rate(l.group, t_) * kApproachTime;
  const double standing = green_(l) ? std::max(0.0, l.queue - kSaturationFlow * kStartupLoss) : l.queue;

  LaneSample s;
  s.vehicle_count = static_cast<int>(std::lround(l.queue + approaching));
  s.halting_count = std::min(s.vehicle_count, static_cast<int>(std::lround(standing)));
  if (s.vehicle_count > 0) {
    s.mean_wait_s = l.wait_sum / s.vehicle_count;
    s.mean_speed_mps = kFreeSpeed * (s.vehicle_count - s.halting_count) / s.vehicle_count;
  } else {
    s.mean_speed_mps = kFreeSpeed;
  }
  s.occupancy = std::min(1.0, s.vehicle_count * kVehicleSpace / kLaneLength);
  return s;
}

std::map<std::string, LaneSample> ScenarioBridge::read_lane_state(const std::vector<std::string>& lane_ids) {
  ensure_open_();
  std::map<std::string, LaneSample> out;
  for (const auto& id : lane_ids) {
    auto it = lanes_.find(id);
    if (it == lanes_.end()) continue;
    if (cfg_.imp.enable_missing && cfg_.imp.drop_every_n > 0) {
      const long salt = static_cast<long>(id.size());
      if (((step_no_ + salt) % cfg_.imp.drop_every_n) == 0) continue;
    }
    out[id] = sample_(it->second);
  }
  return out;
}

ApplyResult ScenarioBridge::apply_program(const SignalProgramUpdate& update) {
  ensure_open_();
  auto it = signals_.find(update.intersection_id);
  if (it == signals_.end()) return ApplyResult::IntersectionNotFound;
  if (update.phase_index < 0 || update.phase_index >= it->second.phase_count) return ApplyResult::InvalidPhase;

  it->second.phase = update.phase_index;
  if (cfg_.record_applied) applied_.push_back(update);
  return ApplyResult::Ok;
}

} // namespace traffic
