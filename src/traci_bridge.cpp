// traci_bridge.cpp
#include "traci_bridge.hpp"

#include <libsumo/libtraci.h>

#include <algorithm>
#include <iostream>

namespace traffic {

// libtraci reports a refused command as libsumo::TraCIException and a dead
// socket or failed handshake as some other std::runtime_error.

TraciBridge::TraciBridge(const Topology& topology, TraciConfig cfg)
  : topology_(topology), cfg_(std::move(cfg)) {
  try {
    const auto version = libtraci::Simulation::init(cfg_.port, std::max(0, cfg_.connect_retries), cfg_.host);
    std::cout << "Connected to " << version.second << " (TraCI API " << version.first << ")\n";
  } catch (const std::exception& e) {
    throw ConnectionLost("cannot connect to TraCI server at " + cfg_.host + ":" + std::to_string(cfg_.port) +
                         ": " + e.what());
  }
  open_ = true;
}

TraciBridge::~TraciBridge() {
  close();
}

void TraciBridge::close() {
  if (!open_) return;
  open_ = false;
  try {
    libtraci::Simulation::close();
  } catch (const std::exception& e) {
    std::cerr << "warning: TraCI close not delivered: " << e.what() << "\n";
  }
}

void TraciBridge::ensure_open_() const {
  if (!open_) throw ConnectionLost("TraCI connection is not open");
}

ConnectionLost TraciBridge::lost_(const std::string& what) {
  close();
  return ConnectionLost("TraCI connection lost: " + what);
}

std::optional<SimulationStep> TraciBridge::advance() {
  ensure_open_();
  try {
    if (libtraci::Simulation::getMinExpectedNumber() <= 0) return std::nullopt;
    libtraci::Simulation::step();
    return SimulationStep{libtraci::Simulation::getTime()};
  } catch (const std::exception& e) {
    throw lost_(e.what());
  }
}

std::map<std::string, LaneSample> TraciBridge::read_lane_state(const std::vector<std::string>& lane_ids) {
  ensure_open_();
  std::map<std::string, LaneSample> out;
  for (const auto& lane : lane_ids) {
    try {
      LaneSample s;
      s.vehicle_count = libtraci::Lane::getLastStepVehicleNumber(lane);
      s.mean_speed_mps = libtraci::Lane::getLastStepMeanSpeed(lane);
      s.occupancy = std::clamp(libtraci::Lane::getLastStepOccupancy(lane), 0.0, 1.0);
      s.halting_count = libtraci::Lane::getLastStepHaltingNumber(lane);
      // SUMO reports the lane's summed waiting time; spread it over its vehicles.
      const double waiting_total = libtraci::Lane::getWaitingTime(lane);
      s.mean_wait_s = (s.vehicle_count > 0) ? waiting_total / s.vehicle_count : 0.0;
      out[lane] = s;
    } catch (const libsumo::TraCIException&) {
      // Unknown lane: left out, the caller reports it as missing.
      continue;
    } catch (const std::exception& e) {
      throw lost_(e.what());
    }
  }
  return out;
}

ApplyResult TraciBridge::apply_program(const SignalProgramUpdate& update) {
  ensure_open_();
  const IntersectionSpec* spec = topology_.find(update.intersection_id);
  if (spec == nullptr) return ApplyResult::IntersectionNotFound;
  if (update.phase_index < 0 || update.phase_index >= spec->phase_count) return ApplyResult::InvalidPhase;

  auto last = last_phase_.find(update.intersection_id);
  const bool phase_change = (last == last_phase_.end() || last->second != update.phase_index);
  try {
    if (phase_change) libtraci::TrafficLight::setPhase(update.intersection_id, update.phase_index);
    libtraci::TrafficLight::setPhaseDuration(update.intersection_id, update.remaining_s() + cfg_.step_slack_s);
  } catch (const libsumo::TraCIException& e) {
    const std::string why = e.what();
    std::cerr << "warning: simulator rejected program for " << update.intersection_id << ": " << why << "\n";
    if (why.find("phase") != std::string::npos) return ApplyResult::InvalidPhase;
    return ApplyResult::IntersectionNotFound;
  } catch (const std::exception& e) {
    throw lost_(e.what());
  }

  last_phase_[update.intersection_id] = update.phase_index;
  return ApplyResult::Ok;
}

} // namespace traffic
