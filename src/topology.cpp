// topology.cpp
#include "topology.hpp"

#include <fstream>
#include <set>
#include <sstream>

#include "errors.hpp"

namespace traffic {

void Topology::add(IntersectionSpec spec) {
  if (spec.id.empty()) throw ConfigError("intersection id must not be empty");
  if (by_id_.count(spec.id)) throw ConfigError("duplicate intersection '" + spec.id + "'");
  if (spec.phase_count < 1) {
    throw ConfigError("intersection '" + spec.id + "' needs at least one phase");
  }
  std::set<int> greens;
  for (int p : spec.green_phases) {
    if (p < 0 || p >= spec.phase_count) {
      throw ConfigError("intersection '" + spec.id + "': green phase " + std::to_string(p) +
                        " outside its " + std::to_string(spec.phase_count) + " phases");
    }
    if (!greens.insert(p).second) {
      throw ConfigError("intersection '" + spec.id + "': green phase " + std::to_string(p) + " listed twice");
    }
  }
  for (const auto& lane : spec.incoming_lanes) {
    auto it = lane_owner_.find(lane);
    if (it != lane_owner_.end()) {
      throw ConfigError("lane '" + lane + "' already feeds intersection '" + it->second + "'");
    }
    lane_owner_[lane] = spec.id;
  }
  by_id_[spec.id] = intersections_.size();
  intersections_.push_back(std::move(spec));
}

const IntersectionSpec* Topology::find(const std::string& id) const {
  auto it = by_id_.find(id);
  if (it == by_id_.end()) return nullptr;
  return &intersections_[it->second];
}

std::optional<std::string> Topology::intersection_of(const std::string& lane) const {
  auto it = lane_owner_.find(lane);
  if (it == lane_owner_.end()) return std::nullopt;
  return it->second;
}

std::vector<std::string> Topology::all_lanes() const {
  std::vector<std::string> out;
  for (const auto& spec : intersections_) {
    out.insert(out.end(), spec.incoming_lanes.begin(), spec.incoming_lanes.end());
  }
  return out;
}

Topology parse_topology(std::istream& in, const std::string& source_name) {
  Topology topo;
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const auto hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);

    std::istringstream fields(line);
    IntersectionSpec spec;
    if (!(fields >> spec.id)) continue;  // blank line

    const auto where = source_name + ":" + std::to_string(line_no);
    std::string phases;
    if (!(fields >> phases)) throw ConfigError(where + ": missing phase count for '" + spec.id + "'");
    try {
      size_t used = 0;
      spec.phase_count = std::stoi(phases, &used);
      if (used != phases.size()) throw std::invalid_argument(phases);
    } catch (const std::exception&) {
      throw ConfigError(where + ": invalid phase count '" + phases + "'");
    }

    std::string lane;
    while (fields >> lane) {
      if (lane.rfind("green=", 0) == 0 && spec.incoming_lanes.empty() && spec.green_phases.empty()) {
        std::stringstream list(lane.substr(6));
        std::string item;
        while (std::getline(list, item, ',')) {
          try {
            size_t used = 0;
            spec.green_phases.push_back(std::stoi(item, &used));
            if (used != item.size()) throw std::invalid_argument(item);
          } catch (const std::exception&) {
            throw ConfigError(where + ": invalid green phase '" + item + "'");
          }
        }
        if (spec.green_phases.empty()) throw ConfigError(where + ": empty green phase list");
        continue;
      }
      spec.incoming_lanes.push_back(lane);
    }
    if (spec.incoming_lanes.empty()) {
      throw ConfigError(where + ": intersection '" + spec.id + "' has no incoming lanes");
    }

    try {
      topo.add(std::move(spec));
    } catch (const ConfigError& e) {
      throw ConfigError(where + ": " + e.what());
    }
  }
  if (topo.empty()) throw ConfigError(source_name + ": no intersections defined");
  return topo;
}

Topology load_topology(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw ConfigError("cannot open topology file '" + path + "'");
  return parse_topology(in, path);
}

} // namespace traffic
