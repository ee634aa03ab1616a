// topology.hpp
#pragma once

#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace traffic {

struct IntersectionSpec {
  std::string id;
  int phase_count = 2;
  std::vector<std::string> incoming_lanes;
  std::vector<int> green_phases;  // empty: every phase is green
};

// Static lane -> intersection mapping. Each lane feeds exactly one intersection.
class Topology {
public:
  Topology() = default;

  // Throws ConfigError on duplicate ids, duplicate lanes, phase_count < 1 or
  // a green phase outside the program.
  void add(IntersectionSpec spec);

  const std::vector<IntersectionSpec>& intersections() const { return intersections_; }
  const IntersectionSpec* find(const std::string& id) const;
  std::optional<std::string> intersection_of(const std::string& lane) const;
  std::vector<std::string> all_lanes() const;
  bool empty() const { return intersections_.empty(); }

private:
  std::vector<IntersectionSpec> intersections_;
  std::map<std::string, size_t> by_id_;
  std::map<std::string, std::string> lane_owner_;
};

// Format, one intersection per line:
//   <intersectionId> <phaseCount> [green=<i>,<j>,...] <laneId> [<laneId> ...]
// Without green= every phase is green. '#' starts a comment.
Topology parse_topology(std::istream& in, const std::string& source_name);
Topology load_topology(const std::string& path);

} // namespace traffic
