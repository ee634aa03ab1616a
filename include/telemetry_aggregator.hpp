// telemetry_aggregator.hpp
#pragma once

#include <map>
#include <string>
#include <vector>

#include "topology.hpp"
#include "traffic_types.hpp"

namespace traffic {

struct AggregateResult {
  std::vector<IntersectionFeature> features;  // topology order
  std::vector<std::string> missing_lanes;     // in topology, no sample this step
  std::vector<std::string> unmapped_lanes;    // sampled, not in topology
};

// Stateless: the same samples and topology always give the same result.
class TelemetryAggregator {
public:
  explicit TelemetryAggregator(const Topology& topology) : topology_(topology) {}

  AggregateResult aggregate(const std::map<std::string, LaneSample>& samples) const;

  IntersectionFeature aggregate_one(const IntersectionSpec& spec,
                                    const std::map<std::string, LaneSample>& samples,
                                    std::vector<std::string>* missing) const;

private:
  const Topology& topology_;
};

} // namespace traffic
