// telemetry_aggregator.cpp
#include "telemetry_aggregator.hpp"

#include <algorithm>
#include <cmath>

namespace traffic {

static double clamp01(double x) {
  if (!std::isfinite(x)) return 0.0;
  return std::max(0.0, std::min(1.0, x));
}

IntersectionFeature TelemetryAggregator::aggregate_one(
    const IntersectionSpec& spec, const std::map<std::string, LaneSample>& samples,
    std::vector<std::string>* missing) const {
  double queue = 0.0;
  double weighted_wait = 0.0;
  double occupancy_sum = 0.0;
  int vehicles = 0;

  for (const auto& lane : spec.incoming_lanes) {
    auto it = samples.find(lane);
    if (it == samples.end()) {
      // Counts as an empty lane: zero queue, zero weight, zero occupancy.
      if (missing) missing->push_back(lane);
      continue;
    }
    const LaneSample& s = it->second;
    const int n = std::max(0, s.vehicle_count);
    queue += std::max(0, s.halting_count);
    if (n > 0 && std::isfinite(s.mean_wait_s)) weighted_wait += s.mean_wait_s * n;
    vehicles += n;
    occupancy_sum += clamp01(s.occupancy);
  }

  const double mean_wait = (vehicles > 0) ? weighted_wait / vehicles : 0.0;
  const double occupancy =
      spec.incoming_lanes.empty() ? 0.0 : occupancy_sum / static_cast<double>(spec.incoming_lanes.size());

  return IntersectionFeature::make(spec.id, queue, mean_wait, occupancy, vehicles);
}

AggregateResult TelemetryAggregator::aggregate(const std::map<std::string, LaneSample>& samples) const {
  AggregateResult out;
  out.features.reserve(topology_.intersections().size());
  for (const auto& spec : topology_.intersections()) {
    out.features.push_back(aggregate_one(spec, samples, &out.missing_lanes));
  }
  for (const auto& [lane, sample] : samples) {
    (void)sample;
    if (!topology_.intersection_of(lane)) out.unmapped_lanes.push_back(lane);
  }
  return out;
}

} // namespace traffic
