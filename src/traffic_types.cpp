// traffic_types.cpp
#include "traffic_types.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace traffic {

static double non_negative(double x) {
  if (!std::isfinite(x) || x < 0.0) return 0.0;
  return x;
}

IntersectionFeature IntersectionFeature::make(std::string id, double queue_length,
                                              double mean_wait_s, double occupancy,
                                              int vehicle_count) {
  IntersectionFeature f;
  f.intersection_id = std::move(id);
  f.queue_length = non_negative(queue_length);
  f.mean_wait_s = non_negative(mean_wait_s);
  f.occupancy = std::min(1.0, non_negative(occupancy));
  f.vehicle_count = std::max(0, vehicle_count);
  return f;
}

const char* label_str(CongestionLabel l) {
  switch (l) {
    case CongestionLabel::Low:    return "low";
    case CongestionLabel::Medium: return "medium";
    case CongestionLabel::High:   return "high";
  }
  return "unknown";
}

const char* decision_str(Decision d) {
  switch (d) {
    case Decision::Hold:     return "hold";
    case Decision::Extend:   return "extend";
    case Decision::Switch:   return "switch";
    case Decision::Rejected: return "rejected";
  }
  return "unknown";
}

} // namespace traffic
