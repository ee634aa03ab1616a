// simulation_bridge.cpp
#include "simulation_bridge.hpp"

namespace traffic {

const char* apply_result_str(ApplyResult r) {
  switch (r) {
    case ApplyResult::Ok:                   return "ok";
    case ApplyResult::IntersectionNotFound: return "intersection not found";
    case ApplyResult::InvalidPhase:         return "invalid phase";
  }
  return "?";
}

} // namespace traffic
