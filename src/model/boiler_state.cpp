#include "model/boiler_state.hpp"

namespace boiler_twin::model {

const char* to_string(const boiler_status status) noexcept {
  switch (status) {
    case boiler_status::NORMAL:
      return "NORMAL";
    case boiler_status::WARNING:
      return "WARNING";
    case boiler_status::LOW_LEVEL_TRIP:
      return "LOW_LEVEL_TRIP";
    case boiler_status::HIGH_LEVEL_TRIP:
      return "HIGH_LEVEL_TRIP";
    case boiler_status::CRITICAL_PRESSURE:
      return "CRITICAL_PRESSURE";
  }
  return "UNKNOWN";
}

}  // namespace boiler_twin::model
