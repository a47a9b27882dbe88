#include "physics/safety_classifier.hpp"

#include <cstdio>

namespace boiler_twin::physics {
namespace {

std::string format_alarm(const char* format, const double value) {
  char buffer[96];
  std::snprintf(buffer, sizeof(buffer), format, value);
  return std::string(buffer);
}

}  // namespace

Classification classify(const double water_level, const double pressure, const SafetyLimits& limits) {
  Classification result{};

  if (pressure > limits.critical_pressure) {
    result.status = model::boiler_status::CRITICAL_PRESSURE;
    result.alarms.push_back(format_alarm("CRITICAL: Pressure %.1f MPa exceeds safe limit", pressure));
    return result;
  }

  if (water_level < limits.min_water_level) {
    result.status = model::boiler_status::LOW_LEVEL_TRIP;
    result.alarms.push_back(format_alarm("TRIP: Drum level %.1f%% - boiler shutdown", water_level));
    return result;
  }

  if (water_level > limits.max_water_level) {
    result.status = model::boiler_status::HIGH_LEVEL_TRIP;
    result.alarms.push_back(format_alarm("TRIP: Drum level %.1f%% - carryover risk", water_level));
    return result;
  }

  const bool low_level = water_level < limits.warning_water_level;
  const bool high_pressure = pressure > limits.warning_pressure;
  if (low_level || high_pressure) {
    result.status = model::boiler_status::WARNING;
    if (low_level) {
      result.alarms.push_back(format_alarm("WARNING: Low drum level %.1f%%", water_level));
    }
    if (high_pressure) {
      result.alarms.push_back(format_alarm("WARNING: High pressure %.1f MPa", pressure));
    }
    return result;
  }

  result.status = model::boiler_status::NORMAL;
  return result;
}

}  // namespace boiler_twin::physics
