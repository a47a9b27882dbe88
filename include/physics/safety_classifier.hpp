#pragma once

#include <string>
#include <vector>

#include "model/boiler_state.hpp"

namespace boiler_twin::physics {

struct SafetyLimits {
  double critical_pressure{20.0};
  double min_water_level{10.0};
  double max_water_level{90.0};
  double warning_water_level{20.0};
  double warning_pressure{18.0};
};

struct Classification {
  model::boiler_status status{model::boiler_status::NORMAL};
  std::vector<std::string> alarms{};
};

// First match wins: critical pressure, low level, high level, warning, normal.
Classification classify(double water_level, double pressure, const SafetyLimits& limits);

}  // namespace boiler_twin::physics
