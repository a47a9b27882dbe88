#pragma once

#include <algorithm>
#include <cmath>

namespace boiler_twin::core {

inline constexpr double kPercentMin = 0.0;
inline constexpr double kPercentMax = 100.0;

inline double clamp_percent(const double value) noexcept {
  return std::clamp(value, kPercentMin, kPercentMax);
}

inline double round2(const double value) noexcept {
  return std::round(value * 100.0) / 100.0;
}

}  // namespace boiler_twin::core
