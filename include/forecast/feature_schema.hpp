#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace boiler_twin::forecast {

// Version 1 of the predictor's input contract. Artifacts declare the version
// and feature names they were fitted on and are rejected at load time when
// they disagree with this table.
inline constexpr std::uint32_t kSchemaVersion = 1;
inline constexpr std::size_t kFeatureCount = 4;
inline constexpr std::size_t kControlCount = 3;
inline constexpr std::size_t kTargetIndex = 3;
inline constexpr std::array<const char*, kFeatureCount> kFeatureNames = {"valve", "pressure", "flow", "temperature"};

inline constexpr std::size_t kDefaultWindowLength = 60;
inline constexpr std::size_t kDefaultHorizon = 30;

using FeatureRow = std::array<double, kFeatureCount>;
using ControlVector = std::array<double, kControlCount>;

inline FeatureRow make_row(const ControlVector& controls, const double target) noexcept {
  return FeatureRow{controls[0], controls[1], controls[2], target};
}

}  // namespace boiler_twin::forecast
