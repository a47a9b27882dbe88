#pragma once

#include <cstddef>
#include <vector>

#include "forecast/feature_schema.hpp"

namespace boiler_twin::forecast {

// Constant-length window of normalized feature rows, oldest first.
class FeatureWindow {
 public:
  FeatureWindow(std::size_t length, const FeatureRow& fill);

  // Drops the oldest row and appends `row`; length is unchanged.
  void slide(const FeatureRow& row) noexcept;

  [[nodiscard]] std::size_t length() const noexcept;
  [[nodiscard]] const FeatureRow& row(std::size_t index) const noexcept;
  [[nodiscard]] const FeatureRow& newest() const noexcept;

 private:
  std::vector<FeatureRow> rows_;
  std::size_t head_{0};
};

}  // namespace boiler_twin::forecast
