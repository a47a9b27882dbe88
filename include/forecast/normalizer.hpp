#pragma once

#include <string>

#include "forecast/feature_schema.hpp"

namespace boiler_twin::forecast {

// Per-feature (value - mean) / scale. Forecast denormalization reads only the
// target column of a synthetic row, which is exact because every column is
// rescaled independently.
class AffineNormalizer {
 public:
  AffineNormalizer(const FeatureRow& mean, const FeatureRow& scale);

  [[nodiscard]] FeatureRow transform(const FeatureRow& row) const noexcept;
  [[nodiscard]] FeatureRow inverse_transform(const FeatureRow& row) const noexcept;

  [[nodiscard]] const FeatureRow& mean() const noexcept { return mean_; }
  [[nodiscard]] const FeatureRow& scale() const noexcept { return scale_; }

 private:
  FeatureRow mean_;
  FeatureRow scale_;
};

// Reads a fitted-parameter artifact; throws std::runtime_error on a schema
// mismatch or malformed file.
AffineNormalizer load_affine_normalizer(const std::string& path);

}  // namespace boiler_twin::forecast
