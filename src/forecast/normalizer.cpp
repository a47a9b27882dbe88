#include "forecast/normalizer.hpp"

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "forecast/artifact.hpp"

namespace boiler_twin::forecast {
namespace {

FeatureRow read_row(const nlohmann::json& artifact, const char* key, const std::string& path) {
  const auto it = artifact.find(key);
  if (it == artifact.end() || !it->is_array() || it->size() != kFeatureCount) {
    throw std::runtime_error(std::string("normalizer artifact ") + path + ": '" + key + "' must be an array of " +
                             std::to_string(kFeatureCount) + " numbers");
  }

  FeatureRow row{};
  for (std::size_t i = 0; i < kFeatureCount; ++i) {
    if (!(*it)[i].is_number()) {
      throw std::runtime_error(std::string("normalizer artifact ") + path + ": '" + key + "' holds a non-number");
    }
    row[i] = (*it)[i].get<double>();
  }
  return row;
}

}  // namespace

AffineNormalizer::AffineNormalizer(const FeatureRow& mean, const FeatureRow& scale) : mean_(mean), scale_(scale) {
  for (std::size_t i = 0; i < kFeatureCount; ++i) {
    if (!std::isfinite(mean_[i]) || !std::isfinite(scale_[i]) || scale_[i] == 0.0) {
      throw std::invalid_argument("normalizer mean must be finite and scale finite and non-zero");
    }
  }
}

FeatureRow AffineNormalizer::transform(const FeatureRow& row) const noexcept {
  FeatureRow out{};
  for (std::size_t i = 0; i < kFeatureCount; ++i) {
    out[i] = (row[i] - mean_[i]) / scale_[i];
  }
  return out;
}

FeatureRow AffineNormalizer::inverse_transform(const FeatureRow& row) const noexcept {
  FeatureRow out{};
  for (std::size_t i = 0; i < kFeatureCount; ++i) {
    out[i] = (row[i] * scale_[i]) + mean_[i];
  }
  return out;
}

AffineNormalizer load_affine_normalizer(const std::string& path) {
  const nlohmann::json artifact = read_artifact(path);
  validate_schema(artifact, path);

  try {
    return AffineNormalizer(read_row(artifact, "mean", path), read_row(artifact, "scale", path));
  } catch (const std::invalid_argument& ex) {
    throw std::runtime_error("normalizer artifact " + path + ": " + ex.what());
  }
}

}  // namespace boiler_twin::forecast
