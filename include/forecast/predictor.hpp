#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "forecast/feature_window.hpp"

namespace boiler_twin::forecast {

// Maps a window of normalized rows to the next normalized target value.
// Implementations must be pure functions of the window.
class Predictor {
 public:
  virtual bool available() const = 0;
  virtual double predict(const FeatureWindow& window) const = 0;
  virtual ~Predictor() = default;
};

// Exponentially weighted linear read-out loaded from a JSON weights artifact.
// Throws std::runtime_error when the artifact does not match the schema or
// the engine's window length.
std::unique_ptr<Predictor> make_linear_predictor(const std::string& path, std::size_t window_length);
std::unique_ptr<Predictor> make_unavailable_predictor();

}  // namespace boiler_twin::forecast
