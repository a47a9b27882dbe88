#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <vector>

#include "forecast/feature_schema.hpp"
#include "forecast/feature_window.hpp"
#include "forecast/normalizer.hpp"
#include "forecast/predictor.hpp"

namespace boiler_twin::forecast {

// Denormalized predictions in step-ahead order: index 0 is one step ahead.
class ForecastResult {
 public:
  ForecastResult() = default;
  explicit ForecastResult(std::vector<double> values);

  [[nodiscard]] const std::vector<double>& values() const noexcept { return values_; }
  [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
  [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

  // All three throw std::out_of_range on an empty result.
  [[nodiscard]] double final_value() const;
  [[nodiscard]] double average() const;
  [[nodiscard]] double peak() const;

 private:
  std::vector<double> values_{};
};

struct ForecastEngineOptions {
  std::size_t window_length{kDefaultWindowLength};
  // Zero disables the per-call deadline.
  std::chrono::milliseconds predict_timeout{0};
};

// Autoregressive driver around the predictor. Holds no state between calls.
class ForecastEngine {
 public:
  ForecastEngine(std::shared_ptr<const AffineNormalizer> normalizer, std::shared_ptr<const Predictor> predictor,
                 ForecastEngineOptions options = {});

  // Seeds the window as if the plant had sat at (controls, target) for the
  // whole window, then predicts `horizon` steps with the controls held.
  // Throws core::DependencyUnavailable when the normalizer or predictor is
  // missing, too slow, or returns a non-finite value.
  [[nodiscard]] ForecastResult forecast(const ControlVector& seed_controls, double seed_target,
                                        std::size_t horizon) const;

  [[nodiscard]] bool normalizer_loaded() const noexcept;
  [[nodiscard]] bool predictor_loaded() const noexcept;
  [[nodiscard]] std::size_t window_length() const noexcept;

 private:
  [[nodiscard]] double predict_step(const FeatureWindow& window, std::size_t step) const;

  std::shared_ptr<const AffineNormalizer> normalizer_;
  std::shared_ptr<const Predictor> predictor_;
  ForecastEngineOptions options_;
};

}  // namespace boiler_twin::forecast
