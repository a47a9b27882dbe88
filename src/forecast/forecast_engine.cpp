#include "forecast/forecast_engine.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/errors.hpp"

namespace boiler_twin::forecast {

ForecastResult::ForecastResult(std::vector<double> values) : values_(std::move(values)) {}

double ForecastResult::final_value() const {
  if (values_.empty()) {
    throw std::out_of_range("empty forecast");
  }
  return values_.back();
}

double ForecastResult::average() const {
  if (values_.empty()) {
    throw std::out_of_range("empty forecast");
  }
  return std::accumulate(values_.begin(), values_.end(), 0.0) / static_cast<double>(values_.size());
}

double ForecastResult::peak() const {
  if (values_.empty()) {
    throw std::out_of_range("empty forecast");
  }
  return *std::max_element(values_.begin(), values_.end());
}

ForecastEngine::ForecastEngine(std::shared_ptr<const AffineNormalizer> normalizer,
                               std::shared_ptr<const Predictor> predictor, const ForecastEngineOptions options)
    : normalizer_(std::move(normalizer)), predictor_(std::move(predictor)), options_(options) {
  if (options_.window_length == 0) {
    throw std::invalid_argument("forecast window_length must be greater than 0");
  }
}

ForecastResult ForecastEngine::forecast(const ControlVector& seed_controls, const double seed_target,
                                        const std::size_t horizon) const {
  if (horizon == 0) {
    throw std::invalid_argument("forecast horizon must be greater than 0");
  }
  if (!normalizer_loaded()) {
    throw core::DependencyUnavailable("normalizer not loaded");
  }
  if (!predictor_loaded()) {
    throw core::DependencyUnavailable("predictor not loaded");
  }

  const FeatureRow seed = normalizer_->transform(make_row(seed_controls, seed_target));
  FeatureWindow window(options_.window_length, seed);

  std::vector<double> normalized;
  normalized.reserve(horizon);
  for (std::size_t step = 0; step < horizon; ++step) {
    const double prediction = predict_step(window, step);

    FeatureRow next = seed;
    next[kTargetIndex] = prediction;
    window.slide(next);
    normalized.push_back(prediction);
  }

  // Only the target column of the synthetic rows is meaningful after the
  // inverse transform.
  std::vector<double> values;
  values.reserve(horizon);
  for (const double prediction : normalized) {
    FeatureRow synthetic{};
    synthetic[kTargetIndex] = prediction;
    const double value = normalizer_->inverse_transform(synthetic)[kTargetIndex];
    if (!std::isfinite(value)) {
      throw core::DependencyUnavailable("normalizer produced a non-finite value");
    }
    values.push_back(value);
  }

  return ForecastResult(std::move(values));
}

bool ForecastEngine::normalizer_loaded() const noexcept { return normalizer_ != nullptr; }

bool ForecastEngine::predictor_loaded() const noexcept { return predictor_ != nullptr && predictor_->available(); }

std::size_t ForecastEngine::window_length() const noexcept { return options_.window_length; }

double ForecastEngine::predict_step(const FeatureWindow& window, const std::size_t step) const {
  const auto start = std::chrono::steady_clock::now();
  const double prediction = predictor_->predict(window);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  if (options_.predict_timeout.count() > 0 && elapsed > options_.predict_timeout) {
    throw core::DependencyUnavailable("predictor exceeded " + std::to_string(options_.predict_timeout.count()) +
                                      " ms at step " + std::to_string(step + 1));
  }
  if (!std::isfinite(prediction)) {
    throw core::DependencyUnavailable("predictor returned a non-finite value at step " + std::to_string(step + 1));
  }
  return prediction;
}

}  // namespace boiler_twin::forecast
