#include "core/bootstrap.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <utility>

namespace boiler_twin::core {

std::shared_ptr<const forecast::ForecastEngine> load_forecast_engine(const ForecastConfig& config) {
  std::shared_ptr<const forecast::AffineNormalizer> normalizer{};
  try {
    normalizer = std::make_shared<const forecast::AffineNormalizer>(
        forecast::load_affine_normalizer(config.normalizer_path));
    std::cerr << "[forecast] normalizer loaded from " << config.normalizer_path << '\n';
  } catch (const std::exception& ex) {
    std::cerr << "[forecast] normalizer unavailable: " << ex.what() << '\n';
  }

  std::shared_ptr<const forecast::Predictor> predictor{};
  try {
    predictor = forecast::make_linear_predictor(config.predictor_path, config.window_length);
    std::cerr << "[forecast] predictor loaded from " << config.predictor_path << '\n';
  } catch (const std::exception& ex) {
    std::cerr << "[forecast] predictor unavailable: " << ex.what() << '\n';
    predictor = forecast::make_unavailable_predictor();
  }

  forecast::ForecastEngineOptions options{};
  options.window_length = config.window_length;
  options.predict_timeout = config.predict_timeout;
  return std::make_shared<const forecast::ForecastEngine>(std::move(normalizer), std::move(predictor), options);
}

SessionOptions make_session_options(const SimulatorConfig& config) {
  SessionOptions options{};
  options.physics = config.physics;
  options.initial = config.initial;
  options.time_step_s = config.time_step_s;
  options.horizon = config.forecast.horizon;
  options.policy = config.supervisor;
  return options;
}

}  // namespace boiler_twin::core
