#include "forecast/predictor.hpp"

#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "forecast/artifact.hpp"

namespace boiler_twin::forecast {
namespace {

double read_number(const nlohmann::json& artifact, const char* key, const std::string& path) {
  const auto it = artifact.find(key);
  if (it == artifact.end() || !it->is_number()) {
    throw std::runtime_error(std::string("predictor artifact ") + path + ": '" + key + "' must be a number");
  }
  const double value = it->get<double>();
  if (!std::isfinite(value)) {
    throw std::runtime_error(std::string("predictor artifact ") + path + ": '" + key + "' must be finite");
  }
  return value;
}

class LinearPredictor final : public Predictor {
 public:
  LinearPredictor(const FeatureRow& weights, const double bias, const double decay, const std::size_t window_length)
      : weights_(weights), bias_(bias), row_weights_(window_length, 0.0) {
    // Newest row gets weight 1, each older row `decay` times less.
    double sum = 0.0;
    double weight = 1.0;
    for (std::size_t i = window_length; i-- > 0;) {
      row_weights_[i] = weight;
      sum += weight;
      weight *= decay;
    }
    for (auto& w : row_weights_) {
      w /= sum;
    }
  }

  bool available() const override { return true; }

  double predict(const FeatureWindow& window) const override {
    if (window.length() != row_weights_.size()) {
      throw std::invalid_argument("window length " + std::to_string(window.length()) + " does not match predictor " +
                                  std::to_string(row_weights_.size()));
    }

    double out = bias_;
    for (std::size_t i = 0; i < window.length(); ++i) {
      const FeatureRow& row = window.row(i);
      double dot = 0.0;
      for (std::size_t f = 0; f < kFeatureCount; ++f) {
        dot += weights_[f] * row[f];
      }
      out += row_weights_[i] * dot;
    }
    return out;
  }

 private:
  FeatureRow weights_;
  double bias_;
  std::vector<double> row_weights_;
};

}  // namespace

std::unique_ptr<Predictor> make_linear_predictor(const std::string& path, const std::size_t window_length) {
  const nlohmann::json artifact = read_artifact(path);
  validate_schema(artifact, path);

  const auto length_it = artifact.find("window_length");
  if (length_it == artifact.end() || !length_it->is_number_unsigned() ||
      length_it->get<std::size_t>() != window_length) {
    throw std::runtime_error("predictor artifact " + path + ": window_length must be " +
                             std::to_string(window_length));
  }

  const auto weights_it = artifact.find("weights");
  if (weights_it == artifact.end() || !weights_it->is_array() || weights_it->size() != kFeatureCount) {
    throw std::runtime_error("predictor artifact " + path + ": weights must be an array of " +
                             std::to_string(kFeatureCount) + " numbers");
  }
  FeatureRow weights{};
  for (std::size_t i = 0; i < kFeatureCount; ++i) {
    if (!(*weights_it)[i].is_number()) {
      throw std::runtime_error("predictor artifact " + path + ": weights holds a non-number");
    }
    weights[i] = (*weights_it)[i].get<double>();
  }

  const double bias = read_number(artifact, "bias", path);
  const double decay = read_number(artifact, "decay", path);
  if (decay <= 0.0 || decay > 1.0) {
    throw std::runtime_error("predictor artifact " + path + ": decay must be in (0, 1]");
  }

  return std::make_unique<LinearPredictor>(weights, bias, decay, window_length);
}

}  // namespace boiler_twin::forecast
