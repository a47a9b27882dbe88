#include "forecast/predictor.hpp"

#include <memory>

#include "core/errors.hpp"

namespace boiler_twin::forecast {
namespace {

class UnavailablePredictor final : public Predictor {
 public:
  bool available() const override { return false; }

  double predict(const FeatureWindow& /*window*/) const override {
    throw core::DependencyUnavailable("predictor not loaded");
  }
};

}  // namespace

std::unique_ptr<Predictor> make_unavailable_predictor() { return std::make_unique<UnavailablePredictor>(); }

}  // namespace boiler_twin::forecast
