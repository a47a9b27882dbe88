#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "forecast/forecast_engine.hpp"
#include "model/boiler_state.hpp"
#include "supervisor/feature_map.hpp"
#include "supervisor/supervisor.hpp"

using boiler_twin::core::DependencyUnavailable;
using boiler_twin::forecast::ForecastResult;
using boiler_twin::model::boiler_snapshot;
using boiler_twin::supervisor::DecisionBasis;
using boiler_twin::supervisor::FeatureMapping;
using boiler_twin::supervisor::ForecastFn;
using boiler_twin::supervisor::ForecastSeed;
using boiler_twin::supervisor::Supervisor;
using boiler_twin::supervisor::SupervisorPolicy;

namespace {

bool almost_equal(double a, double b, double epsilon = 1e-9) {
  return std::fabs(a - b) <= epsilon;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

ForecastFn fixed_forecast(std::vector<double> values) {
  return [values](const ForecastSeed&) { return ForecastResult(values); };
}

ForecastFn flat_forecast(const double value) {
  return fixed_forecast(std::vector<double>(30, value));
}

int test_ai_off_passes_input_through() {
  const Supervisor supervisor;
  const boiler_snapshot state{};

  for (double requested = 0.0; requested <= 100.0; requested += 12.5) {
    const auto decision = supervisor.decide(requested, state, flat_forecast(700.0), false);
    if (!almost_equal(decision.effective_input, requested) || decision.intervened || decision.reason.has_value()) {
      return fail("test_ai_off_passes_input_through", "AI off must never modify the input");
    }
    if (!almost_equal(decision.forecast.final_value, 700.0) || decision.forecast.series.size() != 30) {
      return fail("test_ai_off_passes_input_through", "forecast telemetry should still be reported");
    }
  }

  return 0;
}

int test_threshold_is_strict() {
  const Supervisor supervisor;
  const boiler_snapshot state{};

  const auto at_limit = supervisor.decide(80.0, state, flat_forecast(560.0), true);
  if (at_limit.intervened || !almost_equal(at_limit.effective_input, 80.0)) {
    return fail("test_threshold_is_strict", "exactly DANGER_TEMP must not intervene");
  }

  const auto above = supervisor.decide(80.0, state, flat_forecast(560.1), true);
  if (!above.intervened || !almost_equal(above.effective_input, 60.0)) {
    return fail("test_threshold_is_strict", "above DANGER_TEMP should cap at SAFE_FIRE_LIMIT");
  }
  if (!above.reason || above.reason->find("560.1") == std::string::npos ||
      above.reason->find("exceeds safe limit") == std::string::npos) {
    return fail("test_threshold_is_strict", "reason should name the predicted temperature");
  }
  if (!almost_equal(above.requested_input, 80.0)) {
    return fail("test_threshold_is_strict", "requested input must be reported unchanged");
  }

  return 0;
}

int test_override_never_raises_input() {
  const Supervisor supervisor;
  const auto decision = supervisor.decide(40.0, boiler_snapshot{}, flat_forecast(600.0), true);

  if (!almost_equal(decision.effective_input, 40.0)) {
    return fail("test_override_never_raises_input", "min(requested, limit) must keep a lower request");
  }
  if (!decision.intervened) {
    return fail("test_override_never_raises_input", "the override rule still fired");
  }

  return 0;
}

int test_request_is_clamped_before_deciding() {
  const Supervisor supervisor;

  const auto high = supervisor.decide(150.0, boiler_snapshot{}, flat_forecast(500.0), false);
  if (!almost_equal(high.requested_input, 100.0) || !almost_equal(high.effective_input, 100.0)) {
    return fail("test_request_is_clamped_before_deciding", "request above 100 should be reported as 100");
  }

  const auto low = supervisor.decide(-20.0, boiler_snapshot{}, flat_forecast(600.0), true);
  if (!almost_equal(low.requested_input, 0.0) || !almost_equal(low.effective_input, 0.0)) {
    return fail("test_request_is_clamped_before_deciding", "negative request should be reported as 0");
  }

  const auto capped = supervisor.decide(150.0, boiler_snapshot{}, flat_forecast(600.0), true);
  if (!almost_equal(capped.requested_input, 100.0) || !almost_equal(capped.effective_input, 60.0)) {
    return fail("test_request_is_clamped_before_deciding", "override should apply to the clamped request");
  }

  try {
    (void)supervisor.decide(std::nan(""), boiler_snapshot{}, flat_forecast(500.0), false);
  } catch (const std::invalid_argument&) {
    return 0;
  }
  return fail("test_request_is_clamped_before_deciding", "NaN request should be rejected");
}

int test_decision_basis_selects_indicator() {
  std::vector<double> spike(30, 550.0);
  spike[10] = 600.0;

  const Supervisor endpoint;
  if (endpoint.decide(90.0, boiler_snapshot{}, fixed_forecast(spike), true).intervened) {
    return fail("test_decision_basis_selects_indicator", "endpoint basis should ignore a mid-horizon spike");
  }

  SupervisorPolicy policy{};
  policy.basis = DecisionBasis::PEAK;
  const Supervisor peak(policy);
  const auto decision = peak.decide(90.0, boiler_snapshot{}, fixed_forecast(spike), true);
  if (!decision.intervened || !almost_equal(decision.forecast.peak, 600.0)) {
    return fail("test_decision_basis_selects_indicator", "peak basis should react to the spike");
  }

  return 0;
}

int test_seed_mapping() {
  boiler_snapshot state{};
  state.pressure = 12.5;
  state.temperature = 551.0;

  ForecastSeed seen{};
  const ForecastFn capture = [&seen](const ForecastSeed& seed) {
    seen = seed;
    return ForecastResult(std::vector<double>(30, 500.0));
  };

  const Supervisor supervisor;
  (void)supervisor.decide(40.0, state, capture, true);
  if (!almost_equal(seen.controls[0], 50.0) || !almost_equal(seen.controls[1], 12.5) ||
      !almost_equal(seen.controls[2], 80.0) || !almost_equal(seen.target, 551.0)) {
    return fail("test_seed_mapping", "seed should be [valve, pressure, 2 * fire] with temperature target");
  }

  const auto clamped = boiler_twin::supervisor::map_features(120.0, state, FeatureMapping{});
  if (!almost_equal(clamped.controls[2], 200.0)) {
    return fail("test_seed_mapping", "requested input should be clamped before scaling");
  }

  FeatureMapping wrong{};
  wrong.schema_version = 2;
  try {
    (void)boiler_twin::supervisor::map_features(40.0, state, wrong);
  } catch (const std::invalid_argument&) {
    return 0;
  }
  return fail("test_seed_mapping", "mismatched schema version should be rejected");
}

int test_forecast_failure_propagates() {
  const Supervisor supervisor;
  const ForecastFn broken = [](const ForecastSeed&) -> ForecastResult {
    throw DependencyUnavailable("predictor not loaded");
  };

  try {
    (void)supervisor.decide(50.0, boiler_snapshot{}, broken, false);
  } catch (const DependencyUnavailable& ex) {
    if (std::string(ex.what()).find("dependency unavailable") == std::string::npos) {
      return fail("test_forecast_failure_propagates", "unexpected message");
    }
    return 0;
  }
  return fail("test_forecast_failure_propagates", "DependencyUnavailable should reach the caller");
}

int test_parse_decision_basis() {
  if (boiler_twin::supervisor::parse_decision_basis("peak") != DecisionBasis::PEAK ||
      boiler_twin::supervisor::parse_decision_basis("final") != DecisionBasis::ENDPOINT) {
    return fail("test_parse_decision_basis", "known names should parse");
  }
  try {
    (void)boiler_twin::supervisor::parse_decision_basis("average");
  } catch (const std::invalid_argument&) {
    return 0;
  }
  return fail("test_parse_decision_basis", "unknown basis should be rejected");
}

}  // namespace

int main() {
  if (int rc = test_ai_off_passes_input_through(); rc != 0) return rc;
  if (int rc = test_threshold_is_strict(); rc != 0) return rc;
  if (int rc = test_override_never_raises_input(); rc != 0) return rc;
  if (int rc = test_request_is_clamped_before_deciding(); rc != 0) return rc;
  if (int rc = test_decision_basis_selects_indicator(); rc != 0) return rc;
  if (int rc = test_seed_mapping(); rc != 0) return rc;
  if (int rc = test_forecast_failure_propagates(); rc != 0) return rc;
  if (int rc = test_parse_decision_basis(); rc != 0) return rc;

  std::cout << "[PASS] supervisor unit tests\n";
  return 0;
}
