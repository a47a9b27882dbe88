#include "supervisor/supervisor.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <utility>

#include "core/math.hpp"

namespace boiler_twin::supervisor {

const char* to_string(const DecisionBasis basis) noexcept {
  switch (basis) {
    case DecisionBasis::ENDPOINT:
      return "endpoint";
    case DecisionBasis::PEAK:
      return "peak";
  }
  return "unknown";
}

DecisionBasis parse_decision_basis(const std::string& value) {
  if (value == "endpoint" || value == "final") {
    return DecisionBasis::ENDPOINT;
  }
  if (value == "peak") {
    return DecisionBasis::PEAK;
  }
  throw std::invalid_argument("decision basis must be 'endpoint' or 'peak', got '" + value + "'");
}

Supervisor::Supervisor(SupervisorPolicy policy) : policy_(std::move(policy)) {}

SupervisorDecision Supervisor::decide(const double requested_input, const model::boiler_snapshot& state,
                                      const ForecastFn& forecast_fn, const bool ai_mode_enabled) const {
  if (!forecast_fn) {
    throw std::invalid_argument("supervisor requires a forecast function");
  }

  if (!std::isfinite(requested_input)) {
    throw std::invalid_argument("requested input must be finite");
  }
  const double requested = core::clamp_percent(requested_input);

  const ForecastSeed seed = map_features(requested, state, policy_.mapping);
  const forecast::ForecastResult result = forecast_fn(seed);

  SupervisorDecision decision{};
  decision.requested_input = requested;
  decision.effective_input = requested;
  decision.forecast.series = result.values();
  decision.forecast.final_value = result.final_value();
  decision.forecast.average = result.average();
  decision.forecast.peak = result.peak();

  if (!ai_mode_enabled) {
    return decision;
  }

  const double indicator =
      policy_.basis == DecisionBasis::PEAK ? decision.forecast.peak : decision.forecast.final_value;
  if (indicator > policy_.danger_temp_c) {
    decision.effective_input = std::min(requested, policy_.safe_fire_limit);
    decision.intervened = true;

    char reason[160];
    std::snprintf(reason, sizeof(reason), "Predicted temperature %.1f C exceeds safe limit %.1f C by %.1f C",
                  indicator, policy_.danger_temp_c, indicator - policy_.danger_temp_c);
    decision.reason = std::string(reason);
  }

  return decision;
}

const SupervisorPolicy& Supervisor::policy() const noexcept { return policy_; }

}  // namespace boiler_twin::supervisor
