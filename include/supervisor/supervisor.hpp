#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "forecast/forecast_engine.hpp"
#include "model/boiler_state.hpp"
#include "supervisor/feature_map.hpp"

namespace boiler_twin::supervisor {

enum class DecisionBasis {
  // Only the H-th prediction gates control.
  ENDPOINT,
  // Maximum over the whole horizon.
  PEAK,
};

const char* to_string(DecisionBasis basis) noexcept;
DecisionBasis parse_decision_basis(const std::string& value);

struct SupervisorPolicy {
  double danger_temp_c{560.0};
  double safe_fire_limit{60.0};
  DecisionBasis basis{DecisionBasis::ENDPOINT};
  FeatureMapping mapping{};
};

struct ForecastTelemetry {
  std::vector<double> series{};
  double final_value{0.0};
  double average{0.0};
  double peak{0.0};
};

struct SupervisorDecision {
  double requested_input{0.0};
  double effective_input{0.0};
  bool intervened{false};
  std::optional<std::string> reason{};
  ForecastTelemetry forecast{};
};

using ForecastFn = std::function<forecast::ForecastResult(const ForecastSeed&)>;

class Supervisor {
 public:
  explicit Supervisor(SupervisorPolicy policy = {});

  // The forecast always runs, so telemetry is available with AI mode off;
  // only AI mode lets it change the effective input. The request is clamped
  // to 0..100 before anything else; a non-finite request throws
  // std::invalid_argument. Exceptions from `forecast_fn` propagate unchanged.
  [[nodiscard]] SupervisorDecision decide(double requested_input, const model::boiler_snapshot& state,
                                          const ForecastFn& forecast_fn, bool ai_mode_enabled) const;

  [[nodiscard]] const SupervisorPolicy& policy() const noexcept;

 private:
  SupervisorPolicy policy_;
};

}  // namespace boiler_twin::supervisor
