#pragma once

#include <memory>

#include "core/config.hpp"
#include "core/session.hpp"
#include "forecast/forecast_engine.hpp"

namespace boiler_twin::core {

// Loads the normalizer and predictor artifacts named in the config. A failed
// load is logged and leaves that dependency missing, so forecasts report
// DependencyUnavailable instead of the process exiting.
std::shared_ptr<const forecast::ForecastEngine> load_forecast_engine(const ForecastConfig& config);

SessionOptions make_session_options(const SimulatorConfig& config);

}  // namespace boiler_twin::core
