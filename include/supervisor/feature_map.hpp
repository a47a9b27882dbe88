#pragma once

#include <cstdint>

#include "forecast/feature_schema.hpp"
#include "model/boiler_state.hpp"

namespace boiler_twin::supervisor {

// How drum variables are presented to a predictor trained on
// [valve, pressure, flow, temperature]. The drum has no valve, so that slot
// carries a constant; the fire demand is rescaled into the flow range.
struct FeatureMapping {
  std::uint32_t schema_version{forecast::kSchemaVersion};
  double placeholder_valve{50.0};
  double fire_to_flow_scale{2.0};
};

struct ForecastSeed {
  forecast::ControlVector controls{};
  double target{0.0};
};

// Throws std::invalid_argument if the mapping targets another schema version.
ForecastSeed map_features(double requested_input, const model::boiler_snapshot& state, const FeatureMapping& mapping);

}  // namespace boiler_twin::supervisor
