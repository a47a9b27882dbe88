#include "supervisor/feature_map.hpp"

#include <stdexcept>
#include <string>

#include "core/math.hpp"

namespace boiler_twin::supervisor {

ForecastSeed map_features(const double requested_input, const model::boiler_snapshot& state,
                          const FeatureMapping& mapping) {
  if (mapping.schema_version != forecast::kSchemaVersion) {
    throw std::invalid_argument("feature mapping targets schema version " + std::to_string(mapping.schema_version) +
                                ", predictor schema is " + std::to_string(forecast::kSchemaVersion));
  }

  ForecastSeed seed{};
  seed.controls[0] = mapping.placeholder_valve;
  seed.controls[1] = state.pressure;
  seed.controls[2] = core::clamp_percent(requested_input) * mapping.fire_to_flow_scale;
  seed.target = state.temperature;
  return seed;
}

}  // namespace boiler_twin::supervisor
