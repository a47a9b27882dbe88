#include "physics/drum_boiler.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "core/errors.hpp"
#include "core/math.hpp"

namespace boiler_twin::physics {

DrumBoiler::DrumBoiler(PhysicsParams params, const InitialConditions initial) : params_(std::move(params)) {
  if (!(params_.nominal_interval_s > 0.0) || !(params_.max_pressure > 0.0)) {
    throw std::invalid_argument("nominal_interval_s and max_pressure must be greater than 0");
  }
  reset(initial.water_level, initial.pressure, initial.temperature);
}

const model::boiler_snapshot& DrumBoiler::tick(const double control_input, const double dt_s) {
  if (!std::isfinite(control_input)) {
    throw std::invalid_argument("control input must be finite");
  }
  if (!std::isfinite(dt_s) || dt_s <= 0.0) {
    throw std::invalid_argument("dt must be finite and greater than 0");
  }

  const double fire = core::clamp_percent(control_input);
  const double scale = dt_s / params_.nominal_interval_s;
  if (!std::isfinite(scale)) {
    throw std::invalid_argument("dt is too large for the nominal interval");
  }

  const double steam_rate = fire * params_.steam_conversion_factor;

  const double level_delta = (params_.feedwater_inflow - steam_rate) * scale;
  const double water_level = core::clamp_percent(state_.water_level + level_delta);

  const double pressure_build = steam_rate * params_.pressure_build_rate * scale;
  const double pressure_loss = state_.pressure * params_.pressure_decay_rate * scale;
  const double pressure = std::clamp(state_.pressure + pressure_build - pressure_loss, 0.0, params_.max_pressure);

  const double temperature = estimate_temperature(water_level, pressure);
  if (!std::isfinite(water_level) || !std::isfinite(pressure) || !std::isfinite(temperature)) {
    throw core::DependencyUnavailable("boiler state update produced a non-finite value");
  }

  Classification classification = classify(water_level, pressure, params_.limits);

  state_.tick += 1;
  state_.water_level = water_level;
  state_.pressure = pressure;
  state_.temperature = temperature;
  state_.fire_intensity = fire;
  state_.steam_generation = steam_rate;
  state_.status = classification.status;
  state_.alarms = std::move(classification.alarms);

  history_.push(state_);
  return state_;
}

void DrumBoiler::reset(const double water_level, const double pressure, const double temperature) {
  if (!std::isfinite(water_level) || !std::isfinite(pressure) || !std::isfinite(temperature)) {
    throw std::invalid_argument("reset values must be finite");
  }

  state_ = model::boiler_snapshot{};
  state_.water_level = core::clamp_percent(water_level);
  state_.pressure = std::clamp(pressure, 0.0, params_.max_pressure);
  state_.temperature = temperature;
  state_.fire_intensity = 0.0;
  state_.steam_generation = 0.0;
  // Alarms stay empty until the next tick; status still reflects level and pressure.
  state_.status = classify(state_.water_level, state_.pressure, params_.limits).status;
  history_.clear();
}

const model::boiler_snapshot& DrumBoiler::state() const noexcept { return state_; }

std::vector<model::boiler_snapshot> DrumBoiler::history() const { return history_.to_vector(); }

std::size_t DrumBoiler::history_size() const noexcept { return history_.size(); }

const PhysicsParams& DrumBoiler::params() const noexcept { return params_; }

double DrumBoiler::estimate_temperature(const double water_level, const double pressure) const noexcept {
  const double base = params_.base_temperature_c + (pressure / params_.max_pressure) * params_.temperature_span_c;
  if (water_level < params_.superheat_level) {
    return base + (params_.superheat_level - water_level) * params_.superheat_gain_c;
  }
  return base;
}

}  // namespace boiler_twin::physics
