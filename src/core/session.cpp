#include "core/session.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "core/errors.hpp"

namespace boiler_twin::core {

Session::Session(std::string id, SessionOptions options, std::shared_ptr<const forecast::ForecastEngine> engine)
    : id_(std::move(id)),
      options_(std::move(options)),
      engine_(std::move(engine)),
      supervisor_(options_.policy),
      boiler_(options_.physics, options_.initial) {
  if (!(options_.time_step_s > 0.0) || !std::isfinite(options_.time_step_s / options_.physics.nominal_interval_s)) {
    throw std::invalid_argument("session time step must be finite and greater than 0");
  }
  published_ = boiler_.state();
}

StepResult Session::step(const double requested_fire_intensity, const bool ai_mode_enabled) {
  return step(requested_fire_intensity, ai_mode_enabled, options_.time_step_s);
}

StepResult Session::step(const double requested_fire_intensity, const bool ai_mode_enabled, const double dt_s) {
  std::lock_guard<std::mutex> write_lock(write_mutex_);

  const auto forecast_fn = [this](const supervisor::ForecastSeed& seed) {
    if (engine_ == nullptr) {
      throw DependencyUnavailable("forecast engine not configured");
    }
    return engine_->forecast(seed.controls, seed.target, options_.horizon);
  };

  StepResult result{};
  result.ai_mode_enabled = ai_mode_enabled;
  result.decision = supervisor_.decide(requested_fire_intensity, boiler_.state(), forecast_fn, ai_mode_enabled);
  result.state = boiler_.tick(result.decision.effective_input, dt_s);

  publish(result.state);
  return result;
}

model::boiler_snapshot Session::reset(const double water_level, const double pressure, const double temperature) {
  std::lock_guard<std::mutex> write_lock(write_mutex_);
  boiler_.reset(water_level, pressure, temperature);
  publish(boiler_.state());
  std::cerr << "[session] " << id_ << " reset to level=" << water_level << " pressure=" << pressure
            << " temperature=" << temperature << '\n';
  return boiler_.state();
}

model::boiler_snapshot Session::reset() {
  return reset(options_.initial.water_level, options_.initial.pressure, options_.initial.temperature);
}

model::boiler_snapshot Session::state() const {
  std::shared_lock<std::shared_mutex> read_lock(snapshot_mutex_);
  return published_;
}

std::vector<model::boiler_snapshot> Session::history() const {
  std::lock_guard<std::mutex> write_lock(write_mutex_);
  return boiler_.history();
}

const std::string& Session::id() const noexcept { return id_; }

const SessionOptions& Session::options() const noexcept { return options_; }

void Session::publish(const model::boiler_snapshot& snapshot) {
  std::unique_lock<std::shared_mutex> publish_lock(snapshot_mutex_);
  published_ = snapshot;
}

}  // namespace boiler_twin::core
