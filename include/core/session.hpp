#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "forecast/forecast_engine.hpp"
#include "model/boiler_state.hpp"
#include "physics/drum_boiler.hpp"
#include "supervisor/supervisor.hpp"

namespace boiler_twin::core {

struct SessionOptions {
  physics::PhysicsParams physics{};
  physics::InitialConditions initial{};
  double time_step_s{0.1};
  std::size_t horizon{forecast::kDefaultHorizon};
  supervisor::SupervisorPolicy policy{};
};

struct StepResult {
  model::boiler_snapshot state{};
  supervisor::SupervisorDecision decision{};
  bool ai_mode_enabled{false};
};

// One simulated drum. step() and reset() are serialized; state() copies the
// last fully committed snapshot and never waits on a forecast.
class Session {
 public:
  Session(std::string id, SessionOptions options, std::shared_ptr<const forecast::ForecastEngine> engine);

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // Throws DependencyUnavailable before any state change when the forecast
  // cannot be produced.
  StepResult step(double requested_fire_intensity, bool ai_mode_enabled);
  StepResult step(double requested_fire_intensity, bool ai_mode_enabled, double dt_s);

  model::boiler_snapshot reset(double water_level, double pressure, double temperature);
  model::boiler_snapshot reset();

  [[nodiscard]] model::boiler_snapshot state() const;
  [[nodiscard]] std::vector<model::boiler_snapshot> history() const;

  [[nodiscard]] const std::string& id() const noexcept;
  [[nodiscard]] const SessionOptions& options() const noexcept;

 private:
  void publish(const model::boiler_snapshot& snapshot);

  const std::string id_;
  const SessionOptions options_;
  std::shared_ptr<const forecast::ForecastEngine> engine_;
  supervisor::Supervisor supervisor_;

  mutable std::mutex write_mutex_;
  physics::DrumBoiler boiler_;

  mutable std::shared_mutex snapshot_mutex_;
  model::boiler_snapshot published_{};
};

}  // namespace boiler_twin::core
