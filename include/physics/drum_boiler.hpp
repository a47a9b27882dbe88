#pragma once

#include <cstddef>
#include <vector>

#include "core/ring_buffer.hpp"
#include "model/boiler_state.hpp"
#include "physics/safety_classifier.hpp"

namespace boiler_twin::physics {

struct PhysicsParams {
  double feedwater_inflow{15.0};
  double steam_conversion_factor{0.5};
  double pressure_build_rate{0.1};
  double pressure_decay_rate{0.1};
  double max_pressure{25.0};
  double nominal_interval_s{0.1};

  double base_temperature_c{540.0};
  double temperature_span_c{60.0};
  double superheat_level{30.0};
  double superheat_gain_c{2.0};

  SafetyLimits limits{};
};

struct InitialConditions {
  double water_level{50.0};
  double pressure{10.0};
  double temperature{540.0};
};

// Mass and energy balance of a single drum. Time only advances through the
// dt handed to tick(); nothing here reads a clock.
class DrumBoiler {
 public:
  static constexpr std::size_t kHistoryCapacity = 1000;

  explicit DrumBoiler(PhysicsParams params = {}, InitialConditions initial = {});

  // Throws std::invalid_argument for non-finite input, dt <= 0 or a dt whose
  // scale overflows, and core::DependencyUnavailable if the candidate state
  // is non-finite. State is untouched when it throws.
  const model::boiler_snapshot& tick(double control_input, double dt_s);

  void reset(double water_level, double pressure, double temperature);

  [[nodiscard]] const model::boiler_snapshot& state() const noexcept;
  [[nodiscard]] std::vector<model::boiler_snapshot> history() const;
  [[nodiscard]] std::size_t history_size() const noexcept;
  [[nodiscard]] const PhysicsParams& params() const noexcept;

 private:
  [[nodiscard]] double estimate_temperature(double water_level, double pressure) const noexcept;

  PhysicsParams params_;
  model::boiler_snapshot state_{};
  core::RingBuffer<model::boiler_snapshot, kHistoryCapacity> history_{};
};

}  // namespace boiler_twin::physics
