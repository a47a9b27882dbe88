#include <cmath>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/ring_buffer.hpp"
#include "model/boiler_state.hpp"
#include "physics/drum_boiler.hpp"
#include "physics/safety_classifier.hpp"

using boiler_twin::core::RingBuffer;
using boiler_twin::model::boiler_snapshot;
using boiler_twin::model::boiler_status;
using boiler_twin::physics::classify;
using boiler_twin::physics::DrumBoiler;
using boiler_twin::physics::PhysicsParams;
using boiler_twin::physics::SafetyLimits;

namespace {

constexpr double kDt = 0.1;

bool almost_equal(double a, double b, double epsilon = 1e-9) {
  return std::fabs(a - b) <= epsilon;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool any_alarm_contains(const boiler_snapshot& state, const std::string& needle) {
  for (const auto& alarm : state.alarms) {
    if (alarm.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

int test_first_tick_mass_and_energy_balance() {
  DrumBoiler boiler;
  const auto& state = boiler.tick(100.0, kDt);

  if (!almost_equal(state.steam_generation, 50.0)) {
    return fail("test_first_tick_mass_and_energy_balance", "steam generation should be fire * 0.5");
  }
  if (!almost_equal(state.water_level, 15.0)) {
    return fail("test_first_tick_mass_and_energy_balance", "level should drop by inflow - steam");
  }
  if (!almost_equal(state.pressure, 14.0)) {
    return fail("test_first_tick_mass_and_energy_balance", "pressure should be 10 + 5 - 1");
  }

  const double expected_temp = 540.0 + (14.0 / 25.0) * 60.0 + (30.0 - 15.0) * 2.0;
  if (!almost_equal(state.temperature, expected_temp)) {
    return fail("test_first_tick_mass_and_energy_balance", "temperature surrogate mismatch");
  }
  if (state.status != boiler_status::WARNING || !any_alarm_contains(state, "Low drum level 15.0%")) {
    return fail("test_first_tick_mass_and_energy_balance", "expected low level WARNING");
  }
  if (state.tick != 1 || boiler.history_size() != 1) {
    return fail("test_first_tick_mass_and_energy_balance", "tick should be counted and recorded");
  }

  return 0;
}

int test_temperature_without_superheat() {
  DrumBoiler boiler;
  const auto& state = boiler.tick(30.0, kDt);

  const double expected = 540.0 + (state.pressure / 25.0) * 60.0;
  if (!almost_equal(state.temperature, expected)) {
    return fail("test_temperature_without_superheat", "level above 30% must not add superheat");
  }

  return 0;
}

int test_control_input_is_clamped() {
  DrumBoiler boiler;
  if (!almost_equal(boiler.tick(150.0, kDt).fire_intensity, 100.0)) {
    return fail("test_control_input_is_clamped", "input above 100 should clamp to 100");
  }

  boiler.reset(50.0, 10.0, 540.0);
  const auto& state = boiler.tick(-20.0, kDt);
  if (!almost_equal(state.fire_intensity, 0.0) || !almost_equal(state.steam_generation, 0.0)) {
    return fail("test_control_input_is_clamped", "negative input should clamp to 0");
  }

  return 0;
}

int test_bounds_hold_for_any_input_sequence() {
  DrumBoiler boiler;
  const std::vector<double> inputs = {-50.0, 0.0, 12.5, 30.0, 55.0, 100.0, 250.0, 75.0, 5.0, 99.9};

  for (std::size_t i = 0; i < 5000; ++i) {
    const double input = inputs[(i * 7) % inputs.size()];
    const double dt = (i % 3 == 0) ? 0.05 : kDt * static_cast<double>(1 + (i % 4));
    const auto& state = boiler.tick(input, dt);

    if (state.water_level < 0.0 || state.water_level > 100.0) {
      return fail("test_bounds_hold_for_any_input_sequence", "water level escaped [0, 100]");
    }
    if (state.pressure < 0.0 || state.pressure > 25.0) {
      return fail("test_bounds_hold_for_any_input_sequence", "pressure escaped [0, MAX_PRESSURE]");
    }
    if (state.fire_intensity < 0.0 || state.fire_intensity > 100.0) {
      return fail("test_bounds_hold_for_any_input_sequence", "fire intensity escaped [0, 100]");
    }
    if (!std::isfinite(state.temperature)) {
      return fail("test_bounds_hold_for_any_input_sequence", "temperature became non-finite");
    }
  }

  return 0;
}

int test_classification_cascade_order() {
  const SafetyLimits limits{};

  const auto critical = classify(5.0, 21.0, limits);
  if (critical.status != boiler_status::CRITICAL_PRESSURE || critical.alarms.size() != 1 ||
      critical.alarms.front().find("CRITICAL") == std::string::npos) {
    return fail("test_classification_cascade_order", "critical pressure must win over low level trip");
  }

  const auto low = classify(5.0, 19.0, limits);
  if (low.status != boiler_status::LOW_LEVEL_TRIP || low.alarms.size() != 1) {
    return fail("test_classification_cascade_order", "expected LOW_LEVEL_TRIP");
  }

  const auto high = classify(95.0, 19.0, limits);
  if (high.status != boiler_status::HIGH_LEVEL_TRIP || high.alarms.front().find("carryover") == std::string::npos) {
    return fail("test_classification_cascade_order", "expected HIGH_LEVEL_TRIP");
  }

  const auto warning = classify(15.0, 19.0, limits);
  if (warning.status != boiler_status::WARNING || warning.alarms.size() != 2) {
    return fail("test_classification_cascade_order", "both warning sub-conditions should raise an alarm");
  }

  const auto normal = classify(50.0, 10.0, limits);
  if (normal.status != boiler_status::NORMAL || !normal.alarms.empty()) {
    return fail("test_classification_cascade_order", "expected NORMAL with no alarms");
  }

  return 0;
}

int test_classification_thresholds_are_strict() {
  const SafetyLimits limits{};

  if (classify(50.0, 20.0, limits).status != boiler_status::WARNING) {
    return fail("test_classification_thresholds_are_strict", "pressure == 20 is not critical");
  }
  if (classify(10.0, 10.0, limits).status != boiler_status::WARNING) {
    return fail("test_classification_thresholds_are_strict", "level == 10 is not a trip");
  }
  if (classify(90.0, 10.0, limits).status != boiler_status::NORMAL) {
    return fail("test_classification_thresholds_are_strict", "level == 90 is not a trip");
  }
  if (classify(20.0, 18.0, limits).status != boiler_status::NORMAL) {
    return fail("test_classification_thresholds_are_strict", "level == 20 and pressure == 18 are normal");
  }

  return 0;
}

int test_reset_restores_supplied_values() {
  DrumBoiler boiler;
  for (int i = 0; i < 10; ++i) {
    boiler.tick(100.0, kDt);
  }

  boiler.reset(42.5, 7.25, 551.0);
  const auto& state = boiler.state();

  if (!almost_equal(state.water_level, 42.5) || !almost_equal(state.pressure, 7.25) ||
      !almost_equal(state.temperature, 551.0)) {
    return fail("test_reset_restores_supplied_values", "reset values not applied exactly");
  }
  if (!almost_equal(state.fire_intensity, 0.0) || !state.alarms.empty() || boiler.history_size() != 0) {
    return fail("test_reset_restores_supplied_values", "reset must zero fire and clear alarms and history");
  }
  if (state.status != boiler_status::NORMAL || state.tick != 0) {
    return fail("test_reset_restores_supplied_values", "expected NORMAL at tick 0 after reset");
  }

  return 0;
}

int test_reset_rejects_non_finite_values() {
  DrumBoiler boiler;
  bool threw = false;
  try {
    boiler.reset(std::nan(""), 10.0, 540.0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }

  if (!threw || !almost_equal(boiler.state().water_level, 50.0)) {
    return fail("test_reset_rejects_non_finite_values", "NaN reset should throw and leave state alone");
  }

  return 0;
}

int test_invalid_tick_leaves_state_untouched() {
  DrumBoiler boiler;
  boiler.tick(30.0, kDt);
  const boiler_snapshot before = boiler.state();

  int rejected = 0;
  for (const double dt : {0.0, -0.1, std::nan("")}) {
    try {
      boiler.tick(30.0, dt);
    } catch (const std::invalid_argument&) {
      ++rejected;
    }
  }
  try {
    boiler.tick(std::nan(""), kDt);
  } catch (const std::invalid_argument&) {
    ++rejected;
  }

  if (rejected != 4) {
    return fail("test_invalid_tick_leaves_state_untouched", "invalid dt or input should throw");
  }
  if (boiler.state().tick != before.tick || boiler.history_size() != 1 ||
      !almost_equal(boiler.state().pressure, before.pressure)) {
    return fail("test_invalid_tick_leaves_state_untouched", "rejected tick must not mutate state");
  }

  return 0;
}

int test_overflowing_time_step_is_rejected() {
  DrumBoiler boiler;
  boiler.tick(30.0, kDt);
  const boiler_snapshot before = boiler.state();

  bool threw = false;
  try {
    boiler.tick(30.0, 1e308);
  } catch (const std::invalid_argument&) {
    threw = true;
  }

  if (!threw) {
    return fail("test_overflowing_time_step_is_rejected", "dt whose scale overflows should be rejected");
  }
  if (boiler.state().tick != before.tick || !std::isfinite(boiler.state().water_level) ||
      !almost_equal(boiler.state().pressure, before.pressure) || boiler.history_size() != 1) {
    return fail("test_overflowing_time_step_is_rejected", "rejected tick must not mutate state");
  }

  return 0;
}

int test_time_step_scales_deltas_deterministically() {
  DrumBoiler a;
  DrumBoiler b;
  for (int i = 0; i < 50; ++i) {
    a.tick(45.0, kDt);
    b.tick(45.0, kDt);
  }
  if (a.state().water_level != b.state().water_level || a.state().pressure != b.state().pressure) {
    return fail("test_time_step_scales_deltas_deterministically", "identical inputs must give identical state");
  }

  DrumBoiler doubled;
  const auto& state = doubled.tick(0.0, 2.0 * kDt);
  if (!almost_equal(state.water_level, 80.0) || !almost_equal(state.pressure, 8.0)) {
    return fail("test_time_step_scales_deltas_deterministically", "dt of two nominal intervals should double deltas");
  }

  return 0;
}

int test_sustained_full_fire_trips_on_low_level() {
  DrumBoiler boiler;
  boiler.reset(50.0, 10.0, 540.0);

  for (int tick = 1; tick <= 20; ++tick) {
    const auto& state = boiler.tick(100.0, kDt);
    if (state.water_level < 10.0) {
      if (state.status != boiler_status::LOW_LEVEL_TRIP) {
        return fail("test_sustained_full_fire_trips_on_low_level", "expected LOW_LEVEL_TRIP once level < 10");
      }
      if (!any_alarm_contains(state, "TRIP: Drum level")) {
        return fail("test_sustained_full_fire_trips_on_low_level", "expected a level trip alarm");
      }
      return 0;
    }
  }

  return fail("test_sustained_full_fire_trips_on_low_level", "level never fell below MIN_WATER_LEVEL");
}

int test_moderate_fire_settles_in_normal_band() {
  DrumBoiler boiler;
  boiler.reset(50.0, 10.0, 540.0);

  for (int tick = 0; tick < 100; ++tick) {
    const auto& state = boiler.tick(30.0, kDt);
    if (state.status != boiler_status::NORMAL) {
      return fail("test_moderate_fire_settles_in_normal_band", "status left NORMAL");
    }
    if (state.water_level < 45.0 || state.water_level > 55.0) {
      return fail("test_moderate_fire_settles_in_normal_band", "water level left the equilibrium band");
    }
    if (state.pressure < 10.0 || state.pressure > 15.0) {
      return fail("test_moderate_fire_settles_in_normal_band", "pressure left the equilibrium band");
    }
  }

  if (std::fabs(boiler.state().pressure - 15.0) > 0.01) {
    return fail("test_moderate_fire_settles_in_normal_band", "pressure should converge toward 15 MPa");
  }

  return 0;
}

int test_no_fire_overfills_drum() {
  DrumBoiler boiler;
  boiler_status status = boiler_status::NORMAL;
  for (int tick = 0; tick < 3; ++tick) {
    status = boiler.tick(0.0, kDt).status;
  }

  if (status != boiler_status::HIGH_LEVEL_TRIP || !any_alarm_contains(boiler.state(), "95.0%")) {
    return fail("test_no_fire_overfills_drum", "expected HIGH_LEVEL_TRIP at 95%");
  }

  return 0;
}

int test_saturated_pressure_reports_critical() {
  PhysicsParams params{};
  params.pressure_build_rate = 1.0;
  DrumBoiler boiler(params);

  const auto& state = boiler.tick(100.0, kDt);
  if (!almost_equal(state.pressure, 25.0) || state.status != boiler_status::CRITICAL_PRESSURE) {
    return fail("test_saturated_pressure_reports_critical", "pressure should clamp at MAX_PRESSURE and be critical");
  }

  return 0;
}

int test_history_is_bounded_fifo() {
  DrumBoiler boiler;
  for (int tick = 0; tick < 1500; ++tick) {
    boiler.tick(30.0, kDt);
  }

  const auto history = boiler.history();
  if (history.size() != DrumBoiler::kHistoryCapacity) {
    return fail("test_history_is_bounded_fifo", "history exceeded capacity");
  }
  if (history.front().tick != 501 || history.back().tick != 1500) {
    return fail("test_history_is_bounded_fifo", "oldest entries should be evicted first");
  }
  for (std::size_t i = 1; i < history.size(); ++i) {
    if (history[i].tick != history[i - 1].tick + 1) {
      return fail("test_history_is_bounded_fifo", "history must stay in tick order");
    }
  }

  return 0;
}

int test_ring_buffer_wraps() {
  RingBuffer<int, 3> ring;
  for (int i = 1; i <= 5; ++i) {
    ring.push(i);
  }

  const auto items = ring.to_vector();
  if (items.size() != 3 || items[0] != 3 || items[1] != 4 || items[2] != 5) {
    return fail("test_ring_buffer_wraps", "expected the three newest items oldest first");
  }

  bool threw = false;
  try {
    (void)ring.at(3);
  } catch (const std::out_of_range&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_ring_buffer_wraps", "index past the newest entry should throw");
  }

  ring.clear();
  threw = false;
  try {
    (void)ring.at(0);
  } catch (const std::out_of_range&) {
    threw = true;
  }
  if (!threw || !ring.to_vector().empty()) {
    return fail("test_ring_buffer_wraps", "empty buffer has no entries");
  }

  ring.push(9);
  if (ring.size() != 1 || ring.at(0) != 9) {
    return fail("test_ring_buffer_wraps", "clear should restart the buffer");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_first_tick_mass_and_energy_balance(); rc != 0) return rc;
  if (int rc = test_temperature_without_superheat(); rc != 0) return rc;
  if (int rc = test_control_input_is_clamped(); rc != 0) return rc;
  if (int rc = test_bounds_hold_for_any_input_sequence(); rc != 0) return rc;
  if (int rc = test_classification_cascade_order(); rc != 0) return rc;
  if (int rc = test_classification_thresholds_are_strict(); rc != 0) return rc;
  if (int rc = test_reset_restores_supplied_values(); rc != 0) return rc;
  if (int rc = test_reset_rejects_non_finite_values(); rc != 0) return rc;
  if (int rc = test_invalid_tick_leaves_state_untouched(); rc != 0) return rc;
  if (int rc = test_overflowing_time_step_is_rejected(); rc != 0) return rc;
  if (int rc = test_time_step_scales_deltas_deterministically(); rc != 0) return rc;
  if (int rc = test_sustained_full_fire_trips_on_low_level(); rc != 0) return rc;
  if (int rc = test_moderate_fire_settles_in_normal_band(); rc != 0) return rc;
  if (int rc = test_no_fire_overfills_drum(); rc != 0) return rc;
  if (int rc = test_saturated_pressure_reports_critical(); rc != 0) return rc;
  if (int rc = test_history_is_bounded_fifo(); rc != 0) return rc;
  if (int rc = test_ring_buffer_wraps(); rc != 0) return rc;

  std::cout << "[PASS] physics unit tests\n";
  return 0;
}
