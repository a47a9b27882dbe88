#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "forecast/forecast_engine.hpp"
#include "physics/drum_boiler.hpp"
#include "supervisor/supervisor.hpp"

namespace boiler_twin::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"boiler:twin"};
  bool enabled{false};
};

struct ForecastConfig {
  std::size_t window_length{forecast::kDefaultWindowLength};
  std::size_t horizon{forecast::kDefaultHorizon};
  std::chrono::milliseconds predict_timeout{0};
  std::string normalizer_path{"models/normalizer.json"};
  std::string predictor_path{"models/predictor.json"};
};

struct OperatorConfig {
  double fire_intensity{30.0};
  bool ai_mode{true};
};

struct SimulatorConfig {
  std::chrono::milliseconds tick_interval{100};
  double time_step_s{0.1};
  physics::PhysicsParams physics{};
  physics::InitialConditions initial{};
  ForecastConfig forecast{};
  supervisor::SupervisorPolicy supervisor{};
  OperatorConfig operator_input{};
  bool stdout_debug{true};
  RedisConfig redis{};
};

SimulatorConfig load_simulator_config(const std::string& path);

}  // namespace boiler_twin::core
