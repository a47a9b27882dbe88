#include <csignal>
#include <exception>
#include <iostream>
#include <sstream>
#include <string>

#include "core/bootstrap.hpp"
#include "core/config.hpp"
#include "core/runner.hpp"
#include "core/session_registry.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

std::string format_config_settings(const boiler_twin::core::SimulatorConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[simulator] loaded config from " << config_path
         << " | tick_interval_ms=" << config.tick_interval.count()
         << " | time_step_s=" << config.time_step_s
         << " | window_length=" << config.forecast.window_length
         << " | horizon=" << config.forecast.horizon
         << " | danger_temp_c=" << config.supervisor.danger_temp_c
         << " | safe_fire_limit=" << config.supervisor.safe_fire_limit
         << " | decision_basis=" << boiler_twin::supervisor::to_string(config.supervisor.basis)
         << " | operator_fire=" << config.operator_input.fire_intensity
         << " | ai_mode=" << (config.operator_input.ai_mode ? "true" : "false")
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/boiler_twin.yaml";

  boiler_twin::core::SimulatorConfig config{};
  try {
    config = boiler_twin::core::load_simulator_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  boiler_twin::core::SessionRegistry registry(boiler_twin::core::make_session_options(config),
                                              boiler_twin::core::load_forecast_engine(config.forecast));
  boiler_twin::core::Runner runner(config, registry.get_or_create(boiler_twin::core::kDefaultSessionId));
  while (g_shutdown_requested == 0) {
    runner.run_for_ticks(1);
  }

  std::cerr << "[simulator] shutdown signal received; exiting cleanly\n";

  return 0;
}
