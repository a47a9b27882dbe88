#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>

#include "core/config.hpp"
#include "core/session.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"

namespace boiler_twin::core {

struct RunnerStats {
  std::size_t ticks_executed{0};
  std::size_t failed_steps{0};
  std::size_t interventions{0};
  std::size_t trip_ticks{0};
  std::size_t sink_failures{0};
};

// Drives one session at the configured tick rate with a fixed operator
// input. The wall clock paces the loop only; each step advances the physics
// by the session's fixed time step.
class Runner {
 public:
  Runner(const SimulatorConfig& config, std::shared_ptr<Session> session);

  RunnerStats run_for_ticks(std::size_t total_ticks);

  void set_operator_input(double fire_intensity, bool ai_mode) noexcept;

 private:
  void publish_sinks(const StepResult& result, RunnerStats& stats);
  void record_failed_step(const std::exception& ex, RunnerStats& stats);

  std::shared_ptr<Session> session_;
  std::chrono::milliseconds tick_interval_{};
  std::optional<std::chrono::steady_clock::time_point> next_wakeup_{};
  double fire_intensity_{0.0};
  bool ai_mode_{false};
  bool publish_stdout_{true};
  bool last_step_failed_{false};

  sinks::StdoutDebugSink stdout_sink_{};
  std::unique_ptr<sinks::RedisTsSink> redis_sink_{};
  bool redis_was_ok_{true};
};

}  // namespace boiler_twin::core
