#include "core/runner.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "core/errors.hpp"

namespace boiler_twin::core {

Runner::Runner(const SimulatorConfig& config, std::shared_ptr<Session> session)
    : session_(std::move(session)),
      tick_interval_(config.tick_interval),
      fire_intensity_(config.operator_input.fire_intensity),
      ai_mode_(config.operator_input.ai_mode),
      publish_stdout_(config.stdout_debug) {
  if (session_ == nullptr) {
    throw std::invalid_argument("runner requires a session");
  }

  if (config.redis.enabled) {
    sinks::RedisTsOptions options{};
    options.host = config.redis.host;
    options.port = config.redis.port;
    options.unix_socket = config.redis.unix_socket;
    options.password = config.redis.password;
    options.db = config.redis.db;
    options.key_prefix = config.redis.key_prefix;
    redis_sink_ = std::make_unique<sinks::RedisTsSink>(options);

    const std::string address =
        !options.unix_socket.empty() ? "unix://" + options.unix_socket : options.host + ':' + std::to_string(options.port);
    if (redis_sink_->check_connectivity()) {
      std::cerr << "[simulator] redis connectivity confirmed at " << address << '\n';
    } else {
      std::cerr << "[simulator] redis connectivity check failed at " << address << '\n';
    }
  }
}

RunnerStats Runner::run_for_ticks(const std::size_t total_ticks) {
  RunnerStats stats{};

  if (!next_wakeup_.has_value()) {
    next_wakeup_ = std::chrono::steady_clock::now();
  }

  for (std::size_t i = 0; total_ticks == 0 || i < total_ticks; ++i) {
    try {
      const StepResult result = session_->step(fire_intensity_, ai_mode_);
      if (last_step_failed_) {
        std::cerr << "[simulator] steps recovered\n";
        last_step_failed_ = false;
      }
      if (result.decision.intervened) {
        ++stats.interventions;
      }
      if (model::is_trip(result.state.status)) {
        ++stats.trip_ticks;
      }
      publish_sinks(result, stats);
    } catch (const DependencyUnavailable& ex) {
      record_failed_step(ex, stats);
    } catch (const std::invalid_argument& ex) {
      record_failed_step(ex, stats);
    }

    ++stats.ticks_executed;

    *next_wakeup_ += tick_interval_;
    std::this_thread::sleep_until(*next_wakeup_);
  }

  return stats;
}

void Runner::record_failed_step(const std::exception& ex, RunnerStats& stats) {
  ++stats.failed_steps;
  if (!last_step_failed_) {
    std::cerr << "[simulator] step failed: " << ex.what() << '\n';
    last_step_failed_ = true;
  }
}

void Runner::set_operator_input(const double fire_intensity, const bool ai_mode) noexcept {
  fire_intensity_ = fire_intensity;
  ai_mode_ = ai_mode;
}

void Runner::publish_sinks(const StepResult& result, RunnerStats& stats) {
  if (publish_stdout_) {
    stdout_sink_.publish(session_->id(), result);
  }

  if (redis_sink_ != nullptr) {
    const bool ok = redis_sink_->publish(session_->id(), result);
    if (!ok) {
      ++stats.sink_failures;
      if (redis_was_ok_) {
        std::cerr << "[redis] publish failed\n";
        redis_was_ok_ = false;
      }
    } else if (!redis_was_ok_) {
      std::cerr << "[redis] publish recovered\n";
      redis_was_ok_ = true;
    }
  }
}

}  // namespace boiler_twin::core
