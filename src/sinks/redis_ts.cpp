#include "sinks/redis_ts.hpp"

#include "core/timestamp.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace boiler_twin::sinks {
namespace {

constexpr std::size_t kMetricCount = 11;
constexpr std::size_t kMaxCommandArgCount = 1 + (kMetricCount * 3);

double sanitize_value(const double value) {
  return std::isfinite(value) ? value : 0.0;
}

std::string metric_key(const std::string& key_prefix, const std::string& session_id, const std::string& suffix) {
  return key_prefix + ":" + session_id + ":" + suffix;
}

}  // namespace

const std::vector<std::string>& RedisTsSink::metric_suffixes() {
  static const std::vector<std::string> kMetricSuffixes = {
      "state:water_level",
      "state:pressure",
      "state:temperature",
      "state:fire_intensity",
      "state:steam_generation",
      "state:status",
      "ai:requested_input",
      "ai:effective_input",
      "ai:intervened",
      "ai:predicted_final",
      "ai:predicted_avg",
  };
  return kMetricSuffixes;
}

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {
  reserve_command_buffers();
}

RedisTsSink::~RedisTsSink() = default;

RedisTsSink::RedisTsSink(RedisTsSink&&) noexcept = default;
RedisTsSink& RedisTsSink::operator=(RedisTsSink&&) noexcept = default;

bool RedisTsSink::check_connectivity() {
  return ensure_connected();
}

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisTsSink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }

  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsSink::reconnect() {
  context_.reset();
  schema_sessions_.clear();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate() || !select_db()) {
    context_.reset();
    return false;
  }

  return true;
}

bool RedisTsSink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] AUTH rejected\n";
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::select_db() {
  if (options_.db == 0) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::ensure_schema(const std::string& session_id) {
  if (std::find(schema_sessions_.begin(), schema_sessions_.end(), session_id) != schema_sessions_.end()) {
    return true;
  }

  for (const auto& suffix : metric_suffixes()) {
    const std::string key = metric_key(options_.key_prefix, session_id, suffix);
    redisReply* reply = static_cast<redisReply*>(
        redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST", key.c_str()));
    if (reply == nullptr) {
      return false;
    }

    const bool already_exists =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "already exists") != nullptr;
    const bool unknown_command =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "unknown command") != nullptr;
    const bool ok = reply->type != REDIS_REPLY_ERROR || already_exists;
    const std::string reply_message = reply->str != nullptr ? reply->str : "unknown";
    freeReplyObject(reply);

    if (unknown_command) {
      std::cerr << "[redis] RedisTimeSeries module not available (TS.CREATE unknown command)\n";
      timeseries_available_ = false;
      return false;
    }
    if (!ok) {
      std::cerr << "[redis] schema error on TS.CREATE " << key << ": " << reply_message << '\n';
      return false;
    }
  }

  schema_sessions_.push_back(session_id);
  return true;
}

bool RedisTsSink::publish(const std::string& session_id, const core::StepResult& result) {
  if (!ensure_connected()) {
    return false;
  }

  if (publish_impl(session_id, result)) {
    return true;
  }

  if (!reconnect()) {
    return false;
  }
  return publish_impl(session_id, result);
}

bool RedisTsSink::publish_impl(const std::string& session_id, const core::StepResult& result) {
  if (!ensure_schema(session_id)) {
    return false;
  }

  const std::string timestamp_ms = std::to_string(core::unix_timestamp_now_ms());
  const auto& state = result.state;
  const auto& decision = result.decision;

  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();
  command_args_.emplace_back("TS.MADD");

  const auto append_metric = [&](const char* suffix, const double value) {
    command_args_.emplace_back(metric_key(options_.key_prefix, session_id, suffix));
    command_args_.emplace_back(timestamp_ms);
    command_args_.emplace_back(std::to_string(sanitize_value(value)));
  };

  append_metric("state:water_level", state.water_level);
  append_metric("state:pressure", state.pressure);
  append_metric("state:temperature", state.temperature);
  append_metric("state:fire_intensity", state.fire_intensity);
  append_metric("state:steam_generation", state.steam_generation);
  append_metric("state:status", static_cast<double>(static_cast<std::uint8_t>(state.status)));
  append_metric("ai:requested_input", decision.requested_input);
  append_metric("ai:effective_input", decision.effective_input);
  append_metric("ai:intervened", decision.intervened ? 1.0 : 0.0);
  append_metric("ai:predicted_final", decision.forecast.final_value);
  append_metric("ai:predicted_avg", decision.forecast.average);

  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  redisReply* reply = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(),
                       command_argv_len_.data()));
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

void RedisTsSink::reserve_command_buffers() {
  command_args_.reserve(kMaxCommandArgCount);
  command_argv_.reserve(kMaxCommandArgCount);
  command_argv_len_.reserve(kMaxCommandArgCount);
}

}  // namespace boiler_twin::sinks
