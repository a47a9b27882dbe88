#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "core/session.hpp"

struct redisContext;

namespace boiler_twin::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"boiler:twin"};
  std::uint32_t connect_timeout_ms{1000};
};

// Publishes one TS.MADD per simulation step under <key_prefix>:<session>:<metric>.
class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;
  RedisTsSink(RedisTsSink&&) noexcept;
  RedisTsSink& operator=(RedisTsSink&&) noexcept;

  bool check_connectivity();
  bool publish(const std::string& session_id, const core::StepResult& result);

  [[nodiscard]] static const std::vector<std::string>& metric_suffixes();

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool ensure_schema(const std::string& session_id);
  bool publish_impl(const std::string& session_id, const core::StepResult& result);
  void reserve_command_buffers();

  RedisTsOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  std::vector<std::string> schema_sessions_;
  bool timeseries_available_{true};
};

}  // namespace boiler_twin::sinks
