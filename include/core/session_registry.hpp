#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/session.hpp"

namespace boiler_twin::core {

inline constexpr const char* kDefaultSessionId = "default";

class SessionRegistry {
 public:
  SessionRegistry(SessionOptions defaults, std::shared_ptr<const forecast::ForecastEngine> engine);

  // Creates the session with the registry defaults on first use.
  std::shared_ptr<Session> get_or_create(const std::string& id);
  [[nodiscard]] std::shared_ptr<Session> find(const std::string& id) const;
  bool erase(const std::string& id);
  [[nodiscard]] std::vector<std::string> ids() const;
  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] const SessionOptions& defaults() const noexcept;
  [[nodiscard]] const std::shared_ptr<const forecast::ForecastEngine>& engine() const noexcept;

 private:
  SessionOptions defaults_;
  std::shared_ptr<const forecast::ForecastEngine> engine_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions_{};
};

}  // namespace boiler_twin::core
