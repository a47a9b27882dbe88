#include "core/session_registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace boiler_twin::core {

SessionRegistry::SessionRegistry(SessionOptions defaults, std::shared_ptr<const forecast::ForecastEngine> engine)
    : defaults_(std::move(defaults)), engine_(std::move(engine)) {}

std::shared_ptr<Session> SessionRegistry::get_or_create(const std::string& id) {
  if (id.empty()) {
    throw std::invalid_argument("session id must not be empty");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(id);
  if (it != sessions_.end()) {
    return it->second;
  }

  auto session = std::make_shared<Session>(id, defaults_, engine_);
  sessions_.emplace(id, session);
  return session;
}

std::shared_ptr<Session> SessionRegistry::find(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

bool SessionRegistry::erase(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.erase(id) > 0;
}

std::vector<std::string> SessionRegistry::ids() const {
  std::vector<std::string> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out.reserve(sessions_.size());
    for (const auto& [id, _] : sessions_) {
      out.push_back(id);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

const SessionOptions& SessionRegistry::defaults() const noexcept { return defaults_; }

const std::shared_ptr<const forecast::ForecastEngine>& SessionRegistry::engine() const noexcept { return engine_; }

}  // namespace boiler_twin::core
