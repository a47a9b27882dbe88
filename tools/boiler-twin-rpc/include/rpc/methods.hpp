#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "core/session_registry.hpp"
#include "model/boiler_state.hpp"

namespace boiler_twin::rpc {

struct Method {
  std::string name;
  std::string description;
  std::function<nlohmann::json(const nlohmann::json&)> handler;
};

using MethodRegistry = std::unordered_map<std::string, Method>;

// simulate, reset, state, history, predict, close and health over the sessions in
// `registry`. Handlers throw std::invalid_argument for bad params and let
// core::DependencyUnavailable through.
MethodRegistry build_method_registry(std::shared_ptr<core::SessionRegistry> registry);

nlohmann::json snapshot_to_json(const model::boiler_snapshot& snapshot);

}  // namespace boiler_twin::rpc
