#include "rpc/methods.hpp"

#include <cmath>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "core/math.hpp"

namespace boiler_twin::rpc {

namespace {

constexpr double kDefaultSeedTemperature = 538.0;

double required_number(const nlohmann::json& params, const char* key) {
  const auto it = params.find(key);
  if (it == params.end() || !it->is_number()) {
    throw std::invalid_argument(std::string(key) + " must be a number");
  }
  const double value = it->get<double>();
  if (!std::isfinite(value)) {
    throw std::invalid_argument(std::string(key) + " must be finite");
  }
  return value;
}

double optional_number(const nlohmann::json& params, const char* key, const double fallback) {
  if (params.find(key) == params.end()) {
    return fallback;
  }
  return required_number(params, key);
}

bool optional_bool(const nlohmann::json& params, const char* key, const bool fallback) {
  const auto it = params.find(key);
  if (it == params.end()) {
    return fallback;
  }
  if (!it->is_boolean()) {
    throw std::invalid_argument(std::string(key) + " must be a boolean");
  }
  return it->get<bool>();
}

std::string session_id(const nlohmann::json& params) {
  const auto it = params.find("session");
  if (it == params.end()) {
    return core::kDefaultSessionId;
  }
  if (!it->is_string() || it->get_ref<const std::string&>().empty()) {
    throw std::invalid_argument("session must be a non-empty string");
  }
  return it->get<std::string>();
}

std::shared_ptr<core::Session> existing_session(core::SessionRegistry& registry, const nlohmann::json& params) {
  const std::string id = session_id(params);
  auto session = registry.find(id);
  if (session == nullptr) {
    throw std::invalid_argument("unknown session: " + id);
  }
  return session;
}

nlohmann::json rounded_series(const std::vector<double>& values) {
  nlohmann::json out = nlohmann::json::array();
  for (const double value : values) {
    out.push_back(core::round2(value));
  }
  return out;
}

nlohmann::json step_to_json(const std::string& id, const core::StepResult& result) {
  const auto& state = result.state;
  const auto& decision = result.decision;

  return nlohmann::json{
      {"session", id},
      {"visual_state",
       {{"water_level", core::round2(state.water_level)},
        {"pressure", core::round2(state.pressure)},
        {"temperature", core::round2(state.temperature)},
        {"fire_intensity", core::round2(state.fire_intensity)},
        {"steam_generation", core::round2(state.steam_generation)}}},
      {"ai_data",
       {{"predicted_temp_avg", core::round2(decision.forecast.average)},
        {"predicted_temp_final", core::round2(decision.forecast.final_value)},
        {"predicted_temp_peak", core::round2(decision.forecast.peak)},
        {"predicted_temps_series", rounded_series(decision.forecast.series)},
        {"original_user_input", core::round2(decision.requested_input)},
        {"actual_system_input", core::round2(decision.effective_input)},
        {"intervention_active", decision.intervened},
        {"intervention_reason", decision.reason.value_or("")},
        {"ai_mode_enabled", result.ai_mode_enabled}}},
      {"status", model::to_string(state.status)},
      {"alarms", state.alarms},
  };
}

}  // namespace

nlohmann::json snapshot_to_json(const model::boiler_snapshot& snapshot) {
  return nlohmann::json{
      {"tick", snapshot.tick},
      {"water_level", core::round2(snapshot.water_level)},
      {"pressure", core::round2(snapshot.pressure)},
      {"temperature", core::round2(snapshot.temperature)},
      {"fire_intensity", core::round2(snapshot.fire_intensity)},
      {"steam_generation", core::round2(snapshot.steam_generation)},
      {"status", model::to_string(snapshot.status)},
      {"alarms", snapshot.alarms},
  };
}

MethodRegistry build_method_registry(std::shared_ptr<core::SessionRegistry> registry) {
  if (registry == nullptr) {
    throw std::invalid_argument("method registry requires a session registry");
  }

  MethodRegistry methods;

  methods.emplace("simulate", Method{
      .name = "simulate",
      .description = "Advance one supervised simulation step",
      .handler = [registry](const nlohmann::json& params) {
        const std::string id = session_id(params);
        const double requested = required_number(params, "user_fire_intensity");
        const bool ai_mode = optional_bool(params, "ai_mode_enabled", false);

        auto session = registry->get_or_create(id);
        const core::StepResult result = params.contains("dt")
                                            ? session->step(requested, ai_mode, required_number(params, "dt"))
                                            : session->step(requested, ai_mode);
        return step_to_json(id, result);
      }});

  methods.emplace("reset", Method{
      .name = "reset",
      .description = "Reset a session to the given or configured initial conditions",
      .handler = [registry](const nlohmann::json& params) {
        const auto& initial = registry->defaults().initial;
        auto session = registry->get_or_create(session_id(params));
        const auto snapshot = session->reset(optional_number(params, "water_level", initial.water_level),
                                             optional_number(params, "pressure", initial.pressure),
                                             optional_number(params, "temperature", initial.temperature));
        return nlohmann::json{{"status", "success"},
                              {"message", "Boiler simulation reset to initial state"},
                              {"initial_state", snapshot_to_json(snapshot)}};
      }});

  methods.emplace("state", Method{
      .name = "state",
      .description = "Current boiler state without advancing the simulation",
      .handler = [registry](const nlohmann::json& params) {
        const auto session = existing_session(*registry, params);
        return nlohmann::json{{"status", "success"}, {"state", snapshot_to_json(session->state())}};
      }});

  methods.emplace("history", Method{
      .name = "history",
      .description = "Recent tick snapshots, oldest first",
      .handler = [registry](const nlohmann::json& params) {
        const auto session = existing_session(*registry, params);
        const auto history = session->history();

        std::size_t start = 0;
        if (params.contains("limit")) {
          const auto& limit = params.at("limit");
          if (!limit.is_number_unsigned()) {
            throw std::invalid_argument("limit must be a non-negative integer");
          }
          const auto count = limit.get<std::size_t>();
          start = count < history.size() ? history.size() - count : 0;
        }

        nlohmann::json entries = nlohmann::json::array();
        for (std::size_t i = start; i < history.size(); ++i) {
          entries.push_back(snapshot_to_json(history[i]));
        }
        return nlohmann::json{{"history", entries}};
      }});

  methods.emplace("predict", Method{
      .name = "predict",
      .description = "Open-loop temperature forecast for fixed valve, pressure and flow",
      .handler = [registry](const nlohmann::json& params) {
        const double valve = required_number(params, "valve_open");
        if (valve < core::kPercentMin || valve > core::kPercentMax) {
          throw std::invalid_argument("valve_open must be in range 0..100");
        }
        const double pressure = required_number(params, "pressure");
        const double flow = required_number(params, "flow");

        const auto& engine = registry->engine();
        if (engine == nullptr) {
          throw core::DependencyUnavailable("forecast engine not configured");
        }
        const std::size_t horizon = registry->defaults().horizon;
        const auto result = engine->forecast({valve, pressure, flow}, kDefaultSeedTemperature, horizon);

        nlohmann::json time = nlohmann::json::array();
        for (std::size_t step = 1; step <= horizon; ++step) {
          time.push_back(step);
        }
        return nlohmann::json{{"time", time}, {"temperature", rounded_series(result.values())}};
      }});

  methods.emplace("close", Method{
      .name = "close",
      .description = "Drop a session and its history",
      .handler = [registry](const nlohmann::json& params) {
        if (!params.contains("session")) {
          throw std::invalid_argument("session is required");
        }
        const std::string id = session_id(params);
        if (!registry->erase(id)) {
          throw std::invalid_argument("unknown session: " + id);
        }
        std::cerr << "[rpc] closed session " << id << '\n';
        return nlohmann::json{{"status", "success"}, {"session", id}, {"open_sessions", registry->size()}};
      }});

  methods.emplace("health", Method{
      .name = "health",
      .description = "Dependency and session status",
      .handler = [registry](const nlohmann::json& /*params*/) {
        const auto& engine = registry->engine();
        const bool normalizer_loaded = engine != nullptr && engine->normalizer_loaded();
        const bool predictor_loaded = engine != nullptr && engine->predictor_loaded();
        return nlohmann::json{
            {"status", normalizer_loaded && predictor_loaded ? "healthy" : "unhealthy"},
            {"normalizer", {{"loaded", normalizer_loaded}}},
            {"predictor", {{"loaded", predictor_loaded}}},
            {"sessions", registry->ids()},
            {"config",
             {{"window_length", engine != nullptr ? engine->window_length() : 0},
              {"forecast_steps", registry->defaults().horizon}}},
        };
      }});

  return methods;
}

}  // namespace boiler_twin::rpc
