#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace boiler_twin::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string lowercase(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& value) {
  const std::string lower = lowercase(value);
  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

double parse_double(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be a number, got '" + value + "'");
  }
  if (consumed != value.size() || !std::isfinite(parsed)) {
    throw std::runtime_error(key + " must be a finite number, got '" + value + "'");
  }
  return parsed;
}

double parse_positive(const std::string& key, const std::string& value) {
  const double parsed = parse_double(key, value);
  if (parsed <= 0.0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return parsed;
}

double parse_percent(const std::string& key, const std::string& value) {
  const double parsed = parse_double(key, value);
  if (parsed < 0.0 || parsed > 100.0) {
    throw std::runtime_error(key + " must be in range 0..100");
  }
  return parsed;
}

std::size_t parse_count(const std::string& key, const std::string& value) {
  const double parsed = parse_double(key, value);
  if (parsed < 1.0 || std::floor(parsed) != parsed) {
    throw std::runtime_error(key + " must be a positive integer");
  }
  return static_cast<std::size_t>(parsed);
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const double parsed_port = parse_double("redis.address port", value.substr(split + 1));
  if (parsed_port < 1.0 || parsed_port > 65535.0 || std::floor(parsed_port) != parsed_port) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }

  redis.port = static_cast<std::uint16_t>(parsed_port);
}

bool apply_physics_key(physics::PhysicsParams& physics, const std::string& key, const std::string& value) {
  const std::string name = key.substr(std::string("physics.").size());

  if (name == "feedwater_inflow") {
    physics.feedwater_inflow = parse_double(key, value);
  } else if (name == "steam_conversion_factor") {
    physics.steam_conversion_factor = parse_double(key, value);
  } else if (name == "pressure_build_rate") {
    physics.pressure_build_rate = parse_double(key, value);
  } else if (name == "pressure_decay_rate") {
    physics.pressure_decay_rate = parse_double(key, value);
  } else if (name == "max_pressure") {
    physics.max_pressure = parse_positive(key, value);
  } else if (name == "nominal_interval_s") {
    physics.nominal_interval_s = parse_positive(key, value);
  } else if (name == "critical_pressure") {
    physics.limits.critical_pressure = parse_double(key, value);
  } else if (name == "min_water_level") {
    physics.limits.min_water_level = parse_percent(key, value);
  } else if (name == "max_water_level") {
    physics.limits.max_water_level = parse_percent(key, value);
  } else if (name == "warning_water_level") {
    physics.limits.warning_water_level = parse_percent(key, value);
  } else if (name == "warning_pressure") {
    physics.limits.warning_pressure = parse_double(key, value);
  } else {
    return false;
  }
  return true;
}

void apply_key_value(SimulatorConfig& config, const std::string& key, const std::string& value) {
  if (key == "tick_rate_hz") {
    const auto hz = parse_count(key, value);
    if (hz > 1000) {
      throw std::runtime_error("tick_rate_hz must be less than or equal to 1000");
    }

    config.tick_interval = std::chrono::milliseconds(1000 / static_cast<std::int64_t>(hz));
    return;
  }

  if (key == "physics.time_step_s") {
    config.time_step_s = parse_positive(key, value);
    return;
  }

  if (key.rfind("physics.", 0) == 0) {
    if (!apply_physics_key(config.physics, key, value)) {
      throw std::runtime_error("unknown config key: " + key);
    }
    return;
  }

  if (key == "initial.water_level") {
    config.initial.water_level = parse_percent(key, value);
    return;
  }

  if (key == "initial.pressure") {
    config.initial.pressure = parse_double(key, value);
    if (config.initial.pressure < 0.0) {
      throw std::runtime_error("initial.pressure must be greater than or equal to 0");
    }
    return;
  }

  if (key == "initial.temperature") {
    config.initial.temperature = parse_double(key, value);
    return;
  }

  if (key == "forecast.window_length") {
    config.forecast.window_length = parse_count(key, value);
    return;
  }

  if (key == "forecast.horizon") {
    config.forecast.horizon = parse_count(key, value);
    return;
  }

  if (key == "forecast.predict_timeout_ms") {
    const double timeout_ms = parse_double(key, value);
    if (timeout_ms < 0.0) {
      throw std::runtime_error("forecast.predict_timeout_ms must be greater than or equal to 0");
    }
    config.forecast.predict_timeout = std::chrono::milliseconds(static_cast<std::int64_t>(timeout_ms));
    return;
  }

  if (key == "forecast.normalizer_path") {
    config.forecast.normalizer_path = unquote(value);
    return;
  }

  if (key == "forecast.predictor_path") {
    config.forecast.predictor_path = unquote(value);
    return;
  }

  if (key == "supervisor.danger_temp_c") {
    config.supervisor.danger_temp_c = parse_double(key, value);
    return;
  }

  if (key == "supervisor.safe_fire_limit") {
    config.supervisor.safe_fire_limit = parse_percent(key, value);
    return;
  }

  if (key == "supervisor.placeholder_valve") {
    config.supervisor.mapping.placeholder_valve = parse_double(key, value);
    return;
  }

  if (key == "supervisor.fire_to_flow_scale") {
    config.supervisor.mapping.fire_to_flow_scale = parse_positive(key, value);
    return;
  }

  if (key == "supervisor.decision_basis") {
    try {
      config.supervisor.basis = supervisor::parse_decision_basis(lowercase(unquote(value)));
    } catch (const std::invalid_argument& ex) {
      throw std::runtime_error(std::string("supervisor.decision_basis: ") + ex.what());
    }
    return;
  }

  if (key == "operator.fire_intensity") {
    config.operator_input.fire_intensity = parse_percent(key, value);
    return;
  }

  if (key == "operator.ai_mode") {
    config.operator_input.ai_mode = parse_bool(value);
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, unquote(value));
    return;
  }

  if (key == "redis.password") {
    config.redis.password = unquote(value);
    return;
  }

  if (key == "redis.db") {
    const double db = parse_double(key, value);
    if (db < 0.0 || db > 15.0 || std::floor(db) != db) {
      throw std::runtime_error("redis.db must be an integer in range 0..15");
    }
    config.redis.db = static_cast<int>(db);
    return;
  }

  if (key == "redis.key_prefix") {
    config.redis.key_prefix = unquote(value);
    if (config.redis.key_prefix.empty()) {
      throw std::runtime_error("redis.key_prefix must not be empty");
    }
    return;
  }

  throw std::runtime_error("unknown config key: " + key);
}

void validate(const SimulatorConfig& config) {
  const auto& limits = config.physics.limits;
  if (limits.min_water_level >= limits.max_water_level) {
    throw std::runtime_error("physics.min_water_level must be less than physics.max_water_level");
  }
  if (limits.critical_pressure > config.physics.max_pressure) {
    throw std::runtime_error("physics.critical_pressure must not exceed physics.max_pressure");
  }
  if (!std::isfinite(config.time_step_s / config.physics.nominal_interval_s)) {
    throw std::runtime_error("physics.time_step_s is too large for physics.nominal_interval_s");
  }
  if (config.initial.pressure > config.physics.max_pressure) {
    throw std::runtime_error("initial.pressure must not exceed physics.max_pressure");
  }
}

}  // namespace

SimulatorConfig load_simulator_config(const std::string& path) {
  SimulatorConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    } else if (sections.size() < depth) {
      throw std::runtime_error("unexpected indentation before key: " + key);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate(config);
  return config;
}

}  // namespace boiler_twin::core
