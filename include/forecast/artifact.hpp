#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace boiler_twin::forecast {

nlohmann::json read_artifact(const std::string& path);

// Checks "schema_version" and "features" against the compiled feature schema.
void validate_schema(const nlohmann::json& artifact, const std::string& path);

}  // namespace boiler_twin::forecast
