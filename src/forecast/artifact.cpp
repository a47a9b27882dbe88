#include "forecast/artifact.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>

#include "forecast/feature_schema.hpp"

namespace boiler_twin::forecast {

nlohmann::json read_artifact(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open artifact: " + path);
  }

  nlohmann::json artifact;
  try {
    input >> artifact;
  } catch (const nlohmann::json::parse_error& ex) {
    throw std::runtime_error("malformed artifact " + path + ": " + ex.what());
  }

  if (!artifact.is_object()) {
    throw std::runtime_error("artifact " + path + " must be a JSON object");
  }
  return artifact;
}

void validate_schema(const nlohmann::json& artifact, const std::string& path) {
  const auto version_it = artifact.find("schema_version");
  if (version_it == artifact.end() || !version_it->is_number_unsigned() ||
      version_it->get<std::uint32_t>() != kSchemaVersion) {
    throw std::runtime_error("artifact " + path + ": schema_version must be " + std::to_string(kSchemaVersion));
  }

  const auto features_it = artifact.find("features");
  if (features_it == artifact.end() || !features_it->is_array()) {
    throw std::runtime_error("artifact " + path + ": features must be an array");
  }
  if (features_it->size() != kFeatureCount) {
    throw std::runtime_error("artifact " + path + ": expected " + std::to_string(kFeatureCount) + " features, found " +
                             std::to_string(features_it->size()));
  }

  for (std::size_t i = 0; i < kFeatureCount; ++i) {
    const auto& name = (*features_it)[i];
    if (!name.is_string() || name.get<std::string>() != kFeatureNames[i]) {
      throw std::runtime_error("artifact " + path + ": feature " + std::to_string(i) + " must be '" +
                               kFeatureNames[i] + "'");
    }
  }
}

}  // namespace boiler_twin::forecast
