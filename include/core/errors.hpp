#pragma once

#include <stdexcept>
#include <string>

namespace boiler_twin::core {

// A normalizer or predictor is missing, timed out, or produced a non-finite
// value. The step that raised it has not touched boiler state.
class DependencyUnavailable : public std::runtime_error {
 public:
  explicit DependencyUnavailable(const std::string& what) : std::runtime_error("dependency unavailable: " + what) {}
};

}  // namespace boiler_twin::core
