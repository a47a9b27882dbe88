#pragma once

#include <chrono>
#include <cstdint>

namespace boiler_twin::core {

// Wall-clock stamp for published telemetry only; physics never reads it.
inline std::uint64_t unix_timestamp_now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

}  // namespace boiler_twin::core
