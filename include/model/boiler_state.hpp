#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace boiler_twin::model {

enum class boiler_status : std::uint8_t {
    NORMAL = 0,
    WARNING = 1,
    LOW_LEVEL_TRIP = 2,
    HIGH_LEVEL_TRIP = 3,
    CRITICAL_PRESSURE = 4,
};

const char* to_string(boiler_status status) noexcept;

// Trip states persist until an explicit reset; they are classifications, not errors.
inline constexpr bool is_trip(const boiler_status status) noexcept {
    return status == boiler_status::LOW_LEVEL_TRIP || status == boiler_status::HIGH_LEVEL_TRIP ||
           status == boiler_status::CRITICAL_PRESSURE;
}

// One published view of the drum. Status and alarms are derived from the
// level and pressure of the same snapshot.
struct boiler_snapshot {
    std::uint64_t tick{0};

    double water_level{50.0};
    double pressure{10.0};
    double temperature{540.0};
    double fire_intensity{0.0};
    double steam_generation{0.0};

    boiler_status status{boiler_status::NORMAL};
    std::vector<std::string> alarms{};
};

} // namespace boiler_twin::model
