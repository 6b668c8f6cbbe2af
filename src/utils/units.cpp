/**
 * @file units.cpp
 * @brief Human-readable formatting of scan durations.
 */

#include "units.hpp"

#include <array>
#include <utility>

/**
 * @brief Converts seconds to a human-readable duration string.
 *
 * Starts at the largest non-zero unit (days, hours, minutes, seconds) and emits
 * at most maxUnits consecutive units, so 3h0m15s with maxUnits=2 is "3h0m".
 *
 * @param seconds Duration in seconds.
 * @param maxUnits Maximum number of units to display.
 * @return Duration string, "0s" for zero.
 */
std::string seconds2human(uint64_t seconds, size_t maxUnits) {
    static constexpr std::array<std::pair<uint64_t, char>, 4> units {{
        {86400, 'd'},
        {3600,  'h'},
        {60,    'm'},
        {1,     's'},
    }};

    std::string result;
    size_t nUnits = 0;
    for (const auto& [size, suffix] : units) {
        if (nUnits >= maxUnits) {
            break;
        }
        const uint64_t amount = seconds / size;
        seconds %= size;
        if (amount == 0 && nUnits == 0) {
            continue; // no leading zero units
        }
        result += std::to_string(amount);
        result += suffix;
        nUnits++;
    }

    return result.empty() ? "0s" : result;
}
