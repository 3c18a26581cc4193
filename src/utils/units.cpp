/**
 * @file units.cpp
 * @brief Human-readable sizes and durations for log lines and progress output.
 */

#include "units.hpp"

#include <array>
#include <utility>

/**
 * @brief Converts bytes to a string with a unit keeping the number below 4096.
 *
 * @param size Size in bytes.
 * @param default_unit Suffix for plain byte counts (e.g. " bytes").
 * @return e.g. "15Mb", "2048 bytes".
 */
std::string bytes2human(uint64_t size, const char* default_unit){
    static const std::array<const char*, 5> units { "", "Kb", "Mb", "Gb", "Tb" };

    size_t i = 0;
    while( i < units.size()-1 && size >= 4096 ){
        i++;
        size /= 1024;
    }
    return std::to_string(size) + (i == 0 ? default_unit : units[i]);
}

// 3725 -> "1h2m" with max_units = 2
std::string seconds2human(uint64_t seconds, size_t max_units) {
    static const std::array<std::pair<uint64_t, const char*>, 4> units {{
        {86400, "d"}, {3600, "h"}, {60, "m"}, {1, "s"}
    }};

    std::string result;
    size_t added = 0;
    for( const auto& [div, suffix] : units ){
        if( added >= max_units ){
            break;
        }
        const uint64_t amount = seconds / div;
        seconds %= div;
        if( amount > 0 || added > 0 ){
            result += std::to_string(amount) + suffix;
            ++added;
        }
    }

    return result.empty() ? "0s" : result;
}
