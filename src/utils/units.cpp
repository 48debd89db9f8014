/**
 * @file units.cpp
 * @brief Conversions between byte counts / durations and their human-readable form.
 *
 * Used for the --chunk-size option, the indexing summary and the progress line.
 */

#include "units.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <utility>

/**
 * @brief Converts a byte count to a short string with the largest fitting unit.
 *
 * The numeric part is kept below 4096, so 3Mb prints as "3072Kb" and 4Mb as "4Mb".
 *
 * @param size Size in bytes.
 * @param default_unit Suffix used when no unit applies (e.g. " bytes").
 * @param min_unit Smallest unit divisor to report in (1, 1024, ...).
 * @return Formatted string.
 */
std::string bytes2human(uint64_t size, const char* default_unit, uint64_t min_unit){
    static const std::array<const char*, 5> units { "", "Kb", "Mb", "Gb", "Tb" };

    size_t i = 0;
    for( ; min_unit > 1; min_unit /= 1024 ){
        size /= 1024;
        i++;
    }
    while( i < units.size()-1 && size >= 4096 ){
        size /= 1024;
        i++;
    }
    return std::to_string(size) + (i == 0 ? default_unit : units[i]);
}

/**
 * @brief Parses a size such as "64k", "1Mb", "2GB", "0x1000" or "4096".
 *
 * Units are binary and case-insensitive, the trailing 'b' is optional.
 *
 * @param size Size string.
 * @return Size in bytes.
 * @throws std::runtime_error On an unknown unit, a missing number or overflow.
 */
uint64_t human2bytes(const std::string& size) {
    static const std::array<std::pair<const char*, uint64_t>, 4> units {{
        {"kb", 1ULL << 10},
        {"mb", 1ULL << 20},
        {"gb", 1ULL << 30},
        {"tb", 1ULL << 40},
    }};

    if (size.length() > 2 && size[0] == '0' && (size[1]|0x20) == 'x') {
        return std::stoull(size, nullptr, 16);
    }

    size_t ndigits = 0;
    while (ndigits < size.length() && isdigit(static_cast<unsigned char>(size[ndigits]))) {
        ndigits++;
    }
    if (ndigits == 0) {
        throw std::runtime_error("Invalid size: \"" + size + "\"");
    }

    std::string unit = size.substr(ndigits);
    std::transform(unit.begin(), unit.end(), unit.begin(), [](unsigned char c){ return std::tolower(c); });
    if (unit.size() == 1 && unit != "b")
        unit += 'b';

    uint64_t multiplier = 1;
    if (!unit.empty() && unit != "b") {
        auto it = std::find_if(units.begin(), units.end(), [&](const auto& u){ return unit == u.first; });
        if (it == units.end()) {
            throw std::runtime_error("Unsupported unit: " + unit);
        }
        multiplier = it->second;
    }

    const uint64_t number = std::stoull(size.substr(0, ndigits));
    const uint64_t result = number * multiplier;
    if (multiplier != 1 && result / multiplier != number) {
        throw std::runtime_error("Size out of range: " + size);
    }
    return result;
}

/**
 * @brief Formats a duration as e.g. "2d5h", "3m20s" or "0s".
 *
 * @param seconds Duration in seconds.
 * @param maxUnits Maximum number of units shown, counted from the largest non-zero one.
 * @return Formatted duration.
 */
std::string seconds2human(uint64_t seconds, size_t maxUnits) {
    static const std::array<std::pair<uint64_t, char>, 4> units {{
        {86400, 'd'},
        {3600,  'h'},
        {60,    'm'},
        {1,     's'},
    }};

    std::string result;
    size_t unitsAdded = 0;
    for (const auto& [div, suffix] : units) {
        if (unitsAdded >= maxUnits)
            break;
        if (seconds >= div || unitsAdded > 0) {
            result += std::to_string(seconds / div) + suffix;
            seconds %= div;
            unitsAdded++;
        }
    }
    return result.empty() ? "0s" : result;
}
