/**
 * @file HumanReadable.hpp
 * @brief Size and duration formatting in human-readable units
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace util {

/**
 * @enum SizeUnits
 * @brief Unit system for size_in_hrf()
 */
enum class SizeUnits {
    METRIC,  ///< kB, MB, GB... (powers of 1000)
    IEC,     ///< KiB, MiB, GiB... (powers of 1024)
    LEGACY   ///< KB, MB, GB... (powers of 1024)
};

/**
 * @enum TimeUnit
 * @brief Unit of the value passed to time_in_hrf()
 */
enum class TimeUnit { SECOND, MINUTE, HOUR, DAY, YEAR };

/**
 * @brief Scale a byte count to the largest fitting unit
 * @param bytes Number of bytes
 * @param units Unit system
 * @return Scaled value and unit name, e.g. {1.0, "TB"}
 */
[[nodiscard]] auto size_in_hrf(uint64_t bytes, SizeUnits units = SizeUnits::METRIC)
    -> std::pair<double, std::string>;

/**
 * @brief Scale a duration to the largest fitting unit (up to years)
 * @param value Duration value
 * @param unit Unit of value
 * @param short_format Use "h"/"d"/"yr" instead of "hour"/"day"/"year"
 * @return Scaled value and unit name, e.g. {271.5, "day"}
 */
[[nodiscard]] auto time_in_hrf(uint64_t value, TimeUnit unit = TimeUnit::SECOND,
                               bool short_format = false) -> std::pair<double, std::string>;

}  // namespace util
