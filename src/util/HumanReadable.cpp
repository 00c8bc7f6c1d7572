/**
 * @file HumanReadable.cpp
 * @brief Size and duration formatting implementation
 */

#include "util/HumanReadable.hpp"

#include <array>
#include <cstddef>
#include <string_view>

namespace util {

namespace {

constexpr std::array<std::string_view, 7> METRIC_UNITS{"B", "kB", "MB", "GB", "TB", "PB", "EB"};
constexpr std::array<std::string_view, 7> IEC_UNITS{"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};
constexpr std::array<std::string_view, 7> LEGACY_UNITS{"B", "KB", "MB", "GB", "TB", "PB", "EB"};

constexpr std::array<std::string_view, 5> TIME_LONG_UNITS{"second", "minute", "hour", "day",
                                                          "year"};
constexpr std::array<std::string_view, 5> TIME_SHORT_UNITS{"s", "min", "h", "d", "yr"};
constexpr std::array<double, 4> TIME_DIVIDERS{60.0, 60.0, 24.0, 365.0};

}  // namespace

auto size_in_hrf(uint64_t bytes, SizeUnits units) -> std::pair<double, std::string> {
    const double divider = units == SizeUnits::METRIC ? 1000.0 : 1024.0;

    auto size = static_cast<double>(bytes);
    std::size_t index = 0;
    while (index + 1 < METRIC_UNITS.size() && size >= divider) {
        size /= divider;
        ++index;
    }

    switch (units) {
        case SizeUnits::METRIC:
            return {size, std::string{METRIC_UNITS[index]}};
        case SizeUnits::IEC:
            return {size, std::string{IEC_UNITS[index]}};
        case SizeUnits::LEGACY:
            return {size, std::string{LEGACY_UNITS[index]}};
    }
    return {size, std::string{METRIC_UNITS[index]}};
}

auto time_in_hrf(uint64_t value, TimeUnit unit, bool short_format)
    -> std::pair<double, std::string> {
    auto index = static_cast<std::size_t>(unit);
    auto scaled = static_cast<double>(value);

    while (index < TIME_DIVIDERS.size() && scaled >= TIME_DIVIDERS[index]) {
        scaled /= TIME_DIVIDERS[index];
        ++index;
    }

    const auto& names = short_format ? TIME_SHORT_UNITS : TIME_LONG_UNITS;
    return {scaled, std::string{names[index]}};
}

}  // namespace util
