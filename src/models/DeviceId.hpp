/**
 * @file DeviceId.hpp
 * @brief Kernel device number (major:minor)
 */

#pragma once

#include "util/Strings.hpp"

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace diskinfo {

/**
 * @struct DeviceId
 * @brief major:minor pair as exposed by the sysfs "dev" attribute
 */
struct DeviceId {
    uint32_t major = 0;
    uint32_t minor = 0;

    /**
     * @brief Parse "8:0" style text
     * @return DeviceId, or nullopt if the text is malformed
     */
    [[nodiscard]] static auto parse(std::string_view text) -> std::optional<DeviceId> {
        text = util::trim(text);
        const auto colon = text.find(':');
        if (colon == std::string_view::npos) {
            return std::nullopt;
        }
        const auto major = util::parse_number<uint32_t>(text.substr(0, colon));
        const auto minor = util::parse_number<uint32_t>(text.substr(colon + 1));
        if (!major || !minor) {
            return std::nullopt;
        }
        return DeviceId{.major = *major, .minor = *minor};
    }

    [[nodiscard]] auto to_string() const -> std::string {
        return std::format("{}:{}", major, minor);
    }

    auto operator==(const DeviceId&) const -> bool = default;
};

}  // namespace diskinfo
