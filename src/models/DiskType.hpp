/**
 * @file DiskType.hpp
 * @brief Device class tags and the combinable filter set used by discovery
 */

#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace diskinfo {

/**
 * @enum DiskType
 * @brief Closed set of device classes
 *
 * Values are distinct bits so they can be combined in a DiskTypeSet.
 */
enum class DiskType : uint8_t {
    HDD = 1,    ///< Rotational disk
    SSD = 2,    ///< Non-rotational SATA/SCSI/USB disk
    NVME = 4,   ///< NVMe namespace
    LOOP = 8,   ///< Loop device
    OTHER = 16  ///< Anything without a usable rotational flag (ram, zram, md...)
};

/**
 * @brief Display name of a device class ("HDD", "SSD", "NVME", "LOOP", "OTHER")
 */
[[nodiscard]] constexpr auto disk_type_name(DiskType type) -> std::string_view {
    switch (type) {
        case DiskType::HDD:
            return "HDD";
        case DiskType::SSD:
            return "SSD";
        case DiskType::NVME:
            return "NVME";
        case DiskType::LOOP:
            return "LOOP";
        case DiskType::OTHER:
            return "OTHER";
    }
    return "OTHER";
}

/**
 * @brief Parse a device class name, case insensitive
 */
[[nodiscard]] auto parse_disk_type(std::string_view name) -> std::optional<DiskType>;

/**
 * @class DiskTypeSet
 * @brief Set of device classes
 */
class DiskTypeSet {
public:
    constexpr DiskTypeSet() = default;

    constexpr DiskTypeSet(std::initializer_list<DiskType> types) {
        for (const auto type : types) {
            bits_ |= static_cast<uint8_t>(type);
        }
    }

    /**
     * @brief Default discovery selection: HDD, SSD and NVMe
     */
    [[nodiscard]] static constexpr auto physical() -> DiskTypeSet {
        return DiskTypeSet{DiskType::HDD, DiskType::SSD, DiskType::NVME};
    }

    [[nodiscard]] static constexpr auto all() -> DiskTypeSet {
        return DiskTypeSet{DiskType::HDD, DiskType::SSD, DiskType::NVME, DiskType::LOOP,
                           DiskType::OTHER};
    }

    [[nodiscard]] constexpr auto contains(DiskType type) const -> bool {
        return (bits_ & static_cast<uint8_t>(type)) != 0;
    }

    [[nodiscard]] constexpr auto empty() const -> bool { return bits_ == 0; }

    constexpr auto insert(DiskType type) -> DiskTypeSet& {
        bits_ |= static_cast<uint8_t>(type);
        return *this;
    }

    [[nodiscard]] constexpr auto operator|(DiskTypeSet other) const -> DiskTypeSet {
        DiskTypeSet out;
        out.bits_ = static_cast<uint8_t>(bits_ | other.bits_);
        return out;
    }

    [[nodiscard]] constexpr auto operator&(DiskTypeSet other) const -> DiskTypeSet {
        DiskTypeSet out;
        out.bits_ = static_cast<uint8_t>(bits_ & other.bits_);
        return out;
    }

    /**
     * @brief Comma separated names of the members, e.g. "HDD,SSD"
     */
    [[nodiscard]] auto to_string() const -> std::string;

    /**
     * @brief Parse a comma separated list of names
     * @return Set, or nullopt if a name is unknown
     */
    [[nodiscard]] static auto parse(std::string_view list) -> std::optional<DiskTypeSet>;

    constexpr auto operator==(const DiskTypeSet&) const -> bool = default;

private:
    uint8_t bits_ = 0;
};

/**
 * @brief Type filter with inclusion and exclusion; exclusion wins on overlap
 */
struct DiskTypeFilter {
    DiskTypeSet include = DiskTypeSet::physical();
    DiskTypeSet exclude;

    [[nodiscard]] constexpr auto accepts(DiskType type) const -> bool {
        return include.contains(type) && !exclude.contains(type);
    }
};

}  // namespace diskinfo
