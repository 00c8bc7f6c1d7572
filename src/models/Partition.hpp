/**
 * @file Partition.hpp
 * @brief Data model of one partition of a disk
 */

#pragma once

#include "models/DeviceId.hpp"
#include "util/Attribute.hpp"
#include "util/HumanReadable.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace diskinfo {

/**
 * @enum FsUsage
 * @brief Usage classification reported for a partition's content
 */
enum class FsUsage {
    FILESYSTEM,  ///< Mountable filesystem
    OTHER        ///< swap, LVM PV, RAID member, crypto container...
};

[[nodiscard]] constexpr auto fs_usage_name(FsUsage usage) -> std::string_view {
    return usage == FsUsage::FILESYSTEM ? "filesystem" : "other";
}

/**
 * @struct PartitionData
 * @brief Attribute values collected by the partition builder
 */
struct PartitionData {
    std::string name;       ///< Kernel name (e.g. "sda1")
    std::string path;       ///< Device node path
    DeviceId device_id;
    std::string disk_name;  ///< Kernel name of the parent disk

    std::vector<std::string> byid_paths;
    util::Attribute<std::string> bypath_path;
    util::Attribute<std::string> bypartuuid_path;
    util::Attribute<std::string> bypartlabel_path;
    util::Attribute<std::string> byuuid_path;
    util::Attribute<std::string> bylabel_path;

    util::Attribute<std::string> part_scheme;
    util::Attribute<std::string> part_label;
    util::Attribute<std::string> part_uuid;
    util::Attribute<std::string> part_type;
    util::Attribute<uint32_t> part_number;
    util::Attribute<uint64_t> part_offset;  ///< 512-byte units
    util::Attribute<uint64_t> part_size;    ///< 512-byte units

    util::Attribute<std::string> fs_label;
    util::Attribute<std::string> fs_uuid;
    util::Attribute<std::string> fs_type;
    util::Attribute<std::string> fs_version;
    util::Attribute<FsUsage> fs_usage;
    util::Attribute<uint64_t> fs_free_size;  ///< 512-byte units
    util::Attribute<std::string> fs_mounting_point;

    auto operator==(const PartitionData&) const -> bool = default;
};

/**
 * @class Partition
 * @brief Immutable snapshot of one partition
 *
 * Built by PartitionBuilder from Disk::get_partition_list().
 */
class Partition {
public:
    explicit Partition(PartitionData data) : data_(std::move(data)) {}

    [[nodiscard]] auto get_name() const -> const std::string& { return data_.name; }
    [[nodiscard]] auto get_path() const -> const std::string& { return data_.path; }
    [[nodiscard]] auto get_device_id() const -> const DeviceId& { return data_.device_id; }
    [[nodiscard]] auto get_disk_name() const -> const std::string& { return data_.disk_name; }

    [[nodiscard]] auto get_byid_path() const -> const std::vector<std::string>& {
        return data_.byid_paths;
    }
    [[nodiscard]] auto get_bypath_path() const -> const util::Attribute<std::string>& {
        return data_.bypath_path;
    }
    [[nodiscard]] auto get_bypartuuid_path() const -> const util::Attribute<std::string>& {
        return data_.bypartuuid_path;
    }
    [[nodiscard]] auto get_bypartlabel_path() const -> const util::Attribute<std::string>& {
        return data_.bypartlabel_path;
    }
    [[nodiscard]] auto get_byuuid_path() const -> const util::Attribute<std::string>& {
        return data_.byuuid_path;
    }
    [[nodiscard]] auto get_bylabel_path() const -> const util::Attribute<std::string>& {
        return data_.bylabel_path;
    }

    [[nodiscard]] auto get_part_scheme() const -> const util::Attribute<std::string>& {
        return data_.part_scheme;
    }
    [[nodiscard]] auto get_part_label() const -> const util::Attribute<std::string>& {
        return data_.part_label;
    }
    [[nodiscard]] auto get_part_uuid() const -> const util::Attribute<std::string>& {
        return data_.part_uuid;
    }
    [[nodiscard]] auto get_part_type() const -> const util::Attribute<std::string>& {
        return data_.part_type;
    }
    [[nodiscard]] auto get_part_number() const -> const util::Attribute<uint32_t>& {
        return data_.part_number;
    }
    [[nodiscard]] auto get_part_offset() const -> const util::Attribute<uint64_t>& {
        return data_.part_offset;
    }
    [[nodiscard]] auto get_part_size() const -> const util::Attribute<uint64_t>& {
        return data_.part_size;
    }

    /**
     * @brief Partition size in human-readable form
     * @return Scaled size, or nullopt if the size is unknown
     */
    [[nodiscard]] auto get_part_size_in_hrf(util::SizeUnits units = util::SizeUnits::METRIC) const
        -> std::optional<std::pair<double, std::string>> {
        if (!data_.part_size) {
            return std::nullopt;
        }
        return util::size_in_hrf(data_.part_size.value() * SECTOR_SIZE, units);
    }

    [[nodiscard]] auto get_fs_label() const -> const util::Attribute<std::string>& {
        return data_.fs_label;
    }
    [[nodiscard]] auto get_fs_uuid() const -> const util::Attribute<std::string>& {
        return data_.fs_uuid;
    }
    [[nodiscard]] auto get_fs_type() const -> const util::Attribute<std::string>& {
        return data_.fs_type;
    }
    [[nodiscard]] auto get_fs_version() const -> const util::Attribute<std::string>& {
        return data_.fs_version;
    }
    [[nodiscard]] auto get_fs_usage() const -> const util::Attribute<FsUsage>& {
        return data_.fs_usage;
    }
    [[nodiscard]] auto get_fs_free_size() const -> const util::Attribute<uint64_t>& {
        return data_.fs_free_size;
    }

    /**
     * @brief Free filesystem space in human-readable form
     * @return Scaled size, or nullopt if the partition is not mounted
     */
    [[nodiscard]] auto get_fs_free_size_in_hrf(util::SizeUnits units = util::SizeUnits::METRIC) const
        -> std::optional<std::pair<double, std::string>> {
        if (!data_.fs_free_size) {
            return std::nullopt;
        }
        return util::size_in_hrf(data_.fs_free_size.value() * SECTOR_SIZE, units);
    }

    [[nodiscard]] auto get_fs_mounting_point() const -> const util::Attribute<std::string>& {
        return data_.fs_mounting_point;
    }

    [[nodiscard]] auto data() const -> const PartitionData& { return data_; }

    auto operator==(const Partition&) const -> bool = default;

private:
    static constexpr uint64_t SECTOR_SIZE = 512;

    PartitionData data_;
};

}  // namespace diskinfo
