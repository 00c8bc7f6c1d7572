/**
 * @file IPartitionEnumerator.hpp
 * @brief Interface of the partition/filesystem enumeration source
 */

#pragma once

#include "interfaces/IUdevDatabase.hpp"
#include "models/DeviceId.hpp"
#include "util/Result.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace diskinfo {

/**
 * @struct PartitionRecord
 * @brief Raw per-partition data as reported by the enumeration source
 *
 * Text values are raw bytes; the partition builder decodes them.
 */
struct PartitionRecord {
    std::string kernel_name;              ///< e.g. "sda1"
    DeviceId device_id;
    std::optional<uint32_t> number;       ///< sysfs "partition"
    std::optional<uint64_t> start;        ///< sysfs "start", 512-byte units
    std::optional<uint64_t> size;         ///< sysfs "size", 512-byte units
    UdevProperties properties;            ///< ID_PART_ENTRY_* and ID_FS_* properties
    std::optional<util::Error> properties_error;  ///< Set when the udev record could not be read
    std::optional<uint64_t> free_size;    ///< Available 512-byte blocks, if mounted
    std::optional<std::string> mount_point;
};

/**
 * @class IPartitionEnumerator
 * @brief Abstract partition enumeration source
 */
class IPartitionEnumerator {
public:
    virtual ~IPartitionEnumerator() = default;

    /**
     * @brief Enumerate the partitions of a disk
     * @param disk_name Disk kernel name
     * @return Records (possibly empty), or a PARTITION_ENUMERATION error
     */
    [[nodiscard]] virtual auto enumerate(std::string_view disk_name)
        -> std::expected<std::vector<PartitionRecord>, util::Error> = 0;
};

}  // namespace diskinfo
