/**
 * @file ISysfsReader.hpp
 * @brief Read-only access to the sysfs block device tree
 */

#pragma once

#include "util/Result.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace diskinfo {

/**
 * @class ISysfsReader
 * @brief Abstract interface over /sys/class/block and /sys/block
 *
 * A missing attribute file is normal absence (nullopt). Any other failure is
 * returned as an error so callers can tell the two apart.
 */
class ISysfsReader {
public:
    virtual ~ISysfsReader() = default;

    /**
     * @brief Check whether a block device (disk or partition) exists
     * @param kernel_name Kernel name (e.g. "sda", "nvme0n1p2")
     */
    [[nodiscard]] virtual auto device_exists(std::string_view kernel_name) -> bool = 0;

    /**
     * @brief Read an attribute file of a block device
     * @param kernel_name Kernel name
     * @param attribute Relative attribute path (e.g. "size", "queue/rotational")
     * @return Trimmed content, nullopt if absent, or an IO error
     */
    [[nodiscard]] virtual auto read_attribute(std::string_view kernel_name,
                                              std::string_view attribute)
        -> std::expected<std::optional<std::string>, util::Error> = 0;

    /**
     * @brief List whole-disk kernel names in kernel enumeration order
     */
    [[nodiscard]] virtual auto list_disks() -> std::expected<std::vector<std::string>, util::Error> = 0;

    /**
     * @brief List partition kernel names of a disk
     * @param disk_name Disk kernel name
     */
    [[nodiscard]] virtual auto list_partitions(std::string_view disk_name)
        -> std::expected<std::vector<std::string>, util::Error> = 0;

    /**
     * @brief Read the hwmon temperature input (millidegrees Celsius) of a device
     * @param kernel_name Disk kernel name
     * @return Raw sensor text, nullopt if the device has no hwmon sensor, or an IO error
     */
    [[nodiscard]] virtual auto read_hwmon_temperature(std::string_view kernel_name)
        -> std::expected<std::optional<std::string>, util::Error> = 0;
};

}  // namespace diskinfo
