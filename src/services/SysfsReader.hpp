/**
 * @file SysfsReader.hpp
 * @brief sysfs-backed implementation of ISysfsReader
 */

#pragma once

#include "interfaces/ISysfsReader.hpp"

#include <filesystem>

namespace diskinfo {

/**
 * @class SysfsReader
 * @brief Reads block device attributes from a sysfs tree
 *
 * Attributes are read from {sys_root}/class/block/{name}/, which covers
 * both disks and partitions. Disks are enumerated from {sys_root}/block.
 */
class SysfsReader : public ISysfsReader {
public:
    explicit SysfsReader(std::filesystem::path sys_root);
    ~SysfsReader() override = default;

    SysfsReader(const SysfsReader&) = delete;
    SysfsReader& operator=(const SysfsReader&) = delete;
    SysfsReader(SysfsReader&&) = default;
    SysfsReader& operator=(SysfsReader&&) = default;

    [[nodiscard]] auto device_exists(std::string_view kernel_name) -> bool override;

    [[nodiscard]] auto read_attribute(std::string_view kernel_name, std::string_view attribute)
        -> std::expected<std::optional<std::string>, util::Error> override;

    [[nodiscard]] auto list_disks() -> std::expected<std::vector<std::string>, util::Error> override;

    [[nodiscard]] auto list_partitions(std::string_view disk_name)
        -> std::expected<std::vector<std::string>, util::Error> override;

    [[nodiscard]] auto read_hwmon_temperature(std::string_view kernel_name)
        -> std::expected<std::optional<std::string>, util::Error> override;

private:
    [[nodiscard]] auto device_dir(std::string_view kernel_name) const -> std::filesystem::path;

    std::filesystem::path sys_root_;
};

}  // namespace diskinfo
