/**
 * @file SysfsReader.cpp
 * @brief sysfs-backed implementation of ISysfsReader
 */

#include "services/SysfsReader.hpp"

#include "util/FileDescriptor.hpp"
#include "util/Strings.hpp"

#include <algorithm>
#include <array>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
namespace rng = std::ranges;

namespace diskinfo {

namespace {

constexpr std::string_view CLASS_BLOCK_DIR{"class/block"};
constexpr std::string_view BLOCK_DIR{"block"};
constexpr std::string_view TEMPERATURE_INPUT{"temp1_input"};

// Locations of the hwmon directory relative to the device directory:
// drivetemp (SATA) registers under device/hwmon/hwmonN, nvme under device/hwmonN
// (the controller) or device/device/hwmonN for some kernels.
constexpr std::array HWMON_PARENTS{"device/hwmon", "device", "device/device"};

auto is_valid_kernel_name(std::string_view name) noexcept -> bool {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string_view::npos;
}

auto io_error(std::string_view device, const fs::path& path, const std::error_code& ec)
    -> util::Error {
    return util::Error{util::ErrorKind::IO, std::string{device}, path.string(), ec.message(),
                       ec.value()};
}

}  // namespace

SysfsReader::SysfsReader(fs::path sys_root) : sys_root_(std::move(sys_root)) {}

auto SysfsReader::device_dir(std::string_view kernel_name) const -> fs::path {
    return sys_root_ / CLASS_BLOCK_DIR / kernel_name;
}

auto SysfsReader::device_exists(std::string_view kernel_name) -> bool {
    if (!is_valid_kernel_name(kernel_name)) {
        return false;
    }
    std::error_code ec;
    return fs::is_directory(device_dir(kernel_name), ec);
}

auto SysfsReader::read_attribute(std::string_view kernel_name, std::string_view attribute)
    -> std::expected<std::optional<std::string>, util::Error> {
    if (!is_valid_kernel_name(kernel_name)) {
        return std::optional<std::string>{};
    }

    auto content = util::read_optional_file(device_dir(kernel_name) / attribute);
    if (!content) {
        auto err = content.error();
        err.device = std::string{kernel_name};
        return std::unexpected(std::move(err));
    }
    if (!*content) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{std::string{util::trim(**content)}};
}

auto SysfsReader::list_disks() -> std::expected<std::vector<std::string>, util::Error> {
    const auto block_dir = sys_root_ / BLOCK_DIR;
    std::vector<std::string> names;

    std::error_code ec;
    fs::directory_iterator it{block_dir, ec};
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return names;
        }
        return std::unexpected(io_error({}, block_dir, ec));
    }

    for (const auto& entry : it) {
        names.push_back(entry.path().filename().string());
    }
    return names;
}

auto SysfsReader::list_partitions(std::string_view disk_name)
    -> std::expected<std::vector<std::string>, util::Error> {
    std::vector<std::string> names;
    if (!is_valid_kernel_name(disk_name)) {
        return names;
    }

    const auto dir = device_dir(disk_name);
    std::error_code ec;
    fs::directory_iterator it{dir, ec};
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return names;
        }
        return std::unexpected(io_error(disk_name, dir, ec));
    }

    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec)) {
            continue;
        }
        // Partitions are the subdirectories that carry a "partition" number
        if (fs::exists(entry.path() / "partition", entry_ec)) {
            names.push_back(entry.path().filename().string());
        }
    }
    rng::sort(names);
    return names;
}

auto SysfsReader::read_hwmon_temperature(std::string_view kernel_name)
    -> std::expected<std::optional<std::string>, util::Error> {
    if (!is_valid_kernel_name(kernel_name)) {
        return std::optional<std::string>{};
    }

    const auto dir = device_dir(kernel_name);
    for (const auto* parent : HWMON_PARENTS) {
        const auto parent_dir = dir / parent;
        std::error_code ec;
        fs::directory_iterator it{parent_dir, ec};
        if (ec) {
            continue;
        }

        std::vector<fs::path> candidates;
        for (const auto& entry : it) {
            if (entry.path().filename().string().starts_with("hwmon")) {
                candidates.push_back(entry.path() / TEMPERATURE_INPUT);
            }
        }
        rng::sort(candidates);

        for (const auto& input : candidates) {
            auto content = util::read_optional_file(input);
            if (!content) {
                auto err = content.error();
                err.device = std::string{kernel_name};
                return std::unexpected(std::move(err));
            }
            if (*content) {
                return std::optional<std::string>{std::string{util::trim(**content)}};
            }
        }
    }
    return std::optional<std::string>{};
}

}  // namespace diskinfo
