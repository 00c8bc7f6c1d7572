/**
 * @file DiskDiscovery.hpp
 * @brief Enumeration of all disks with type filtering and ordering
 */

#pragma once

#include "core/DiskBuilder.hpp"
#include "models/Disk.hpp"
#include "models/DiskType.hpp"
#include "services/DeviceSources.hpp"

#include <cstddef>
#include <expected>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace diskinfo {

/**
 * @struct DiscoveryOptions
 * @brief Filter and ordering of a discovery run
 */
struct DiscoveryOptions {
    DiskTypeFilter filter;  ///< Default: include HDD, SSD, NVME
    bool sort = false;      ///< Sort by kernel name; otherwise enumeration order
    bool reverse = false;   ///< Reverse the sorted order
};

/**
 * @class DiskDiscovery
 * @brief Builds every disk listed under /sys/block that passes the filter
 *
 * Devices that fail to build are logged and skipped.
 */
class DiskDiscovery {
public:
    explicit DiskDiscovery(std::shared_ptr<const DeviceSources> sources);

    /**
     * @brief Discover disks
     * @return Disks, or an IO error if the disk list itself cannot be read
     */
    [[nodiscard]] auto discover(const DiscoveryOptions& options = {}) const
        -> std::expected<std::vector<Disk>, util::Error>;

private:
    DiskBuilder builder_;
    std::shared_ptr<const DeviceSources> sources_;
};

/**
 * @class DiskInfo
 * @brief Snapshot of all disks in the system with filtered views
 *
 * Every device class is discovered once at creation; the filters of the
 * query methods are applied to that snapshot.
 *
 * @example
 * ```cpp
 * auto info = DiskInfo::create(make_system_sources(Config{}));
 * for (const auto& disk : info->get_disk_list({}, true)) {
 *     std::cout << disk.get_name() << '\n';
 * }
 * ```
 */
class DiskInfo {
public:
    /**
     * @brief Discover all disks
     */
    [[nodiscard]] static auto create(std::shared_ptr<const DeviceSources> sources)
        -> std::expected<DiskInfo, util::Error>;

    explicit DiskInfo(std::vector<Disk> disks) : disks_(std::move(disks)) {}

    /**
     * @brief Number of disks passing a filter
     */
    [[nodiscard]] auto get_disk_number(const DiskTypeFilter& filter = {}) const -> std::size_t;

    /**
     * @brief Disks passing a filter
     * @param filter Type filter (default: HDD, SSD, NVME)
     * @param sorting Sort by kernel name
     * @param rev_order Reverse the sorted order
     */
    [[nodiscard]] auto get_disk_list(const DiskTypeFilter& filter = {}, bool sorting = false,
                                     bool rev_order = false) const -> std::vector<Disk>;

    /**
     * @brief Whether a disk with the given serial number is in the snapshot
     */
    [[nodiscard]] auto contains(std::string_view serial_number) const -> bool;

private:
    std::vector<Disk> disks_;
};

/**
 * @brief Sort disks by kernel name, optionally reversed
 */
void sort_disks(std::vector<Disk>& disks, bool reverse);

}  // namespace diskinfo
