/**
 * @file DeviceSources.hpp
 * @brief Bundle of the data source adapters shared by all model objects
 */

#pragma once

#include "interfaces/ICommandRunner.hpp"
#include "interfaces/IPartitionEnumerator.hpp"
#include "interfaces/ISmartBackend.hpp"
#include "interfaces/ISysfsReader.hpp"
#include "interfaces/IUdevDatabase.hpp"
#include "models/Config.hpp"

#include <memory>
#include <string>

namespace diskinfo {

/**
 * @struct DeviceSources
 * @brief Read-only adapters a Disk and its Partitions query
 *
 * Disk objects hold a shared_ptr to the bundle so dynamic attributes can be
 * fetched after the builder is gone.
 */
struct DeviceSources {
    std::shared_ptr<ISysfsReader> sysfs;
    std::shared_ptr<IUdevDatabase> udev;
    std::shared_ptr<ISmartBackend> smart;
    std::shared_ptr<IPartitionEnumerator> partitions;
    std::filesystem::path dev_root{"/dev"};
    std::string text_encoding;  ///< Empty = locale charset
};

/**
 * @brief Wire the real sysfs, udev, smartctl and df adapters
 * @param config Paths and tool settings
 * @return Shared source bundle
 */
[[nodiscard]] auto make_system_sources(const Config& config)
    -> std::shared_ptr<const DeviceSources>;

}  // namespace diskinfo
