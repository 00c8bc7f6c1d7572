/**
 * @file DeviceSources.cpp
 * @brief Wiring of the real data source adapters
 */

#include "services/DeviceSources.hpp"

#include "services/PartitionEnumerator.hpp"
#include "services/SmartctlBackend.hpp"
#include "services/SubprocessRunner.hpp"
#include "services/SysfsReader.hpp"
#include "services/UdevDatabase.hpp"

namespace diskinfo {

auto make_system_sources(const Config& config) -> std::shared_ptr<const DeviceSources> {
    auto runner = std::make_shared<SubprocessRunner>();
    auto sysfs = std::make_shared<SysfsReader>(config.paths.sys_root);
    auto udev = std::make_shared<UdevDatabase>(config.paths.dev_root);

    auto sources = std::make_shared<DeviceSources>();
    sources->sysfs = sysfs;
    sources->udev = udev;
    sources->smart = std::make_shared<SmartctlBackend>(runner, config.smart);
    sources->partitions = std::make_shared<PartitionEnumerator>(sysfs, udev, runner, config.df_path);
    sources->dev_root = config.paths.dev_root;
    sources->text_encoding = config.text_encoding;
    return sources;
}

}  // namespace diskinfo
