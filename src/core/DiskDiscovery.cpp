/**
 * @file DiskDiscovery.cpp
 * @brief Enumeration of all disks with type filtering and ordering
 */

#include "core/DiskDiscovery.hpp"

#include "util/Logger.hpp"

#include <algorithm>
#include <format>
#include <functional>
#include <utility>

namespace rng = std::ranges;

namespace diskinfo {

namespace {

constexpr std::string_view COMPONENT{"DiskDiscovery"};

}  // namespace

void sort_disks(std::vector<Disk>& disks, bool reverse) {
    if (reverse) {
        rng::stable_sort(disks, std::greater<>{});
    } else {
        rng::stable_sort(disks, std::less<>{});
    }
}

DiskDiscovery::DiskDiscovery(std::shared_ptr<const DeviceSources> sources)
    : builder_(sources), sources_(std::move(sources)) {}

auto DiskDiscovery::discover(const DiscoveryOptions& options) const
    -> std::expected<std::vector<Disk>, util::Error> {
    auto names = sources_->sysfs->list_disks();
    if (!names) {
        LOG_ERROR(COMPONENT, names.error().what());
        return std::unexpected(names.error());
    }

    const auto& resolver = builder_.resolver();
    std::vector<Disk> disks;
    for (const auto& name : *names) {
        auto device = resolver.resolve_name(name);
        if (!device) {
            LOG_WARNING(COMPONENT, std::format("Skipping {}: {}", name, device.error().what()));
            continue;
        }

        const auto type = resolver.classify(*device);
        if (!options.filter.accepts(type)) {
            LOG_DEBUG(COMPONENT, std::format("Filtered out {} ({})", name, disk_type_name(type)));
            continue;
        }

        auto disk = builder_.build(*device, type);
        if (!disk) {
            LOG_WARNING(COMPONENT, std::format("Skipping {}: {}", name, disk.error().what()));
            continue;
        }
        disks.push_back(std::move(*disk));
    }

    if (options.sort) {
        sort_disks(disks, options.reverse);
    }

    LOG_INFO(COMPONENT, std::format("Discovered {} disk(s) of {} device(s) (include={}, exclude={})",
                                    disks.size(), names->size(), options.filter.include.to_string(),
                                    options.filter.exclude.to_string()));
    return disks;
}

auto DiskInfo::create(std::shared_ptr<const DeviceSources> sources)
    -> std::expected<DiskInfo, util::Error> {
    const DiskDiscovery discovery{std::move(sources)};
    auto disks = discovery.discover(DiscoveryOptions{.filter = {.include = DiskTypeSet::all()}});
    if (!disks) {
        return std::unexpected(disks.error());
    }
    return DiskInfo{std::move(*disks)};
}

auto DiskInfo::get_disk_number(const DiskTypeFilter& filter) const -> std::size_t {
    return static_cast<std::size_t>(rng::count_if(
        disks_, [&filter](const Disk& disk) { return filter.accepts(disk.get_type()); }));
}

auto DiskInfo::get_disk_list(const DiskTypeFilter& filter, bool sorting, bool rev_order) const
    -> std::vector<Disk> {
    std::vector<Disk> result;
    for (const auto& disk : disks_) {
        if (filter.accepts(disk.get_type())) {
            result.push_back(disk);
        }
    }
    if (sorting) {
        sort_disks(result, rev_order);
    }
    return result;
}

auto DiskInfo::contains(std::string_view serial_number) const -> bool {
    return rng::any_of(disks_, [serial_number](const Disk& disk) {
        const auto& serial = disk.get_serial_number();
        return serial.is_present() && serial.value() == serial_number;
    });
}

}  // namespace diskinfo
