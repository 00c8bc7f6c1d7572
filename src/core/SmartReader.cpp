/**
 * @file SmartReader.cpp
 * @brief Temperature and SMART reads with device-class and power-state rules
 */

#include "core/SmartReader.hpp"

#include "util/Logger.hpp"
#include "util/Strings.hpp"

#include <format>
#include <utility>

namespace diskinfo {

namespace {

constexpr std::string_view COMPONENT{"SmartReader"};
constexpr double MILLIDEGREES_PER_DEGREE = 1000.0;

auto has_smart_transport(DiskType type) -> bool {
    return type == DiskType::HDD || type == DiskType::SSD || type == DiskType::NVME;
}

}  // namespace

SmartReader::SmartReader(std::shared_ptr<const DeviceSources> sources)
    : sources_(std::move(sources)) {}

auto SmartReader::read_temperature(const Disk& disk) const
    -> std::expected<std::optional<double>, util::Error> {
    switch (disk.get_type()) {
        case DiskType::HDD:
        case DiskType::SSD: {
            auto raw = sources_->sysfs->read_hwmon_temperature(disk.get_name());
            if (!raw) {
                return std::unexpected(
                    raw.error().as(util::ErrorKind::ATTRIBUTE_READ, "temperature"));
            }
            if (!*raw) {
                return std::optional<double>{};
            }
            const auto millidegrees = util::parse_number<int64_t>(**raw);
            if (!millidegrees) {
                return std::unexpected(util::make_error(util::ErrorKind::ATTRIBUTE_READ,
                                                        disk.get_name(), "temperature",
                                                        "unparsable sensor value '{}'", **raw));
            }
            return std::optional<double>{static_cast<double>(*millidegrees) /
                                         MILLIDEGREES_PER_DEGREE};
        }
        case DiskType::NVME: {
            const SmartQuery query{.device_path = disk.get_path(),
                                   .type = DiskType::NVME,
                                   .check_standby = false};
            auto report = sources_->smart->read(query);
            if (!report) {
                return std::unexpected(report.error());
            }
            auto celsius = report->nvme ? report->nvme->temperature : report->temperature;
            if (!celsius) {
                return std::optional<double>{};
            }
            return std::optional<double>{static_cast<double>(*celsius)};
        }
        case DiskType::LOOP:
        case DiskType::OTHER:
            break;
    }
    return std::optional<double>{};
}

auto SmartReader::read_smart(const Disk& disk, StandbyPolicy policy) const
    -> std::expected<SmartSnapshot, util::Error> {
    const auto type = disk.get_type();
    if (!has_smart_transport(type)) {
        return std::unexpected(util::make_error(util::ErrorKind::SMART_UNAVAILABLE,
                                                disk.get_name(), "smart",
                                                "no SMART transport for {} devices",
                                                disk_type_name(type)));
    }

    const SmartQuery query{.device_path = disk.get_path(),
                           .type = type,
                           .check_standby = policy == StandbyPolicy::CHECK &&
                                            type != DiskType::NVME};
    auto report = sources_->smart->read(query);
    if (!report) {
        LOG_WARNING(COMPONENT, report.error().what());
        return std::unexpected(report.error());
    }

    auto snapshot = to_snapshot(*report, type, policy);
    LOG_DEBUG(COMPONENT, std::format("{}: standby={} healthy={}", disk.get_name(),
                                     snapshot.standby_mode(), snapshot.healthy()));
    return snapshot;
}

auto SmartReader::to_snapshot(const SmartReport& report, DiskType type, StandbyPolicy policy)
    -> SmartSnapshot {
    const bool healthy = report.healthy.value_or(false);
    if (type == DiskType::NVME) {
        return SmartSnapshot::nvme(healthy, report.smart_capable, report.smart_enabled,
                                   report.nvme.value_or(NvmeAttributes{}));
    }
    if (report.standby && policy == StandbyPolicy::CHECK) {
        return SmartSnapshot::standby();
    }
    return SmartSnapshot::legacy(healthy, report.smart_capable, report.smart_enabled,
                                 report.attributes);
}

}  // namespace diskinfo
