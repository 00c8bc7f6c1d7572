/**
 * @file IdentifierResolver.cpp
 * @brief Resolution of any disk identifier to a kernel name and device number
 */

#include "core/IdentifierResolver.hpp"

#include "util/Logger.hpp"
#include "util/Strings.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <utility>

namespace fs = std::filesystem;
namespace rng = std::ranges;

namespace diskinfo {

namespace {

constexpr uint32_t LOOP_MAJOR = 7;
constexpr std::string_view COMPONENT{"IdentifierResolver"};

auto all_digits(std::string_view text) -> bool {
    return !text.empty() &&
           rng::all_of(text, [](unsigned char c) { return std::isdigit(c) != 0; });
}

auto not_found(std::string_view device, std::string_view subject, std::string_view message)
    -> util::Error {
    return util::Error{util::ErrorKind::DEVICE_NOT_FOUND, std::string{device},
                       std::string{subject}, std::string{message}};
}

}  // namespace

auto is_nvme_namespace(std::string_view kernel_name) -> bool {
    if (!kernel_name.starts_with("nvme")) {
        return false;
    }
    const auto rest = kernel_name.substr(4);
    const auto n = rest.find('n');
    return n != std::string_view::npos && all_digits(rest.substr(0, n)) &&
           all_digits(rest.substr(n + 1));
}

auto DiskIdentifier::count() const -> int {
    return static_cast<int>(name.has_value()) + static_cast<int>(path.has_value()) +
           static_cast<int>(byid.has_value()) + static_cast<int>(bypath.has_value()) +
           static_cast<int>(serial.has_value()) + static_cast<int>(wwn.has_value());
}

auto DiskIdentifier::describe() const -> std::string {
    std::string text;
    auto append = [&text](std::string_view key, const std::optional<std::string>& value) {
        if (value) {
            if (!text.empty()) {
                text += ", ";
            }
            text += std::format("{}={}", key, *value);
        }
    };
    append("name", name);
    append("path", path);
    append("byid", byid);
    append("bypath", bypath);
    append("serial", serial);
    append("wwn", wwn);
    return text.empty() ? std::string{"<none>"} : text;
}

IdentifierResolver::IdentifierResolver(std::shared_ptr<const DeviceSources> sources)
    : sources_(std::move(sources)) {}

auto IdentifierResolver::resolve(const DiskIdentifier& identifier) const
    -> std::expected<ResolvedDevice, util::Error> {
    const auto count = identifier.count();
    if (count != 1) {
        return std::unexpected(util::make_error(
            util::ErrorKind::CONFIGURATION, {}, "identifier",
            "exactly one identifier must be given, got {} ({})", count, identifier.describe()));
    }

    if (identifier.name) {
        return resolve_name(*identifier.name);
    }
    if (identifier.path) {
        return resolve_path(*identifier.path);
    }
    if (identifier.byid) {
        return resolve_link_name(LinkScheme::BY_ID, *identifier.byid);
    }
    if (identifier.bypath) {
        return resolve_link_name(LinkScheme::BY_PATH, *identifier.bypath);
    }
    if (identifier.serial) {
        return resolve_by_property("ID_SERIAL_SHORT", "device/serial", *identifier.serial);
    }
    return resolve_by_property("ID_WWN", "device/wwid", *identifier.wwn);
}

auto IdentifierResolver::resolve_name(std::string_view kernel_name) const
    -> std::expected<ResolvedDevice, util::Error> {
    if (!sources_->sysfs->device_exists(kernel_name)) {
        return std::unexpected(not_found(kernel_name, "name", "no such block device"));
    }

    // The device exists from here on; a bad "dev" is a read failure, not a lookup miss
    auto dev = sources_->sysfs->read_attribute(kernel_name, "dev");
    if (!dev) {
        return std::unexpected(dev.error().as(util::ErrorKind::ATTRIBUTE_READ, "dev"));
    }
    if (!*dev) {
        return std::unexpected(util::Error{util::ErrorKind::ATTRIBUTE_READ,
                                           std::string{kernel_name}, "dev",
                                           "device number not exposed"});
    }

    const auto id = DeviceId::parse(**dev);
    if (!id) {
        return std::unexpected(util::make_error(util::ErrorKind::ATTRIBUTE_READ, kernel_name,
                                                "dev", "malformed device number '{}'", **dev));
    }
    return ResolvedDevice{.kernel_name = std::string{kernel_name}, .device_id = *id};
}

auto IdentifierResolver::resolve_path(std::string_view path) const
    -> std::expected<ResolvedDevice, util::Error> {
    // Device nodes may themselves be links (e.g. /dev/disk/by-id/... given as a path)
    if (auto target = sources_->udev->resolve_link(fs::path{path})) {
        return resolve_name(*target);
    }
    const auto name = fs::path{path}.filename().string();
    if (name.empty()) {
        return std::unexpected(not_found(path, "path", "path has no device name"));
    }
    return resolve_name(name);
}

auto IdentifierResolver::resolve_link_name(LinkScheme scheme, std::string_view value) const
    -> std::expected<ResolvedDevice, util::Error> {
    const auto link = value.contains('/') ? fs::path{value}
                                          : sources_->udev->link_path(scheme, value);
    const auto target = sources_->udev->resolve_link(link);
    if (!target) {
        return std::unexpected(not_found(value, link_scheme_dir(scheme), "no such link"));
    }
    return resolve_name(*target);
}

auto IdentifierResolver::resolve_by_property(std::string_view property,
                                             std::string_view sysfs_fallback,
                                             std::string_view value) const
    -> std::expected<ResolvedDevice, util::Error> {
    const auto wanted = util::trim(value);
    auto names = sources_->sysfs->list_disks();
    if (!names) {
        return std::unexpected(names.error().as(util::ErrorKind::DEVICE_NOT_FOUND, property));
    }

    for (const auto& name : *names) {
        auto device = resolve_name(name);
        if (!device) {
            LOG_DEBUG(COMPONENT, std::format("Skipping {}: {}", name, device.error().what()));
            continue;
        }

        std::optional<std::string> candidate;
        if (auto props = sources_->udev->read_properties(device->device_id); props && *props) {
            if (const auto it = (*props)->find(property); it != (*props)->end()) {
                candidate = it->second;
            }
        }
        if (!candidate) {
            if (auto text = sources_->sysfs->read_attribute(name, sysfs_fallback); text) {
                candidate = *text;
            }
        }

        if (candidate && util::trim(*candidate) == wanted) {
            return device;
        }
    }
    return std::unexpected(not_found(value, property, "no disk with this value"));
}

auto IdentifierResolver::classify(const ResolvedDevice& device) const -> DiskType {
    std::optional<std::string> rotational;
    auto text = sources_->sysfs->read_attribute(device.kernel_name, "queue/rotational");
    if (text) {
        rotational = *text;
    } else {
        LOG_DEBUG(COMPONENT, std::format("{}: {}", device.kernel_name, text.error().what()));
    }
    return classify(device.kernel_name, device.device_id, rotational);
}

auto IdentifierResolver::classify(std::string_view kernel_name, const DeviceId& id,
                                  const std::optional<std::string>& rotational) -> DiskType {
    if (id.major == LOOP_MAJOR || kernel_name.starts_with("loop")) {
        return DiskType::LOOP;
    }
    if (is_nvme_namespace(kernel_name)) {
        return DiskType::NVME;
    }
    if (rotational) {
        const auto flag = util::trim(*rotational);
        if (flag == "1") {
            return DiskType::HDD;
        }
        if (flag == "0") {
            return DiskType::SSD;
        }
    }
    return DiskType::OTHER;
}

auto IdentifierResolver::collect_links(LinkScheme scheme, std::string_view kernel_name) const
    -> std::vector<std::string> {
    std::vector<std::string> links;
    for (const auto& link : sources_->udev->list_links(scheme)) {
        const auto target = sources_->udev->resolve_link(link);
        if (!target || *target != kernel_name) {
            continue;
        }
        auto text = link.string();
        if (rng::find(links, text) == links.end()) {
            links.push_back(std::move(text));
        }
    }
    return links;
}

}  // namespace diskinfo
