/**
 * @file UdevDatabase.cpp
 * @brief libudev implementation of IUdevDatabase
 */

#include "services/UdevDatabase.hpp"

#include "util/Logger.hpp"

#include <libudev.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <utility>

namespace fs = std::filesystem;
namespace rng = std::ranges;

namespace diskinfo {

namespace {

constexpr std::string_view COMPONENT{"UdevDatabase"};
constexpr std::string_view BLOCK_SUBSYSTEM{"block"};

#define DISKINFO_UDEV_UPTR(what)                                            \
    struct udev_##what##_deleter {                                          \
        void operator()(udev_##what* p) const { udev_##what##_unref(p); }   \
    };                                                                      \
    using udev_##what##_uptr = std::unique_ptr<udev_##what, udev_##what##_deleter>;

DISKINFO_UDEV_UPTR(enumerate)  // udev_enumerate_uptr
DISKINFO_UDEV_UPTR(device)     // udev_device_uptr

#undef DISKINFO_UDEV_UPTR

// libudev reports a device number without a sysfs entry with one of these
auto is_missing_device(int err) -> bool {
    return err == ENOENT || err == ENODEV || err == ENXIO;
}

auto udev_error(std::string_view device, std::string_view call, int err) -> util::Error {
    return util::Error{util::ErrorKind::IO, std::string{device}, "udev",
                       std::format("{} failed: {}", call, std::strerror(err)), err};
}

}  // namespace

void UdevContextDeleter::operator()(struct udev* context) const {
    udev_unref(context);
}

UdevDatabase::UdevDatabase(fs::path dev_root)
    : dev_root_(std::move(dev_root)), context_(udev_new()) {
    if (!context_) {
        LOG_WARNING(COMPONENT, std::format("udev_new failed: {}", std::strerror(errno)));
    }
}

auto UdevDatabase::list_links(LinkScheme scheme) -> std::vector<fs::path> {
    std::vector<fs::path> links;
    if (!context_) {
        return links;
    }

    udev_enumerate_uptr enumerate{udev_enumerate_new(context_.get())};
    if (!enumerate) {
        LOG_WARNING(COMPONENT, "udev_enumerate_new failed");
        return links;
    }
    int r = udev_enumerate_add_match_subsystem(enumerate.get(), BLOCK_SUBSYSTEM.data());
    if (r >= 0) {
        r = udev_enumerate_scan_devices(enumerate.get());
    }
    if (r < 0) {
        LOG_WARNING(COMPONENT, std::format("block device scan failed: {}", std::strerror(-r)));
        return links;
    }

    const auto scheme_dir = link_scheme_dir(scheme);
    struct udev_list_entry* entry = nullptr;
    udev_list_entry_foreach(entry, udev_enumerate_get_list_entry(enumerate.get())) {
        // Devices removed since the scan are skipped
        udev_device_uptr device{
            udev_device_new_from_syspath(context_.get(), udev_list_entry_get_name(entry))};
        if (!device) {
            continue;
        }

        struct udev_list_entry* devlink = nullptr;
        udev_list_entry_foreach(devlink, udev_device_get_devlinks_list_entry(device.get())) {
            const fs::path link{udev_list_entry_get_name(devlink)};
            const auto dir = link.parent_path();
            if (dir.filename().string() != scheme_dir ||
                dir.parent_path().filename().string() != "disk") {
                continue;
            }
            links.push_back(link_path(scheme, link.filename().string()));
        }
    }

    rng::sort(links, [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    const auto dup = rng::unique(links);
    links.erase(dup.begin(), dup.end());
    return links;
}

auto UdevDatabase::link_path(LinkScheme scheme, std::string_view name) -> fs::path {
    return dev_root_ / "disk" / link_scheme_dir(scheme) / name;
}

auto UdevDatabase::resolve_link(const fs::path& link) -> std::optional<std::string> {
    if (!context_) {
        return std::nullopt;
    }

    struct stat st{};
    if (::stat(link.c_str(), &st) != 0 || !S_ISBLK(st.st_mode)) {
        return std::nullopt;
    }

    udev_device_uptr device{udev_device_new_from_devnum(context_.get(), 'b', st.st_rdev)};
    if (!device) {
        return std::nullopt;
    }
    const char* sysname = udev_device_get_sysname(device.get());
    if (sysname == nullptr || *sysname == '\0') {
        return std::nullopt;
    }
    return std::string{sysname};
}

auto UdevDatabase::read_properties(const DeviceId& id)
    -> std::expected<std::optional<UdevProperties>, util::Error> {
    const auto device_name = id.to_string();
    if (!context_) {
        return std::unexpected(udev_error(device_name, "udev_new", ENOMEM));
    }

    errno = 0;
    udev_device_uptr device{
        udev_device_new_from_devnum(context_.get(), 'b', makedev(id.major, id.minor))};
    if (!device) {
        const int err = errno;
        if (err == 0 || is_missing_device(err)) {
            return std::optional<UdevProperties>{};
        }
        return std::unexpected(udev_error(device_name, "udev_device_new_from_devnum", err));
    }

    // Devices udev has not processed yet carry only kernel uevent keys
    if (udev_device_get_is_initialized(device.get()) <= 0) {
        return std::optional<UdevProperties>{};
    }

    UdevProperties properties;
    struct udev_list_entry* entry = nullptr;
    udev_list_entry_foreach(entry, udev_device_get_properties_list_entry(device.get())) {
        const char* key = udev_list_entry_get_name(entry);
        const char* value = udev_list_entry_get_value(entry);
        if (key == nullptr || *key == '\0') {
            continue;
        }
        properties.insert_or_assign(std::string{key}, value != nullptr ? std::string{value}
                                                                         : std::string{});
    }
    return std::optional<UdevProperties>{std::move(properties)};
}

}  // namespace diskinfo
