/**
 * @file DiskBuilder.cpp
 * @brief Assembly of Disk objects from the data sources
 */

#include "core/DiskBuilder.hpp"

#include "util/Logger.hpp"
#include "util/Strings.hpp"

#include <format>
#include <functional>
#include <utility>

namespace diskinfo {

namespace {

using TextAttribute = util::Attribute<std::string>;

constexpr std::string_view COMPONENT{"DiskBuilder"};

/**
 * Use next() when primary is not present; a failure is kept only if the
 * fallback has nothing either.
 */
auto fallback(TextAttribute primary, const std::function<TextAttribute()>& next) -> TextAttribute {
    if (primary.is_present()) {
        return primary;
    }
    auto secondary = next();
    if (secondary.is_present() || primary.is_absent()) {
        return secondary;
    }
    return primary;
}

/**
 * View of one udev record that remembers why it is missing
 */
class UdevView {
public:
    explicit UdevView(std::expected<std::optional<UdevProperties>, util::Error> record)
        : record_(std::move(record)) {}

    [[nodiscard]] auto get(std::string_view key) const -> TextAttribute {
        if (!record_) {
            return TextAttribute::failed(record_.error());
        }
        if (!*record_) {
            return TextAttribute::absent();
        }
        const auto it = (*record_)->find(key);
        if (it == (*record_)->end() || util::trim(it->second).empty()) {
            return TextAttribute::absent();
        }
        return TextAttribute::present(std::string{util::trim(it->second)});
    }

    [[nodiscard]] auto failure() const -> const util::Error* {
        return record_ ? nullptr : &record_.error();
    }

    /**
     * Value of an *_ENC property with udev escapes decoded
     */
    [[nodiscard]] auto get_encoded(std::string_view key) const -> TextAttribute {
        auto raw = get(key);
        if (!raw.is_present()) {
            return raw;
        }
        auto decoded = std::string{util::trim(util::udev_unescape(raw.value()))};
        if (decoded.empty()) {
            return TextAttribute::absent();
        }
        return TextAttribute::present(std::move(decoded));
    }

private:
    std::expected<std::optional<UdevProperties>, util::Error> record_;
};

}  // namespace

DiskBuilder::DiskBuilder(std::shared_ptr<const DeviceSources> sources)
    : sources_(std::move(sources)), resolver_(sources_) {}

auto DiskBuilder::build(const DiskIdentifier& identifier) const
    -> std::expected<Disk, util::Error> {
    auto device = resolver_.resolve(identifier);
    if (!device) {
        return std::unexpected(device.error());
    }
    return build(*device, resolver_.classify(*device));
}

auto DiskBuilder::build(const ResolvedDevice& device, DiskType type) const
    -> std::expected<Disk, util::Error> {
    const auto& name = device.kernel_name;
    auto& sysfs = *sources_->sysfs;

    auto sysfs_text = [&](std::string_view attribute) -> TextAttribute {
        auto text = sysfs.read_attribute(name, attribute);
        if (!text) {
            LOG_DEBUG(COMPONENT, std::format("{}: {}", name, text.error().what()));
            return TextAttribute::failed(text.error().as(util::ErrorKind::ATTRIBUTE_READ));
        }
        if (!*text || (*text)->empty()) {
            return TextAttribute::absent();
        }
        return TextAttribute::present(std::move(**text));
    };

    auto sysfs_block_size = [&](std::string_view attribute) -> util::Attribute<uint32_t> {
        auto text = sysfs_text(attribute);
        if (!text.is_present()) {
            return text.is_failed() ? util::Attribute<uint32_t>::failed(text.get_error())
                                    : util::Attribute<uint32_t>::absent();
        }
        if (auto value = util::parse_number<uint32_t>(text.value())) {
            return util::Attribute<uint32_t>::present(*value);
        }
        return util::Attribute<uint32_t>::failed(util::make_error(
            util::ErrorKind::ATTRIBUTE_READ, name, attribute, "not a number: '{}'", text.value()));
    };

    // Mandatory: size
    auto size_text = sysfs.read_attribute(name, "size");
    if (!size_text) {
        return std::unexpected(size_text.error().as(util::ErrorKind::ATTRIBUTE_READ, "size"));
    }
    if (!*size_text) {
        return std::unexpected(
            util::Error{util::ErrorKind::ATTRIBUTE_READ, name, "size", "attribute missing"});
    }
    const auto size = util::parse_number<uint64_t>(**size_text);
    if (!size) {
        return std::unexpected(util::make_error(util::ErrorKind::ATTRIBUTE_READ, name, "size",
                                                "not a number: '{}'", **size_text));
    }

    const UdevView udev{sources_->udev->read_properties(device.device_id)};
    if (const auto* err = udev.failure()) {
        LOG_WARNING(COMPONENT, std::format("{}: udev record unreadable: {}", name, err->what()));
    }

    DiskData data;
    data.name = name;
    data.path = (sources_->dev_root / name).string();
    data.device_id = device.device_id;
    data.type = type;
    data.size = *size;
    data.byid_paths = resolver_.collect_links(LinkScheme::BY_ID, name);
    data.bypath_paths = resolver_.collect_links(LinkScheme::BY_PATH, name);

    data.model = fallback(udev.get_encoded("ID_MODEL_ENC"), [&] {
        return fallback(udev.get("ID_MODEL"), [&] { return sysfs_text("device/model"); });
    });
    data.serial_number =
        fallback(udev.get("ID_SERIAL_SHORT"), [&] { return sysfs_text("device/serial"); });
    data.firmware = fallback(udev.get("ID_REVISION"), [&] {
        return fallback(sysfs_text("device/firmware_rev"), [&] { return sysfs_text("device/rev"); });
    });
    data.wwn = fallback(udev.get("ID_WWN"), [&] { return sysfs_text("device/wwid"); });
    data.physical_block_size = sysfs_block_size("queue/physical_block_size");
    data.logical_block_size = sysfs_block_size("queue/logical_block_size");
    data.part_table_type = udev.get("ID_PART_TABLE_TYPE");
    data.part_table_uuid = udev.get("ID_PART_TABLE_UUID");

    LOG_DEBUG(COMPONENT, std::format("Built {} ({}, {}, {} sectors)", name, data.device_id.to_string(),
                                     disk_type_name(type), data.size));
    return Disk{std::move(data), sources_};
}

}  // namespace diskinfo
