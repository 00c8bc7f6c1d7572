/**
 * @file PartitionBuilder.cpp
 * @brief Assembly of Partition objects for a disk
 */

#include "core/PartitionBuilder.hpp"

#include "util/Logger.hpp"
#include "util/Strings.hpp"

#include <algorithm>
#include <format>
#include <initializer_list>
#include <limits>
#include <utility>

namespace rng = std::ranges;

namespace diskinfo {

namespace {

constexpr std::string_view COMPONENT{"PartitionBuilder"};
constexpr std::string_view FILESYSTEM_USAGE{"filesystem"};

auto property(const UdevProperties& props, std::string_view key) -> std::optional<std::string> {
    const auto it = props.find(key);
    if (it == props.end()) {
        return std::nullopt;
    }
    const auto value = util::trim(it->second);
    if (value.empty()) {
        return std::nullopt;
    }
    return std::string{value};
}

auto number_property(const UdevProperties& props, std::string_view key) -> std::optional<uint64_t> {
    const auto value = property(props, key);
    return value ? util::parse_number<uint64_t>(*value) : std::nullopt;
}

// Every field whose only source is the udev record
void mark_udev_fields_failed(PartitionData& data, const util::Error& error) {
    for (auto* field : {&data.part_scheme, &data.part_label, &data.part_uuid, &data.part_type,
                        &data.fs_label, &data.fs_uuid, &data.fs_type, &data.fs_version}) {
        *field = util::Attribute<std::string>::failed(error);
    }
    data.fs_usage = util::Attribute<FsUsage>::failed(error);
}

auto first_link(std::vector<std::string> links) -> util::Attribute<std::string> {
    if (links.empty()) {
        return util::Attribute<std::string>::absent();
    }
    return util::Attribute<std::string>::present(std::move(links.front()));
}

}  // namespace

PartitionBuilder::PartitionBuilder(std::shared_ptr<const DeviceSources> sources)
    : sources_(std::move(sources)), resolver_(sources_), decoder_(sources_->text_encoding) {}

auto PartitionBuilder::build(const Disk& disk) const
    -> std::expected<std::vector<Partition>, util::Error> {
    auto records = sources_->partitions->enumerate(disk.get_name());
    if (!records) {
        LOG_ERROR(COMPONENT, records.error().what());
        return std::unexpected(records.error());
    }

    std::vector<Partition> partitions;
    partitions.reserve(records->size());
    for (const auto& record : *records) {
        partitions.push_back(build_one(disk, record));
    }

    constexpr auto NO_NUMBER = std::numeric_limits<uint32_t>::max();
    rng::stable_sort(partitions, [](const Partition& a, const Partition& b) {
        const auto na = a.get_part_number().value_or(NO_NUMBER);
        const auto nb = b.get_part_number().value_or(NO_NUMBER);
        if (na != nb) {
            return na < nb;
        }
        return a.get_name() < b.get_name();
    });

    LOG_DEBUG(COMPONENT,
              std::format("{}: {} partition(s)", disk.get_name(), partitions.size()));
    return partitions;
}

auto PartitionBuilder::build_one(const Disk& disk, const PartitionRecord& record) const
    -> Partition {
    const auto& props = record.properties;
    const auto& name = record.kernel_name;

    auto decode = [&](std::string_view field, const std::string& raw) {
        auto text = decoder_.decode(raw);
        if (!text) {
            auto err = text.error();
            err.device = name;
            err.subject = std::string{field};
            LOG_WARNING(COMPONENT, err.what());
            return util::Attribute<std::string>::failed(std::move(err));
        }
        return util::Attribute<std::string>::present(std::move(*text));
    };

    PartitionData data;
    data.name = name;
    data.path = (sources_->dev_root / name).string();
    data.device_id = record.device_id;
    data.disk_name = disk.get_name();

    data.byid_paths = resolver_.collect_links(LinkScheme::BY_ID, name);
    data.bypath_path = first_link(resolver_.collect_links(LinkScheme::BY_PATH, name));
    data.bypartuuid_path = first_link(resolver_.collect_links(LinkScheme::BY_PARTUUID, name));
    data.bypartlabel_path = first_link(resolver_.collect_links(LinkScheme::BY_PARTLABEL, name));
    data.byuuid_path = first_link(resolver_.collect_links(LinkScheme::BY_UUID, name));
    data.bylabel_path = first_link(resolver_.collect_links(LinkScheme::BY_LABEL, name));

    data.part_scheme = util::Attribute<std::string>::from_optional(
        property(props, "ID_PART_ENTRY_SCHEME"));
    data.part_uuid =
        util::Attribute<std::string>::from_optional(property(props, "ID_PART_ENTRY_UUID"));
    data.part_type =
        util::Attribute<std::string>::from_optional(property(props, "ID_PART_ENTRY_TYPE"));
    if (const auto label = property(props, "ID_PART_ENTRY_NAME")) {
        data.part_label = decode("part_label", util::udev_unescape(*label));
    }

    if (record.number) {
        data.part_number = util::Attribute<uint32_t>::present(*record.number);
    } else if (const auto number = number_property(props, "ID_PART_ENTRY_NUMBER")) {
        data.part_number = util::Attribute<uint32_t>::present(static_cast<uint32_t>(*number));
    }
    data.part_offset = util::Attribute<uint64_t>::from_optional(
        number_property(props, "ID_PART_ENTRY_OFFSET").or_else([&] { return record.start; }));
    data.part_size = util::Attribute<uint64_t>::from_optional(
        record.size.or_else([&] { return number_property(props, "ID_PART_ENTRY_SIZE"); }));

    auto fill_mount_usage = [&] {
        data.fs_free_size = util::Attribute<uint64_t>::from_optional(record.free_size);
        if (record.mount_point) {
            data.fs_mounting_point = decode("fs_mounting_point", *record.mount_point);
        }
    };

    if (record.properties_error) {
        auto err = record.properties_error->as(util::ErrorKind::ATTRIBUTE_READ, "udev");
        err.device = name;
        mark_udev_fields_failed(data, err);
        fill_mount_usage();
        return Partition{std::move(data)};
    }

    // Filesystem attributes exist only for recognized content
    const auto fs_type = property(props, "ID_FS_TYPE");
    if (!fs_type) {
        return Partition{std::move(data)};
    }

    data.fs_type = util::Attribute<std::string>::present(*fs_type);
    if (const auto uuid = property(props, "ID_FS_UUID_ENC")) {
        data.fs_uuid = util::Attribute<std::string>::present(util::udev_unescape(*uuid));
    } else {
        data.fs_uuid =
            util::Attribute<std::string>::from_optional(property(props, "ID_FS_UUID"));
    }
    data.fs_version =
        util::Attribute<std::string>::from_optional(property(props, "ID_FS_VERSION"));

    if (const auto label = property(props, "ID_FS_LABEL_ENC")) {
        data.fs_label = decode("fs_label", util::udev_unescape(*label));
    } else if (const auto plain = property(props, "ID_FS_LABEL")) {
        data.fs_label = decode("fs_label", *plain);
    }

    if (const auto usage = property(props, "ID_FS_USAGE")) {
        data.fs_usage = util::Attribute<FsUsage>::present(
            *usage == FILESYSTEM_USAGE ? FsUsage::FILESYSTEM : FsUsage::OTHER);
    }

    fill_mount_usage();
    return Partition{std::move(data)};
}

}  // namespace diskinfo
