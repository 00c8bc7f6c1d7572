/**
 * @file PartitionEnumerator.cpp
 * @brief Partition enumeration over sysfs, udev and df
 */

#include "services/PartitionEnumerator.hpp"

#include "util/Logger.hpp"
#include "util/Strings.hpp"

#include <cctype>
#include <filesystem>
#include <format>
#include <utility>

namespace fs = std::filesystem;

namespace diskinfo {

namespace {

constexpr std::string_view DEV_PREFIX{"/dev/"};

auto skip_spaces(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    return text;
}

auto take_token(std::string_view& text) -> std::string_view {
    text = skip_spaces(text);
    std::size_t end = 0;
    while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end]))) {
        ++end;
    }
    const auto token = text.substr(0, end);
    text.remove_prefix(end);
    return token;
}

auto enumeration_error(const util::Error& cause, std::string_view disk_name) -> util::Error {
    auto err = cause.as(util::ErrorKind::PARTITION_ENUMERATION);
    err.device = std::string{disk_name};
    return err;
}

}  // namespace

PartitionEnumerator::PartitionEnumerator(std::shared_ptr<ISysfsReader> sysfs,
                                         std::shared_ptr<IUdevDatabase> udev,
                                         std::shared_ptr<ICommandRunner> runner,
                                         std::string df_path)
    : sysfs_(std::move(sysfs)),
      udev_(std::move(udev)),
      runner_(std::move(runner)),
      df_path_(std::move(df_path)) {}

auto PartitionEnumerator::enumerate(std::string_view disk_name)
    -> std::expected<std::vector<PartitionRecord>, util::Error> {
    auto names = sysfs_->list_partitions(disk_name);
    if (!names) {
        return std::unexpected(enumeration_error(names.error(), disk_name));
    }

    std::vector<PartitionRecord> records;
    if (names->empty()) {
        return records;
    }

    auto mounts = read_mount_table(disk_name);
    if (!mounts) {
        return std::unexpected(mounts.error());
    }

    for (const auto& name : *names) {
        auto record = read_record(disk_name, name);
        if (!record) {
            return std::unexpected(record.error());
        }
        if (const auto it = mounts->find(name); it != mounts->end()) {
            record->free_size = it->second.available;
            record->mount_point = it->second.target;
        }
        records.push_back(std::move(*record));
    }
    return records;
}

auto PartitionEnumerator::read_record(std::string_view disk_name, const std::string& name)
    -> std::expected<PartitionRecord, util::Error> {
    PartitionRecord record;
    record.kernel_name = name;

    auto dev = sysfs_->read_attribute(name, "dev");
    if (!dev) {
        return std::unexpected(enumeration_error(dev.error(), disk_name));
    }
    const auto id = *dev ? DeviceId::parse(**dev) : std::nullopt;
    if (!id) {
        return std::unexpected(util::make_error(util::ErrorKind::PARTITION_ENUMERATION, disk_name,
                                                "dev", "{} has no valid device number", name));
    }
    record.device_id = *id;

    auto read_number = [&](std::string_view attribute)
        -> std::expected<std::optional<uint64_t>, util::Error> {
        auto text = sysfs_->read_attribute(name, attribute);
        if (!text) {
            return std::unexpected(enumeration_error(text.error(), disk_name));
        }
        if (!*text) {
            return std::optional<uint64_t>{};
        }
        return util::parse_number<uint64_t>(**text);
    };

    auto number = read_number("partition");
    if (!number) {
        return std::unexpected(number.error());
    }
    if (*number) {
        record.number = static_cast<uint32_t>(**number);
    }

    auto start = read_number("start");
    if (!start) {
        return std::unexpected(start.error());
    }
    record.start = *start;

    auto size = read_number("size");
    if (!size) {
        return std::unexpected(size.error());
    }
    record.size = *size;

    auto properties = udev_->read_properties(record.device_id);
    if (!properties) {
        LOG_WARNING("PartitionEnumerator", std::format("{}: udev record unreadable: {}", name,
                                                       properties.error().what()));
        record.properties_error = properties.error();
    } else if (*properties) {
        record.properties = std::move(**properties);
    }
    return record;
}

auto PartitionEnumerator::read_mount_table(std::string_view disk_name)
    -> std::expected<std::map<std::string, MountUsage, std::less<>>, util::Error> {
    auto output = runner_->run({df_path_, "--block-size=512", "--output=source,avail,target"});
    if (!output) {
        return std::unexpected(enumeration_error(output.error(), disk_name));
    }

    // df exits with 1 when some mounts are inaccessible but still lists the others
    if (output->exit_status != 0) {
        if (output->stdout_data.empty()) {
            return std::unexpected(util::make_error(
                util::ErrorKind::PARTITION_ENUMERATION, disk_name, df_path_,
                "exit status {}: {}", output->exit_status, util::trim(output->stderr_data)));
        }
        LOG_WARNING("PartitionEnumerator",
                    std::format("{} exited with status {}, using partial output", df_path_,
                                output->exit_status));
    }
    return parse_df_output(output->stdout_data);
}

auto PartitionEnumerator::parse_df_output(std::string_view output)
    -> std::map<std::string, MountUsage, std::less<>> {
    std::map<std::string, MountUsage, std::less<>> mounts;
    const auto lines = util::split_lines(output);

    for (std::size_t i = 1; i < lines.size(); ++i) {
        auto rest = lines[i];
        const auto source = take_token(rest);
        const auto avail = util::parse_number<uint64_t>(take_token(rest));
        const auto target = skip_spaces(rest);
        if (!source.starts_with(DEV_PREFIX) || !avail || target.empty()) {
            continue;
        }

        const auto name = fs::path{source}.filename().string();
        // A device mounted several times keeps its first mount point
        mounts.try_emplace(name, MountUsage{.source = std::string{source},
                                            .available = *avail,
                                            .target = std::string{target}});
    }
    return mounts;
}

}  // namespace diskinfo
