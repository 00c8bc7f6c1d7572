/**
 * @file Disk.hpp
 * @brief Data model of one block device
 */

#pragma once

#include "models/DeviceId.hpp"
#include "models/DiskType.hpp"
#include "models/Partition.hpp"
#include "models/SmartData.hpp"
#include "util/Attribute.hpp"
#include "util/HumanReadable.hpp"
#include "util/Result.hpp"

#include <compare>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace diskinfo {

struct DeviceSources;

/**
 * @struct DiskData
 * @brief Static attribute values collected by the disk builder
 */
struct DiskData {
    std::string name;  ///< Kernel name (e.g. "sda")
    std::string path;  ///< Device node path (e.g. "/dev/sda")
    DeviceId device_id;
    DiskType type = DiskType::OTHER;
    uint64_t size = 0;  ///< 512-byte units

    std::vector<std::string> byid_paths;
    std::vector<std::string> bypath_paths;

    util::Attribute<std::string> serial_number;
    util::Attribute<std::string> wwn;
    util::Attribute<std::string> model;
    util::Attribute<std::string> firmware;
    util::Attribute<uint32_t> physical_block_size;
    util::Attribute<uint32_t> logical_block_size;

    util::Attribute<std::string> part_table_type;
    util::Attribute<std::string> part_table_uuid;

    auto operator==(const DiskData&) const -> bool = default;
};

/**
 * @class Disk
 * @brief Immutable snapshot of a disk plus on-demand dynamic attributes
 *
 * Identity and static attributes are fixed at construction. Temperature,
 * SMART data and the partition list are read from the sources on every
 * call and never cached.
 *
 * Equality and ordering compare the kernel name only.
 */
class Disk {
public:
    Disk(DiskData data, std::shared_ptr<const DeviceSources> sources);

    [[nodiscard]] auto get_name() const -> const std::string& { return data_.name; }
    [[nodiscard]] auto get_path() const -> const std::string& { return data_.path; }
    [[nodiscard]] auto get_byid_path() const -> const std::vector<std::string>& {
        return data_.byid_paths;
    }
    [[nodiscard]] auto get_bypath_path() const -> const std::vector<std::string>& {
        return data_.bypath_paths;
    }
    [[nodiscard]] auto get_wwn() const -> const util::Attribute<std::string>& { return data_.wwn; }
    [[nodiscard]] auto get_model() const -> const util::Attribute<std::string>& {
        return data_.model;
    }
    [[nodiscard]] auto get_serial_number() const -> const util::Attribute<std::string>& {
        return data_.serial_number;
    }
    [[nodiscard]] auto get_firmware() const -> const util::Attribute<std::string>& {
        return data_.firmware;
    }

    [[nodiscard]] auto get_type() const -> DiskType { return data_.type; }
    [[nodiscard]] auto get_type_str() const -> std::string_view { return disk_type_name(data_.type); }
    [[nodiscard]] auto is_hdd() const -> bool { return data_.type == DiskType::HDD; }
    [[nodiscard]] auto is_ssd() const -> bool { return data_.type == DiskType::SSD; }
    [[nodiscard]] auto is_nvme() const -> bool { return data_.type == DiskType::NVME; }
    [[nodiscard]] auto is_loop() const -> bool { return data_.type == DiskType::LOOP; }

    /**
     * @brief Size in 512-byte units
     */
    [[nodiscard]] auto get_size() const -> uint64_t { return data_.size; }

    /**
     * @brief Size in human-readable form, e.g. {1.0, "TB"}
     */
    [[nodiscard]] auto get_size_in_hrf(util::SizeUnits units = util::SizeUnits::METRIC) const
        -> std::pair<double, std::string>;

    [[nodiscard]] auto get_device_id() const -> const DeviceId& { return data_.device_id; }
    [[nodiscard]] auto get_physical_block_size() const -> const util::Attribute<uint32_t>& {
        return data_.physical_block_size;
    }
    [[nodiscard]] auto get_logical_block_size() const -> const util::Attribute<uint32_t>& {
        return data_.logical_block_size;
    }
    [[nodiscard]] auto get_partition_table_type() const -> const util::Attribute<std::string>& {
        return data_.part_table_type;
    }
    [[nodiscard]] auto get_partition_table_uuid() const -> const util::Attribute<std::string>& {
        return data_.part_table_uuid;
    }

    /**
     * @brief Current temperature in degrees Celsius
     * @return Temperature, nullopt if the device has no sensor, or an error
     */
    [[nodiscard]] auto get_temperature() const -> std::expected<std::optional<double>, util::Error>;

    /**
     * @brief Read SMART data
     * @param skip_standby_check Read even if the device is asleep (wakes it up)
     * @return Snapshot, or SMART_UNAVAILABLE / SMART_PARSE
     */
    [[nodiscard]] auto get_smart_data(bool skip_standby_check = false) const
        -> std::expected<SmartSnapshot, util::Error>;

    /**
     * @brief Enumerate partitions ordered by partition number
     * @return Partitions (empty without a partition table), or PARTITION_ENUMERATION
     */
    [[nodiscard]] auto get_partition_list() const
        -> std::expected<std::vector<Partition>, util::Error>;

    /**
     * @brief One-line description of the static attributes
     */
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto data() const -> const DiskData& { return data_; }
    [[nodiscard]] auto sources() const -> const std::shared_ptr<const DeviceSources>& {
        return sources_;
    }

    auto operator==(const Disk& other) const -> bool { return data_.name == other.data_.name; }
    auto operator<=>(const Disk& other) const -> std::strong_ordering {
        return data_.name <=> other.data_.name;
    }

private:
    DiskData data_;
    std::shared_ptr<const DeviceSources> sources_;
};

}  // namespace diskinfo
