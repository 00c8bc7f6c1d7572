/**
 * @file SmartData.hpp
 * @brief SMART snapshot model (legacy attribute table or NVMe health log)
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace diskinfo {

/**
 * @struct SmartAttribute
 * @brief One row of the ATA SMART attribute table
 */
struct SmartAttribute {
    int id = 0;                ///< Attribute ID (e.g. 5, 194)
    std::string name;          ///< Attribute name (e.g. "Reallocated_Sector_Ct")
    int flag = 0;              ///< Flag word
    std::optional<int> value;   ///< Normalized value; nullopt when printed as "---"
    std::optional<int> worst;   ///< Worst normalized value
    std::optional<int> thresh;  ///< Failure threshold; nullopt when the drive has none
    std::string type;          ///< "Pre-fail" or "Old_age"
    std::string updated;       ///< "Always" or "Offline"
    std::string when_failed;   ///< "-", "FAILING_NOW" or "In_the_past"
    uint64_t raw_value = 0;    ///< Leading integer of the raw value column

    auto operator==(const SmartAttribute&) const -> bool = default;
};

/**
 * @struct NvmeAttributes
 * @brief NVMe SMART/Health Information log (page 02h)
 *
 * Each field is empty when the backend did not report it.
 */
struct NvmeAttributes {
    std::optional<int> critical_warning;
    std::optional<int> temperature;  ///< Composite temperature in Celsius
    std::optional<int> available_spare;
    std::optional<int> available_spare_threshold;
    std::optional<int> percentage_used;
    std::optional<uint64_t> data_units_read;
    std::optional<uint64_t> data_units_written;
    std::optional<uint64_t> host_read_commands;
    std::optional<uint64_t> host_write_commands;
    std::optional<uint64_t> controller_busy_time;
    std::optional<uint64_t> power_cycles;
    std::optional<uint64_t> power_on_hours;
    std::optional<uint64_t> unsafe_shutdowns;
    std::optional<uint64_t> media_and_data_integrity_errors;
    std::optional<uint64_t> error_information_log_entries;
    std::optional<uint64_t> warning_composite_temperature_time;
    std::optional<uint64_t> critical_composite_temperature_time;

    auto operator==(const NvmeAttributes&) const -> bool = default;
};

/**
 * @struct SmartReport
 * @brief Structured output of one SMART backend query, before class rules are applied
 */
struct SmartReport {
    bool standby = false;                        ///< Backend skipped the read: device asleep
    std::optional<bool> healthy;                 ///< Overall self-assessment, if reported
    bool smart_capable = false;
    bool smart_enabled = false;
    std::vector<SmartAttribute> attributes;      ///< ATA attribute table rows
    std::optional<NvmeAttributes> nvme;          ///< NVMe health log
    std::optional<int> temperature;              ///< Current temperature in Celsius
};

/**
 * @class SmartSnapshot
 * @brief Immutable result of one SMART read
 *
 * If standby_mode() is true nothing else is populated. A snapshot holds
 * either legacy attributes or NVMe attributes, never both.
 */
class SmartSnapshot {
public:
    /**
     * @brief Snapshot of a device that was left asleep
     */
    [[nodiscard]] static auto standby() -> SmartSnapshot {
        SmartSnapshot s;
        s.standby_mode_ = true;
        return s;
    }

    /**
     * @brief Snapshot with a legacy attribute table (HDD/SSD)
     */
    [[nodiscard]] static auto legacy(bool healthy, bool capable, bool enabled,
                                     std::vector<SmartAttribute> attributes) -> SmartSnapshot {
        SmartSnapshot s;
        s.healthy_ = healthy;
        s.smart_capable_ = capable;
        s.smart_enabled_ = enabled;
        s.smart_attributes_ = std::move(attributes);
        return s;
    }

    /**
     * @brief Snapshot with an NVMe health record
     */
    [[nodiscard]] static auto nvme(bool healthy, bool capable, bool enabled,
                                   NvmeAttributes attributes) -> SmartSnapshot {
        SmartSnapshot s;
        s.healthy_ = healthy;
        s.smart_capable_ = capable;
        s.smart_enabled_ = enabled;
        s.nvme_attributes_ = std::move(attributes);
        return s;
    }

    [[nodiscard]] auto healthy() const -> bool { return healthy_; }
    [[nodiscard]] auto standby_mode() const -> bool { return standby_mode_; }
    [[nodiscard]] auto smart_capable() const -> bool { return smart_capable_; }
    [[nodiscard]] auto smart_enabled() const -> bool { return smart_enabled_; }

    [[nodiscard]] auto smart_attributes() const -> const std::vector<SmartAttribute>& {
        return smart_attributes_;
    }

    [[nodiscard]] auto nvme_attributes() const -> const std::optional<NvmeAttributes>& {
        return nvme_attributes_;
    }

    /**
     * @brief Find a legacy attribute by its ID
     */
    [[nodiscard]] auto find_attribute(int id) const -> const SmartAttribute* {
        for (const auto& attr : smart_attributes_) {
            if (attr.id == id) {
                return &attr;
            }
        }
        return nullptr;
    }

    /**
     * @brief Find the first legacy attribute whose name contains the given text
     */
    [[nodiscard]] auto find_attribute(std::string_view name) const -> const SmartAttribute* {
        for (const auto& attr : smart_attributes_) {
            if (attr.name.find(name) != std::string::npos) {
                return &attr;
            }
        }
        return nullptr;
    }

    auto operator==(const SmartSnapshot&) const -> bool = default;

private:
    SmartSnapshot() = default;

    bool healthy_ = false;
    bool standby_mode_ = false;
    bool smart_capable_ = false;
    bool smart_enabled_ = false;
    std::vector<SmartAttribute> smart_attributes_;
    std::optional<NvmeAttributes> nvme_attributes_;
};

}  // namespace diskinfo
