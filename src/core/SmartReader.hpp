/**
 * @file SmartReader.hpp
 * @brief Temperature and SMART reads with device-class and power-state rules
 */

#pragma once

#include "models/Disk.hpp"
#include "models/SmartData.hpp"
#include "services/DeviceSources.hpp"
#include "util/Result.hpp"

#include <expected>
#include <memory>
#include <optional>

namespace diskinfo {

/**
 * @enum StandbyPolicy
 * @brief How a SMART read treats a sleeping device
 */
enum class StandbyPolicy {
    CHECK,      ///< Leave a device in standby asleep and report standby_mode
    SKIP_CHECK  ///< Always perform the full read (wakes the device)
};

/**
 * @class SmartReader
 * @brief Reads dynamic health data of a disk
 *
 * HDD and SSD report a legacy attribute table, NVMe a health record. NVMe
 * is always read fully and never reports standby. LOOP and OTHER devices
 * have no SMART transport.
 */
class SmartReader {
public:
    explicit SmartReader(std::shared_ptr<const DeviceSources> sources);

    /**
     * @brief Current temperature in degrees Celsius
     * @return Temperature, nullopt when the device class or device has no sensor,
     *         ATTRIBUTE_READ for an unreadable sensor value, or a SMART error (NVMe)
     */
    [[nodiscard]] auto read_temperature(const Disk& disk) const
        -> std::expected<std::optional<double>, util::Error>;

    /**
     * @brief Read SMART data
     * @param disk Device to query
     * @param policy Standby handling
     * @return Snapshot, SMART_UNAVAILABLE or SMART_PARSE
     */
    [[nodiscard]] auto read_smart(const Disk& disk, StandbyPolicy policy = StandbyPolicy::CHECK) const
        -> std::expected<SmartSnapshot, util::Error>;

    /**
     * @brief Apply the device-class rules to a backend report
     */
    [[nodiscard]] static auto to_snapshot(const SmartReport& report, DiskType type,
                                          StandbyPolicy policy) -> SmartSnapshot;

private:
    std::shared_ptr<const DeviceSources> sources_;
};

}  // namespace diskinfo
