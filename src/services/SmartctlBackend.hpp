/**
 * @file SmartctlBackend.hpp
 * @brief SMART data retrieval through smartctl
 *
 * Runs smartctl from smartmontools and parses its text report into a
 * SmartReport. Supports the ATA attribute table (HDD/SSD) and the NVMe
 * SMART/Health Information log.
 */

#pragma once

#include "interfaces/ICommandRunner.hpp"
#include "interfaces/ISmartBackend.hpp"
#include "models/Config.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace diskinfo {

/**
 * @class SmartctlBackend
 * @brief ISmartBackend implementation over the smartctl command
 */
class SmartctlBackend : public ISmartBackend {
public:
    SmartctlBackend(std::shared_ptr<ICommandRunner> runner, SmartOptions options);
    ~SmartctlBackend() override = default;

    // Non-copyable
    SmartctlBackend(const SmartctlBackend&) = delete;
    SmartctlBackend& operator=(const SmartctlBackend&) = delete;
    SmartctlBackend(SmartctlBackend&&) = default;
    SmartctlBackend& operator=(SmartctlBackend&&) = default;

    [[nodiscard]] auto read(const SmartQuery& query)
        -> std::expected<SmartReport, util::Error> override;

    /**
     * @brief Command line used for a query
     * @param query Device and standby policy
     * @return argv, e.g. {"/usr/sbin/smartctl", "-n", "standby", "-H", "-i", "-A", "/dev/sda"}
     */
    [[nodiscard]] auto build_command(const SmartQuery& query) const -> std::vector<std::string>;

    /**
     * @brief Parse a smartctl report
     * @param output smartctl stdout
     * @param type Device class; selects the ATA table or the NVMe log
     * @param device Device path used in error reports
     * @return Report, or SMART_PARSE if the output contains nothing recognizable
     */
    [[nodiscard]] static auto parse_report(std::string_view output, DiskType type,
                                           std::string_view device)
        -> std::expected<SmartReport, util::Error>;

private:
    [[nodiscard]] static auto parse_attribute_row(std::string_view line)
        -> std::optional<SmartAttribute>;

    static void parse_nvme_field(std::string_view key, std::string_view value,
                                 NvmeAttributes& nvme);

    std::shared_ptr<ICommandRunner> runner_;
    SmartOptions options_;
};

}  // namespace diskinfo
