/**
 * @file PartitionEnumerator.hpp
 * @brief Partition enumeration over sysfs, udev and df
 */

#pragma once

#include "interfaces/ICommandRunner.hpp"
#include "interfaces/IPartitionEnumerator.hpp"
#include "interfaces/ISysfsReader.hpp"
#include "interfaces/IUdevDatabase.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace diskinfo {

/**
 * @brief One mounted filesystem as reported by df
 */
struct MountUsage {
    std::string source;      ///< e.g. /dev/sda1
    uint64_t available = 0;  ///< Free 512-byte blocks
    std::string target;      ///< Mount point (raw bytes)

    auto operator==(const MountUsage&) const -> bool = default;
};

/**
 * @class PartitionEnumerator
 * @brief IPartitionEnumerator implementation
 *
 * Partition geometry comes from sysfs, partition-table and filesystem
 * properties from the udev database, free space and mount point from
 * `df --block-size=512 --output=source,avail,target`.
 */
class PartitionEnumerator : public IPartitionEnumerator {
public:
    PartitionEnumerator(std::shared_ptr<ISysfsReader> sysfs, std::shared_ptr<IUdevDatabase> udev,
                        std::shared_ptr<ICommandRunner> runner, std::string df_path = "df");
    ~PartitionEnumerator() override = default;

    PartitionEnumerator(const PartitionEnumerator&) = delete;
    PartitionEnumerator& operator=(const PartitionEnumerator&) = delete;
    PartitionEnumerator(PartitionEnumerator&&) = default;
    PartitionEnumerator& operator=(PartitionEnumerator&&) = default;

    [[nodiscard]] auto enumerate(std::string_view disk_name)
        -> std::expected<std::vector<PartitionRecord>, util::Error> override;

    /**
     * @brief Parse df output, keyed by the kernel name of the source device
     * @param output df stdout including the header line
     */
    [[nodiscard]] static auto parse_df_output(std::string_view output)
        -> std::map<std::string, MountUsage, std::less<>>;

private:
    [[nodiscard]] auto read_record(std::string_view disk_name, const std::string& name)
        -> std::expected<PartitionRecord, util::Error>;

    [[nodiscard]] auto read_mount_table(std::string_view disk_name)
        -> std::expected<std::map<std::string, MountUsage, std::less<>>, util::Error>;

    std::shared_ptr<ISysfsReader> sysfs_;
    std::shared_ptr<IUdevDatabase> udev_;
    std::shared_ptr<ICommandRunner> runner_;
    std::string df_path_;
};

}  // namespace diskinfo
