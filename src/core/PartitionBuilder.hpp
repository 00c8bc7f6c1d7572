/**
 * @file PartitionBuilder.hpp
 * @brief Assembly of Partition objects for a disk
 */

#pragma once

#include "core/IdentifierResolver.hpp"
#include "models/Disk.hpp"
#include "models/Partition.hpp"
#include "services/DeviceSources.hpp"
#include "util/TextEncoding.hpp"

#include <expected>
#include <memory>
#include <vector>

namespace diskinfo {

/**
 * @class PartitionBuilder
 * @brief Builds the partition list of a disk
 *
 * Text fields (partition label, filesystem label, mount point) are decoded
 * from the configured charset to UTF-8 with one decoder per list, so every
 * partition is interpreted the same way.
 */
class PartitionBuilder {
public:
    explicit PartitionBuilder(std::shared_ptr<const DeviceSources> sources);

    /**
     * @brief Enumerate and build the partitions of a disk
     * @param disk Parent disk
     * @return Partitions ordered by partition number, or PARTITION_ENUMERATION
     */
    [[nodiscard]] auto build(const Disk& disk) const
        -> std::expected<std::vector<Partition>, util::Error>;

    /**
     * @brief Build one partition from an enumeration record
     */
    [[nodiscard]] auto build_one(const Disk& disk, const PartitionRecord& record) const
        -> Partition;

private:
    std::shared_ptr<const DeviceSources> sources_;
    IdentifierResolver resolver_;
    util::TextDecoder decoder_;
};

}  // namespace diskinfo
