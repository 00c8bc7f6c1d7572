/**
 * @file DiskBuilder.hpp
 * @brief Assembly of Disk objects from the data sources
 */

#pragma once

#include "core/IdentifierResolver.hpp"
#include "models/Disk.hpp"
#include "services/DeviceSources.hpp"
#include "util/Result.hpp"

#include <expected>
#include <memory>
#include <string_view>

namespace diskinfo {

/**
 * @class DiskBuilder
 * @brief Builds fully identified Disk snapshots
 *
 * Kernel name, device number and size are mandatory (ATTRIBUTE_READ when
 * missing). Every other attribute is collected independently and stored as
 * a util::Attribute, so one unreadable source never aborts construction.
 */
class DiskBuilder {
public:
    explicit DiskBuilder(std::shared_ptr<const DeviceSources> sources);

    /**
     * @brief Locate a disk by any identifier and build it
     * @param identifier Exactly one identifier
     * @return Disk, or CONFIGURATION / DEVICE_NOT_FOUND / ATTRIBUTE_READ
     */
    [[nodiscard]] auto build(const DiskIdentifier& identifier) const
        -> std::expected<Disk, util::Error>;

    /**
     * @brief Build a disk that is already resolved
     * @param device Resolved identity
     * @param type Device class (see IdentifierResolver::classify)
     */
    [[nodiscard]] auto build(const ResolvedDevice& device, DiskType type) const
        -> std::expected<Disk, util::Error>;

    [[nodiscard]] auto resolver() const -> const IdentifierResolver& { return resolver_; }

private:
    std::shared_ptr<const DeviceSources> sources_;
    IdentifierResolver resolver_;
};

}  // namespace diskinfo
