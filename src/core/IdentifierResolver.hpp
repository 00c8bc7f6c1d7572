/**
 * @file IdentifierResolver.hpp
 * @brief Resolution of any disk identifier to a kernel name and device number
 */

#pragma once

#include "models/DeviceId.hpp"
#include "models/DiskType.hpp"
#include "services/DeviceSources.hpp"
#include "util/Result.hpp"

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace diskinfo {

/**
 * @struct DiskIdentifier
 * @brief The identifier a caller locates a disk by; exactly one field must be set
 *
 * @example
 * ```cpp
 * auto disk = builder.build(DiskIdentifier{.serial = "S3D2NY0J819218R"});
 * ```
 */
struct DiskIdentifier {
    std::optional<std::string> name;    ///< Kernel name, e.g. "sda"
    std::optional<std::string> path;    ///< Device path, e.g. "/dev/sda"
    std::optional<std::string> byid;    ///< by-id link name or full link path
    std::optional<std::string> bypath;  ///< by-path link name or full link path
    std::optional<std::string> serial;  ///< Serial number
    std::optional<std::string> wwn;     ///< World Wide Name

    [[nodiscard]] auto count() const -> int;

    /**
     * @brief Text form for messages, e.g. "serial=S3D2NY0J819218R"
     */
    [[nodiscard]] auto describe() const -> std::string;
};

/**
 * @struct ResolvedDevice
 * @brief Canonical identity of a resolved block device
 */
struct ResolvedDevice {
    std::string kernel_name;
    DeviceId device_id;

    auto operator==(const ResolvedDevice&) const -> bool = default;
};

/**
 * @class IdentifierResolver
 * @brief Maps identifiers to kernel devices and classifies them
 *
 * Never partially resolves: a result always names an existing sysfs device
 * with a readable device number.
 */
class IdentifierResolver {
public:
    explicit IdentifierResolver(std::shared_ptr<const DeviceSources> sources);

    /**
     * @brief Resolve a caller identifier
     * @return Resolved device, CONFIGURATION if not exactly one field is set,
     *         or DEVICE_NOT_FOUND
     */
    [[nodiscard]] auto resolve(const DiskIdentifier& identifier) const
        -> std::expected<ResolvedDevice, util::Error>;

    /**
     * @brief Resolve a kernel name (validates existence, reads "dev")
     */
    [[nodiscard]] auto resolve_name(std::string_view kernel_name) const
        -> std::expected<ResolvedDevice, util::Error>;

    /**
     * @brief Device class of a resolved device
     */
    [[nodiscard]] auto classify(const ResolvedDevice& device) const -> DiskType;

    /**
     * @brief Classification rule
     * @param kernel_name Kernel name
     * @param id Device number
     * @param rotational Content of queue/rotational, if readable
     */
    [[nodiscard]] static auto classify(std::string_view kernel_name, const DeviceId& id,
                                       const std::optional<std::string>& rotational) -> DiskType;

    /**
     * @brief Links of a naming scheme pointing at a device, in listing order
     * @param scheme Naming scheme
     * @param kernel_name Target kernel name
     * @return Full link paths without duplicates
     */
    [[nodiscard]] auto collect_links(LinkScheme scheme, std::string_view kernel_name) const
        -> std::vector<std::string>;

private:
    [[nodiscard]] auto resolve_path(std::string_view path) const
        -> std::expected<ResolvedDevice, util::Error>;

    [[nodiscard]] auto resolve_link_name(LinkScheme scheme, std::string_view value) const
        -> std::expected<ResolvedDevice, util::Error>;

    [[nodiscard]] auto resolve_by_property(std::string_view property,
                                           std::string_view sysfs_fallback,
                                           std::string_view value) const
        -> std::expected<ResolvedDevice, util::Error>;

    std::shared_ptr<const DeviceSources> sources_;
};

/**
 * @brief Whether a kernel name is an NVMe namespace ("nvme<ctrl>n<ns>")
 */
[[nodiscard]] auto is_nvme_namespace(std::string_view kernel_name) -> bool;

}  // namespace diskinfo
