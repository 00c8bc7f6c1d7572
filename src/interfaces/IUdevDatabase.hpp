/**
 * @file IUdevDatabase.hpp
 * @brief Read-only access to the udev persistent-name database
 */

#pragma once

#include "models/DeviceId.hpp"
#include "util/Result.hpp"

#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace diskinfo {

/**
 * @enum LinkScheme
 * @brief Persistent naming directories under /dev/disk
 */
enum class LinkScheme { BY_ID, BY_PATH, BY_UUID, BY_LABEL, BY_PARTUUID, BY_PARTLABEL };

/**
 * @brief Directory name of a scheme ("by-id", "by-path", ...)
 */
[[nodiscard]] constexpr auto link_scheme_dir(LinkScheme scheme) -> std::string_view {
    switch (scheme) {
        case LinkScheme::BY_ID:
            return "by-id";
        case LinkScheme::BY_PATH:
            return "by-path";
        case LinkScheme::BY_UUID:
            return "by-uuid";
        case LinkScheme::BY_LABEL:
            return "by-label";
        case LinkScheme::BY_PARTUUID:
            return "by-partuuid";
        case LinkScheme::BY_PARTLABEL:
            return "by-partlabel";
    }
    return "by-id";
}

/**
 * @brief Properties udev recorded for one device
 */
using UdevProperties = std::map<std::string, std::string, std::less<>>;

/**
 * @class IUdevDatabase
 * @brief Abstract interface over the udev device database and /dev/disk/by-* links
 */
class IUdevDatabase {
public:
    virtual ~IUdevDatabase() = default;

    /**
     * @brief List the symlinks of a naming scheme
     * @param scheme Naming scheme
     * @return Full link paths sorted by name; empty if the directory does not exist
     */
    [[nodiscard]] virtual auto list_links(LinkScheme scheme) -> std::vector<std::filesystem::path> = 0;

    /**
     * @brief Full path of a named link in a scheme directory
     */
    [[nodiscard]] virtual auto link_path(LinkScheme scheme, std::string_view name)
        -> std::filesystem::path = 0;

    /**
     * @brief Resolve a symlink to the kernel name of its target
     * @param link Link path
     * @return Kernel name (target basename), or nullopt if the link does not exist
     */
    [[nodiscard]] virtual auto resolve_link(const std::filesystem::path& link)
        -> std::optional<std::string> = 0;

    /**
     * @brief Read the udev record of a block device
     * @param id Device number
     * @return Properties, nullopt if udev has no record, or an IO error
     */
    [[nodiscard]] virtual auto read_properties(const DeviceId& id)
        -> std::expected<std::optional<UdevProperties>, util::Error> = 0;
};

}  // namespace diskinfo
