/**
 * @file UdevDatabase.hpp
 * @brief libudev implementation of IUdevDatabase
 */

#pragma once

#include "interfaces/IUdevDatabase.hpp"

#include <filesystem>
#include <memory>

struct udev;

namespace diskinfo {

struct UdevContextDeleter {
    void operator()(struct udev* context) const;
};

/**
 * @class UdevDatabase
 * @brief Queries the udev device database through libudev
 *
 * Persistent-name links come from the devlinks udev recorded for each block
 * device and are reported under {dev_root}/disk/by-*. Links are resolved by
 * device number, so any node or link of a block device resolves to its
 * kernel name.
 */
class UdevDatabase : public IUdevDatabase {
public:
    explicit UdevDatabase(std::filesystem::path dev_root);
    ~UdevDatabase() override = default;

    UdevDatabase(const UdevDatabase&) = delete;
    UdevDatabase& operator=(const UdevDatabase&) = delete;
    UdevDatabase(UdevDatabase&&) = default;
    UdevDatabase& operator=(UdevDatabase&&) = default;

    [[nodiscard]] auto list_links(LinkScheme scheme) -> std::vector<std::filesystem::path> override;

    [[nodiscard]] auto link_path(LinkScheme scheme, std::string_view name)
        -> std::filesystem::path override;

    [[nodiscard]] auto resolve_link(const std::filesystem::path& link)
        -> std::optional<std::string> override;

    [[nodiscard]] auto read_properties(const DeviceId& id)
        -> std::expected<std::optional<UdevProperties>, util::Error> override;

private:
    std::filesystem::path dev_root_;
    std::unique_ptr<struct udev, UdevContextDeleter> context_;
};

}  // namespace diskinfo
