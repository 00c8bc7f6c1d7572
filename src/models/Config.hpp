/**
 * @file Config.hpp
 * @brief Runtime configuration of the data sources
 */

#pragma once

#include <filesystem>
#include <string>

namespace diskinfo {

/**
 * @struct SystemPaths
 * @brief Roots of the sysfs and device node trees (overridable for test fixtures)
 */
struct SystemPaths {
    std::filesystem::path sys_root{"/sys"};  ///< sysfs mount point
    std::filesystem::path dev_root{"/dev"};  ///< device nodes and /dev/disk/by-*
};

/**
 * @struct SmartOptions
 * @brief How the smartctl backend is invoked
 */
struct SmartOptions {
    std::string smartctl_path{"/usr/sbin/smartctl"};
    bool use_sudo = false;  ///< Prefix the command with sudo
};

/**
 * @struct Config
 * @brief Complete source configuration
 */
struct Config {
    SystemPaths paths;
    SmartOptions smart;
    std::string df_path{"df"};
    std::string text_encoding;  ///< Charset of partition text fields; empty = locale charset
};

}  // namespace diskinfo
