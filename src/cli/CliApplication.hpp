/**
 * @file CliApplication.hpp
 * @brief CLI application for disk inspection
 */

#pragma once

#include "core/IdentifierResolver.hpp"
#include "models/Config.hpp"
#include "models/Disk.hpp"
#include "models/DiskType.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cli {

/**
 * @enum DiskSelector
 * @brief How the value of --disk is interpreted
 */
enum class DiskSelector {
    NAME_OR_PATH,  ///< Kernel name, or device path if it starts with '/'
    BY_ID,
    BY_PATH,
    SERIAL,
    WWN
};

/**
 * @struct CliOptions
 * @brief Parsed command line options
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool list_disks = false;
    bool json_output = false;
    std::optional<std::string> disk;
    DiskSelector selector = DiskSelector::NAME_OR_PATH;
    bool show_partitions = false;
    bool show_smart = false;
    bool skip_standby_check = false;
    bool show_temperature = false;
    diskinfo::DiskTypeFilter filter;
    bool sort = false;
    bool reverse = false;
    bool verbose = false;
    diskinfo::Config config;
    std::string error;  ///< Non-empty if the command line was invalid
};

/**
 * @class CliApplication
 * @brief Command-line application for disk inspection
 *
 * Provides command-line interface for:
 * - Listing disks with type filters and ordering
 * - Showing one disk located by name, path, by-id, by-path, serial or WWN
 * - Partitions, SMART data and temperature of that disk
 */
class CliApplication {
public:
    CliApplication();
    ~CliApplication();

    // Non-copyable
    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    /**
     * @brief Run the CLI application
     * @param argc Argument count
     * @param argv Argument values
     * @return Exit code (0 = success)
     */
    auto run(int argc, char* argv[]) -> int;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument values
     * @return Parsed options
     */
    [[nodiscard]] static auto parse_args(int argc, char* argv[]) -> CliOptions;

    /**
     * @brief Build the identifier for --disk
     * @param value Value of --disk
     * @param selector Interpretation of the value
     */
    [[nodiscard]] static auto make_identifier(const std::string& value, DiskSelector selector)
        -> diskinfo::DiskIdentifier;

    /**
     * @brief Print help message
     */
    static void print_help();

    /**
     * @brief Print version information
     */
    static void print_version();

private:
    /**
     * @brief List disks passing the filter
     * @param options Filter, ordering and output format
     * @return Exit code
     */
    auto cmd_list(const CliOptions& options) -> int;

    /**
     * @brief Show one disk and the requested dynamic data
     * @param options Identifier and requested sections
     * @return Exit code
     */
    auto cmd_show(const CliOptions& options) -> int;

    /**
     * @brief Print disk list as JSON
     */
    static void print_disks_json(const std::vector<diskinfo::Disk>& disks);

    /**
     * @brief Print disk list as table
     */
    static void print_disks_table(const std::vector<diskinfo::Disk>& disks);

    static void print_disk_details(const diskinfo::Disk& disk);
    static void print_partitions(const diskinfo::Disk& disk);
    static void print_smart(const diskinfo::Disk& disk, bool skip_standby_check);
    static void print_temperature(const diskinfo::Disk& disk);

    std::shared_ptr<const diskinfo::DeviceSources> sources_;
};

}  // namespace cli
