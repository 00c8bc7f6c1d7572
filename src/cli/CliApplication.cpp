/**
 * @file CliApplication.cpp
 * @brief CLI application implementation
 */

#include "cli/CliApplication.hpp"

#include "config.h"
#include "core/DiskBuilder.hpp"
#include "core/DiskDiscovery.hpp"
#include "services/DeviceSources.hpp"
#include "util/HumanReadable.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <cstdint>
#include <filesystem>
#include <format>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <getopt.h>

namespace cli {

namespace {

// Application name
constexpr auto APP_NAME = "diskinfo-cli";

constexpr uint64_t SECTOR_SIZE = 512;

// Options without a short form
enum LongOnly : int {
    OPT_BY_ID = 256,
    OPT_BY_PATH,
    OPT_SERIAL,
    OPT_WWN,
    OPT_NO_STANDBY_CHECK,
    OPT_INCLUDE,
    OPT_EXCLUDE,
    OPT_REVERSE,
    OPT_SYS_ROOT,
    OPT_DEV_ROOT,
    OPT_SMARTCTL,
    OPT_SUDO,
    OPT_DF,
    OPT_ENCODING
};

// Command line options
const struct option long_options[] = {
    {            "help",       no_argument, nullptr,                    'h'},
    {         "version",       no_argument, nullptr,                    'V'},
    {            "list",       no_argument, nullptr,                    'l'},
    {            "json",       no_argument, nullptr,                    'j'},
    {            "disk", required_argument, nullptr,                    'd'},
    {           "by-id",       no_argument, nullptr,              OPT_BY_ID},
    {         "by-path",       no_argument, nullptr,            OPT_BY_PATH},
    {          "serial",       no_argument, nullptr,             OPT_SERIAL},
    {             "wwn",       no_argument, nullptr,                OPT_WWN},
    {      "partitions",       no_argument, nullptr,                    'p'},
    {           "smart",       no_argument, nullptr,                    's'},
    {"no-standby-check",       no_argument, nullptr,   OPT_NO_STANDBY_CHECK},
    {     "temperature",       no_argument, nullptr,                    't'},
    {         "include", required_argument, nullptr,            OPT_INCLUDE},
    {         "exclude", required_argument, nullptr,            OPT_EXCLUDE},
    {            "sort",       no_argument, nullptr,                    'S'},
    {         "reverse",       no_argument, nullptr,            OPT_REVERSE},
    {        "sys-root", required_argument, nullptr,           OPT_SYS_ROOT},
    {        "dev-root", required_argument, nullptr,           OPT_DEV_ROOT},
    {        "smartctl", required_argument, nullptr,           OPT_SMARTCTL},
    {            "sudo",       no_argument, nullptr,               OPT_SUDO},
    {              "df", required_argument, nullptr,                 OPT_DF},
    {        "encoding", required_argument, nullptr,           OPT_ENCODING},
    {         "verbose",       no_argument, nullptr,                    'v'},
    {           nullptr,                 0, nullptr,                      0}
};

auto json_escape(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size() + 2);
    out += '"';
    for (const char c : text) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += std::format("\\u{:04x}", static_cast<unsigned char>(c));
                } else {
                    out += c;
                }
                break;
        }
    }
    out += '"';
    return out;
}

// Absent and failed attributes both print as null
template<typename T>
auto json_value(const util::Attribute<T>& attr) -> std::string {
    if (!attr) {
        return "null";
    }
    if constexpr (std::is_same_v<T, std::string>) {
        return json_escape(attr.value());
    } else {
        return std::format("{}", attr.value());
    }
}

auto json_list(const std::vector<std::string>& items) -> std::string {
    std::string out{"["};
    for (size_t i = 0; i < items.size(); ++i) {
        out += json_escape(items[i]);
        if (i + 1 < items.size()) {
            out += ", ";
        }
    }
    out += ']';
    return out;
}

template<typename T>
auto display_value(const util::Attribute<T>& attr) -> std::string {
    if (attr.is_failed()) {
        return std::format("<{}>", attr.get_error().message);
    }
    if (attr.is_absent()) {
        return "-";
    }
    return std::format("{}", attr.value());
}

auto display_normalized(const std::optional<int>& value) -> std::string {
    return value ? std::to_string(*value) : std::string{"---"};
}

auto display_list(const std::vector<std::string>& items) -> std::string {
    if (items.empty()) {
        return "-";
    }
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += ' ';
        }
        out += item;
    }
    return out;
}

auto format_size(uint64_t sectors) -> std::string {
    const auto [value, unit] = util::size_in_hrf(sectors * SECTOR_SIZE);
    return std::format("{:.1f} {}", value, unit);
}

void parse_type_set(const char* arg, diskinfo::DiskTypeSet& out, std::string& error) {
    auto parsed = diskinfo::DiskTypeSet::parse(arg);
    if (!parsed) {
        error = std::format("invalid disk type list '{}'", arg);
        return;
    }
    out = *parsed;
}

}  // namespace

CliApplication::CliApplication() = default;

CliApplication::~CliApplication() = default;

auto CliApplication::run(int argc, char* argv[]) -> int {
    auto options = parse_args(argc, argv);

    // Initialize logger for CLI application
    auto log_dir = std::filesystem::path(g_get_user_data_dir()) / "diskinfo" / "logs";
    util::Logger::instance().initialize(
        log_dir, APP_NAME, options.verbose ? util::LogLevel::DEBUG : util::LogLevel::INFO);
    util::Logger::instance().set_console_output(options.verbose);

    if (!options.error.empty()) {
        std::cerr << "Error: " << options.error << "\n"
                  << "Run with --help to see available options.\n";
        return 1;
    }

    if (options.show_help) {
        print_help();
        return 0;
    }

    if (options.show_version) {
        print_version();
        return 0;
    }

    sources_ = diskinfo::make_system_sources(options.config);

    if (options.disk) {
        return cmd_show(options);
    }

    if (options.list_disks) {
        return cmd_list(options);
    }

    // No command specified
    print_help();
    return 1;
}

auto CliApplication::parse_args(int argc, char* argv[]) -> CliOptions {
    CliOptions options;

    // Allow repeated parsing in one process (tests)
    optind = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "hVljd:pstSv", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 'l':
                options.list_disks = true;
                break;
            case 'j':
                options.json_output = true;
                break;
            case 'd':
                options.disk = optarg;
                break;
            case OPT_BY_ID:
                options.selector = DiskSelector::BY_ID;
                break;
            case OPT_BY_PATH:
                options.selector = DiskSelector::BY_PATH;
                break;
            case OPT_SERIAL:
                options.selector = DiskSelector::SERIAL;
                break;
            case OPT_WWN:
                options.selector = DiskSelector::WWN;
                break;
            case 'p':
                options.show_partitions = true;
                break;
            case 's':
                options.show_smart = true;
                break;
            case OPT_NO_STANDBY_CHECK:
                options.skip_standby_check = true;
                break;
            case 't':
                options.show_temperature = true;
                break;
            case OPT_INCLUDE:
                parse_type_set(optarg, options.filter.include, options.error);
                break;
            case OPT_EXCLUDE:
                parse_type_set(optarg, options.filter.exclude, options.error);
                break;
            case 'S':
                options.sort = true;
                break;
            case OPT_REVERSE:
                options.reverse = true;
                break;
            case OPT_SYS_ROOT:
                options.config.paths.sys_root = optarg;
                break;
            case OPT_DEV_ROOT:
                options.config.paths.dev_root = optarg;
                break;
            case OPT_SMARTCTL:
                options.config.smart.smartctl_path = optarg;
                break;
            case OPT_SUDO:
                options.config.smart.use_sudo = true;
                break;
            case OPT_DF:
                options.config.df_path = optarg;
                break;
            case OPT_ENCODING:
                options.config.text_encoding = optarg;
                break;
            case 'v':
                options.verbose = true;
                break;
            default:
                options.show_help = true;
                break;
        }
    }

    if (optind < argc) {
        options.error = std::format("unexpected argument '{}'", argv[optind]);
    }

    return options;
}

auto CliApplication::make_identifier(const std::string& value, DiskSelector selector)
    -> diskinfo::DiskIdentifier {
    diskinfo::DiskIdentifier id;
    switch (selector) {
        case DiskSelector::NAME_OR_PATH:
            if (value.starts_with('/')) {
                id.path = value;
            } else {
                id.name = value;
            }
            break;
        case DiskSelector::BY_ID:
            id.byid = value;
            break;
        case DiskSelector::BY_PATH:
            id.bypath = value;
            break;
        case DiskSelector::SERIAL:
            id.serial = value;
            break;
        case DiskSelector::WWN:
            id.wwn = value;
            break;
    }
    return id;
}

void CliApplication::print_help() {
    std::cout << "Usage: " << APP_NAME << " [OPTIONS]\n\n"
              << "Block device discovery and attribute inspection\n\n"
              << "Commands:\n"
              << "  -l, --list              List disks\n"
              << "  -d, --disk <id>         Show one disk (kernel name or /dev path)\n\n"
              << "Disk selection (with --disk):\n"
              << "      --by-id             <id> is a /dev/disk/by-id name\n"
              << "      --by-path           <id> is a /dev/disk/by-path name\n"
              << "      --serial            <id> is a serial number\n"
              << "      --wwn               <id> is a World Wide Name\n\n"
              << "Disk details (with --disk):\n"
              << "  -p, --partitions        Show partitions\n"
              << "  -s, --smart             Show SMART data\n"
              << "      --no-standby-check  Read SMART data even if the disk sleeps\n"
              << "  -t, --temperature       Show current temperature\n\n"
              << "Listing (with --list):\n"
              << "  -j, --json              Output in JSON format\n"
              << "      --include <types>   Disk types to list (default: HDD,SSD,NVME)\n"
              << "      --exclude <types>   Disk types to leave out\n"
              << "  -S, --sort              Sort by kernel name\n"
              << "      --reverse           Reverse the sort order\n\n"
              << "Sources:\n"
              << "      --sys-root <dir>    sysfs root (default: /sys)\n"
              << "      --dev-root <dir>    device root (default: /dev)\n"
              << "      --smartctl <path>   smartctl binary (default: /usr/sbin/smartctl)\n"
              << "      --sudo              Run smartctl through sudo\n"
              << "      --df <path>         df binary (default: df)\n"
              << "      --encoding <name>   Charset of partition labels (default: locale)\n\n"
              << "Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  -V, --version           Show version information\n"
              << "  -v, --verbose           Log debug messages to stderr\n\n"
              << "Disk types: HDD, SSD, NVME, LOOP, OTHER (comma separated)\n\n"
              << "Examples:\n"
              << "  " << APP_NAME << " --list --sort\n"
              << "  " << APP_NAME << " --list --json --include SSD,NVME\n"
              << "  " << APP_NAME << " --disk sda --partitions --smart\n"
              << "  " << APP_NAME << " --disk S3D2NY0J819218R --serial --temperature\n"
              << std::endl;
}

void CliApplication::print_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Part of diskinfo - Block device discovery library\n";
}

auto CliApplication::cmd_list(const CliOptions& options) -> int {
    const diskinfo::DiskDiscovery discovery{sources_};
    auto disks = discovery.discover(diskinfo::DiscoveryOptions{
        .filter = options.filter, .sort = options.sort, .reverse = options.reverse});
    if (!disks) {
        LOG_ERROR("CLI", disks.error().what());
        std::cerr << "Error: " << disks.error().what() << "\n";
        return 1;
    }

    if (disks->empty()) {
        if (options.json_output) {
            std::cout << "[]\n";
        } else {
            std::cout << "No disks found.\n";
        }
        return 0;
    }

    if (options.json_output) {
        print_disks_json(*disks);
    } else {
        print_disks_table(*disks);
    }

    return 0;
}

auto CliApplication::cmd_show(const CliOptions& options) -> int {
    const diskinfo::DiskBuilder builder{sources_};
    auto disk = builder.build(make_identifier(*options.disk, options.selector));
    if (!disk) {
        LOG_ERROR("CLI", disk.error().what());
        std::cerr << "Error: " << disk.error().what() << "\n";
        return 1;
    }

    if (options.json_output) {
        print_disks_json({*disk});
    } else {
        print_disk_details(*disk);
    }

    if (options.show_partitions) {
        print_partitions(*disk);
    }
    if (options.show_smart) {
        print_smart(*disk, options.skip_standby_check);
    }
    if (options.show_temperature) {
        print_temperature(*disk);
    }

    return 0;
}

void CliApplication::print_disks_json(const std::vector<diskinfo::Disk>& disks) {
    std::cout << "[\n";
    for (size_t i = 0; i < disks.size(); ++i) {
        const auto& disk = disks[i];

        std::cout << "  {\n";
        std::cout << "    \"name\": " << json_escape(disk.get_name()) << ",\n";
        std::cout << "    \"path\": " << json_escape(disk.get_path()) << ",\n";
        std::cout << "    \"type\": " << json_escape(disk.get_type_str()) << ",\n";
        std::cout << "    \"device_id\": " << json_escape(disk.get_device_id().to_string())
                  << ",\n";
        std::cout << "    \"size_bytes\": " << disk.get_size() * SECTOR_SIZE << ",\n";
        std::cout << "    \"model\": " << json_value(disk.get_model()) << ",\n";
        std::cout << "    \"serial\": " << json_value(disk.get_serial_number()) << ",\n";
        std::cout << "    \"firmware\": " << json_value(disk.get_firmware()) << ",\n";
        std::cout << "    \"wwn\": " << json_value(disk.get_wwn()) << ",\n";
        std::cout << "    \"by_id\": " << json_list(disk.get_byid_path()) << ",\n";
        std::cout << "    \"by_path\": " << json_list(disk.get_bypath_path()) << ",\n";
        std::cout << "    \"physical_block_size\": " << json_value(disk.get_physical_block_size())
                  << ",\n";
        std::cout << "    \"logical_block_size\": " << json_value(disk.get_logical_block_size())
                  << ",\n";
        std::cout << "    \"partition_table_type\": "
                  << json_value(disk.get_partition_table_type()) << ",\n";
        std::cout << "    \"partition_table_uuid\": "
                  << json_value(disk.get_partition_table_uuid()) << "\n";
        std::cout << "  }" << (i < disks.size() - 1 ? "," : "") << "\n";
    }
    std::cout << "]\n";
}

void CliApplication::print_disks_table(const std::vector<diskinfo::Disk>& disks) {
    // Column widths for table formatting
    constexpr int COL_NAME = 10;
    constexpr int COL_MODEL = 30;
    constexpr int COL_SERIAL = 22;
    constexpr int COL_SIZE = 12;
    constexpr int COL_TYPE = 7;
    constexpr int COL_ID = 8;

    // Print header
    std::cout << std::left << std::setw(COL_NAME) << "NAME" << std::setw(COL_MODEL) << "MODEL"
              << std::setw(COL_SERIAL) << "SERIAL" << std::setw(COL_SIZE) << "SIZE"
              << std::setw(COL_TYPE) << "TYPE" << std::setw(COL_ID) << "DEV"
              << "\n";
    std::cout << std::string(COL_NAME + COL_MODEL + COL_SERIAL + COL_SIZE + COL_TYPE + COL_ID, '-')
              << "\n";

    // Print disks
    for (const auto& disk : disks) {
        // Truncate model if too long
        std::string model = disk.get_model().value_or("-");
        if (model.length() > COL_MODEL - 2) {
            model = model.substr(0, COL_MODEL - 5) + "...";
        }

        std::cout << std::left << std::setw(COL_NAME) << disk.get_name() << std::setw(COL_MODEL)
                  << model << std::setw(COL_SERIAL) << disk.get_serial_number().value_or("-")
                  << std::setw(COL_SIZE) << format_size(disk.get_size()) << std::setw(COL_TYPE)
                  << disk.get_type_str() << std::setw(COL_ID) << disk.get_device_id().to_string()
                  << "\n";
    }
}

void CliApplication::print_disk_details(const diskinfo::Disk& disk) {
    std::cout << "[" << disk.get_name() << "]\n";
    std::cout << "  path:                  " << disk.get_path() << "\n";
    std::cout << "  model:                 " << display_value(disk.get_model()) << "\n";
    std::cout << "  size:                  " << format_size(disk.get_size()) << "\n";
    std::cout << "  serial:                " << display_value(disk.get_serial_number()) << "\n";
    std::cout << "  firmware:              " << display_value(disk.get_firmware()) << "\n";
    std::cout << "  device type:           " << disk.get_type_str() << "\n";
    std::cout << "  by-id path:            " << display_list(disk.get_byid_path()) << "\n";
    std::cout << "  by-path path:          " << display_list(disk.get_bypath_path()) << "\n";
    std::cout << "  wwn id:                " << display_value(disk.get_wwn()) << "\n";
    std::cout << "  device id:             " << disk.get_device_id().to_string() << "\n";
    std::cout << "  physical block size:   " << display_value(disk.get_physical_block_size())
              << "\n";
    std::cout << "  logical block size:    " << display_value(disk.get_logical_block_size())
              << "\n";
    std::cout << "  partition table type:  " << display_value(disk.get_partition_table_type())
              << "\n";
    std::cout << "  partition table uuid:  " << display_value(disk.get_partition_table_uuid())
              << "\n";
}

void CliApplication::print_partitions(const diskinfo::Disk& disk) {
    auto partitions = disk.get_partition_list();
    if (!partitions) {
        std::cerr << "Error: " << partitions.error().what() << "\n";
        return;
    }

    std::cout << "\nPartitions:\n";
    if (partitions->empty()) {
        std::cout << "  (none)\n";
        return;
    }

    for (const auto& part : *partitions) {
        std::string size = "-";
        if (auto hrf = part.get_part_size_in_hrf()) {
            size = std::format("{:.1f} {}", hrf->first, hrf->second);
        }
        std::string free_size = "-";
        if (auto hrf = part.get_fs_free_size_in_hrf()) {
            free_size = std::format("{:.1f} {}", hrf->first, hrf->second);
        }

        std::cout << "  [" << display_value(part.get_part_number()) << "] " << part.get_path()
                  << "\n";
        std::cout << "    size:         " << size << "\n";
        std::cout << "    label:        " << display_value(part.get_part_label()) << "\n";
        std::cout << "    part uuid:    " << display_value(part.get_part_uuid()) << "\n";
        std::cout << "    part type:    " << display_value(part.get_part_type()) << "\n";
        std::cout << "    fs type:      " << display_value(part.get_fs_type()) << "\n";
        std::cout << "    fs label:     " << display_value(part.get_fs_label()) << "\n";
        std::cout << "    fs uuid:      " << display_value(part.get_fs_uuid()) << "\n";
        std::cout << "    mount point:  " << display_value(part.get_fs_mounting_point()) << "\n";
        std::cout << "    free:         " << free_size << "\n";
    }
}

void CliApplication::print_smart(const diskinfo::Disk& disk, bool skip_standby_check) {
    auto smart = disk.get_smart_data(skip_standby_check);
    if (!smart) {
        std::cerr << "Error: " << smart.error().what() << "\n";
        return;
    }

    std::cout << "\nSMART:\n";
    if (smart->standby_mode()) {
        std::cout << "  Disk is in standby mode (use --no-standby-check to wake it)\n";
        return;
    }

    std::cout << "  capable:  " << (smart->smart_capable() ? "yes" : "no") << "\n";
    std::cout << "  enabled:  " << (smart->smart_enabled() ? "yes" : "no") << "\n";
    std::cout << "  healthy:  " << (smart->healthy() ? "yes" : "no") << "\n";

    if (const auto& nvme = smart->nvme_attributes()) {
        auto row = [](std::string_view label, const auto& value) {
            std::cout << "  " << std::left << std::setw(36) << label;
            if (value) {
                std::cout << *value;
            } else {
                std::cout << "-";
            }
            std::cout << "\n";
        };
        row("critical warning:", nvme->critical_warning);
        row("temperature:", nvme->temperature);
        row("available spare:", nvme->available_spare);
        row("available spare threshold:", nvme->available_spare_threshold);
        row("percentage used:", nvme->percentage_used);
        row("data units read:", nvme->data_units_read);
        row("data units written:", nvme->data_units_written);
        row("host read commands:", nvme->host_read_commands);
        row("host write commands:", nvme->host_write_commands);
        row("controller busy time:", nvme->controller_busy_time);
        row("power cycles:", nvme->power_cycles);
        row("unsafe shutdowns:", nvme->unsafe_shutdowns);
        row("media and data integrity errors:", nvme->media_and_data_integrity_errors);
        row("error information log entries:", nvme->error_information_log_entries);
        if (nvme->power_on_hours) {
            const auto [value, unit] =
                util::time_in_hrf(*nvme->power_on_hours, util::TimeUnit::HOUR);
            std::cout << "  " << std::left << std::setw(36) << "power on time:"
                      << std::format("{:.1f} {}", value, unit) << "\n";
        }
        return;
    }

    std::cout << "  " << std::left << std::setw(5) << "ID" << std::setw(28) << "ATTRIBUTE"
              << std::setw(7) << "VALUE" << std::setw(7) << "WORST" << std::setw(7) << "THRESH"
              << "RAW\n";
    for (const auto& attr : smart->smart_attributes()) {
        std::cout << "  " << std::left << std::setw(5) << attr.id << std::setw(28) << attr.name
                  << std::setw(7) << display_normalized(attr.value) << std::setw(7)
                  << display_normalized(attr.worst) << std::setw(7)
                  << display_normalized(attr.thresh) << attr.raw_value << "\n";
    }
}

void CliApplication::print_temperature(const diskinfo::Disk& disk) {
    auto temperature = disk.get_temperature();
    if (!temperature) {
        std::cerr << "Error: " << temperature.error().what() << "\n";
        return;
    }

    if (*temperature) {
        std::cout << "\nTemperature: " << std::format("{:.1f}", **temperature) << " C\n";
    } else {
        std::cout << "\nTemperature: not reported\n";
    }
}

}  // namespace cli
