/**
 * @file SmartctlBackend.cpp
 * @brief SMART data retrieval through smartctl
 */

#include "services/SmartctlBackend.hpp"

#include "util/Logger.hpp"
#include "util/Strings.hpp"

#include <array>
#include <cerrno>
#include <format>
#include <utility>

namespace diskinfo {

namespace {

// smartctl exit status bits (see smartctl(8) RETURN VALUES)
constexpr int EXIT_COMMAND_LINE_ERROR = 0x01;
constexpr int EXIT_DEVICE_OPEN_FAILED = 0x02;

// ATA attribute IDs carrying the drive temperature
constexpr int ATTR_AIRFLOW_TEMPERATURE = 190;
constexpr int ATTR_TEMPERATURE = 194;

constexpr std::size_t ATTRIBUTE_COLUMNS = 10;

constexpr std::string_view STANDBY_MARKER{"Device is in STANDBY mode"};
constexpr std::string_view SLEEP_MARKER{"Device is in SLEEP mode"};
constexpr std::string_view SUPPORT_PREFIX{"SMART support is:"};
constexpr std::string_view ATA_HEALTH_PREFIX{"SMART overall-health self-assessment test result:"};
constexpr std::string_view SCSI_HEALTH_PREFIX{"SMART Health Status:"};
constexpr std::string_view SCSI_TEMPERATURE_PREFIX{"Current Drive Temperature:"};
constexpr std::string_view ATA_TABLE_HEADER{"ID#"};
constexpr std::string_view NOT_REPORTED{"---"};
constexpr std::string_view NVME_LOG_HEADER{"SMART/Health Information"};

using NvmeCounter = std::optional<uint64_t> NvmeAttributes::*;
using NvmeGauge = std::optional<int> NvmeAttributes::*;

constexpr std::array<std::pair<std::string_view, NvmeCounter>, 12> NVME_COUNTERS{{
    {"Data Units Read", &NvmeAttributes::data_units_read},
    {"Data Units Written", &NvmeAttributes::data_units_written},
    {"Host Read Commands", &NvmeAttributes::host_read_commands},
    {"Host Write Commands", &NvmeAttributes::host_write_commands},
    {"Controller Busy Time", &NvmeAttributes::controller_busy_time},
    {"Power Cycles", &NvmeAttributes::power_cycles},
    {"Power On Hours", &NvmeAttributes::power_on_hours},
    {"Unsafe Shutdowns", &NvmeAttributes::unsafe_shutdowns},
    {"Media and Data Integrity Errors", &NvmeAttributes::media_and_data_integrity_errors},
    {"Error Information Log Entries", &NvmeAttributes::error_information_log_entries},
    {"Warning Comp. Temperature Time", &NvmeAttributes::warning_composite_temperature_time},
    {"Critical Comp. Temperature Time", &NvmeAttributes::critical_composite_temperature_time},
}};

constexpr std::array<std::pair<std::string_view, NvmeGauge>, 4> NVME_GAUGES{{
    {"Temperature", &NvmeAttributes::temperature},
    {"Available Spare", &NvmeAttributes::available_spare},
    {"Available Spare Threshold", &NvmeAttributes::available_spare_threshold},
    {"Percentage Used", &NvmeAttributes::percentage_used},
}};

enum class Section { NONE, ATA_TABLE, NVME_LOG };

/**
 * Collapse inner runs of spaces ("Warning  Comp. Temperature Time")
 */
auto normalize_key(std::string_view key) -> std::string {
    std::string out;
    for (const auto word : util::split_whitespace(key)) {
        if (!out.empty()) {
            out += ' ';
        }
        out += word;
    }
    return out;
}

auto to_int(std::optional<uint64_t> value) -> std::optional<int> {
    if (!value) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

auto value_after(std::string_view line, std::string_view prefix) -> std::string_view {
    return util::trim(line.substr(prefix.size()));
}

}  // namespace

SmartctlBackend::SmartctlBackend(std::shared_ptr<ICommandRunner> runner, SmartOptions options)
    : runner_(std::move(runner)), options_(std::move(options)) {}

auto SmartctlBackend::build_command(const SmartQuery& query) const -> std::vector<std::string> {
    std::vector<std::string> argv;
    if (options_.use_sudo) {
        argv.emplace_back("sudo");
    }
    argv.push_back(options_.smartctl_path);
    if (query.check_standby) {
        argv.emplace_back("-n");
        argv.emplace_back("standby");
    }
    argv.emplace_back("-H");
    argv.emplace_back("-i");
    argv.emplace_back("-A");
    argv.push_back(query.device_path);
    return argv;
}

auto SmartctlBackend::read(const SmartQuery& query) -> std::expected<SmartReport, util::Error> {
    const auto argv = build_command(query);
    auto output = runner_->run(argv);
    if (!output) {
        const auto& err = output.error();
        LOG_WARNING("SmartctlBackend",
                    std::format("Cannot run {}: {}", options_.smartctl_path, err.message));
        return std::unexpected(util::Error{util::ErrorKind::SMART_UNAVAILABLE, query.device_path,
                                           options_.smartctl_path, err.message, err.code});
    }

    const std::string_view text{output->stdout_data};
    if (text.contains(STANDBY_MARKER) || text.contains(SLEEP_MARKER)) {
        LOG_DEBUG("SmartctlBackend", std::format("{} is in standby, not woken", query.device_path));
        SmartReport report;
        report.standby = true;
        return report;
    }

    if ((output->exit_status & EXIT_COMMAND_LINE_ERROR) != 0) {
        return std::unexpected(util::make_error(
            util::ErrorKind::SMART_UNAVAILABLE, query.device_path, options_.smartctl_path,
            "command rejected (exit status {}): {}", output->exit_status,
            util::trim(output->stderr_data.empty() ? output->stdout_data : output->stderr_data)));
    }
    if ((output->exit_status & EXIT_DEVICE_OPEN_FAILED) != 0) {
        return std::unexpected(util::Error{util::ErrorKind::SMART_UNAVAILABLE, query.device_path,
                                           options_.smartctl_path,
                                           "device open failed or permission denied", EACCES});
    }

    return parse_report(text, query.type, query.device_path);
}

auto SmartctlBackend::parse_report(std::string_view output, DiskType type, std::string_view device)
    -> std::expected<SmartReport, util::Error> {
    SmartReport report;
    NvmeAttributes nvme;
    bool recognized = false;
    bool nvme_log_seen = false;
    Section section = Section::NONE;

    for (const auto raw_line : util::split_lines(output)) {
        const auto line = util::trim(raw_line);

        if (section != Section::NONE) {
            if (line.empty()) {
                section = Section::NONE;
                continue;
            }
            if (section == Section::ATA_TABLE) {
                auto attr = parse_attribute_row(line);
                if (!attr) {
                    return std::unexpected(util::make_error(util::ErrorKind::SMART_PARSE, device,
                                                            "attributes", "malformed row '{}'",
                                                            line));
                }
                report.attributes.push_back(std::move(*attr));
            } else {
                const auto colon = line.find(':');
                if (colon != std::string_view::npos) {
                    parse_nvme_field(line.substr(0, colon), line.substr(colon + 1), nvme);
                }
            }
            continue;
        }

        if (line.starts_with(SUPPORT_PREFIX)) {
            const auto value = value_after(line, SUPPORT_PREFIX);
            if (value.starts_with("Available")) {
                report.smart_capable = true;
            } else if (value.starts_with("Enabled")) {
                report.smart_enabled = true;
            }
            recognized = true;
        } else if (line.starts_with(ATA_HEALTH_PREFIX)) {
            report.healthy = value_after(line, ATA_HEALTH_PREFIX).starts_with("PASSED");
            recognized = true;
        } else if (line.starts_with(SCSI_HEALTH_PREFIX)) {
            report.healthy = value_after(line, SCSI_HEALTH_PREFIX).starts_with("OK");
            recognized = true;
        } else if (line.starts_with(SCSI_TEMPERATURE_PREFIX)) {
            report.temperature = to_int(util::parse_leading_number(
                value_after(line, SCSI_TEMPERATURE_PREFIX)));
        } else if (line.starts_with(ATA_TABLE_HEADER)) {
            section = Section::ATA_TABLE;
            recognized = true;
        } else if (line.starts_with(NVME_LOG_HEADER)) {
            section = Section::NVME_LOG;
            nvme_log_seen = true;
            recognized = true;
        }
    }

    if (type == DiskType::NVME) {
        if (!nvme_log_seen) {
            return std::unexpected(util::Error{util::ErrorKind::SMART_PARSE, std::string{device},
                                               "nvme", "no SMART/Health Information log in output"});
        }
        // The health log itself proves SMART is supported and active
        report.smart_capable = true;
        report.smart_enabled = true;
        report.temperature = nvme.temperature;
        report.nvme = nvme;
        report.attributes.clear();
        return report;
    }

    if (!recognized) {
        return std::unexpected(util::Error{util::ErrorKind::SMART_PARSE, std::string{device},
                                           "smartctl", "unrecognized output"});
    }

    if (!report.temperature) {
        for (const auto& attr : report.attributes) {
            if (attr.id == ATTR_TEMPERATURE || attr.id == ATTR_AIRFLOW_TEMPERATURE) {
                report.temperature = static_cast<int>(attr.raw_value);
                break;
            }
        }
    }
    return report;
}

auto SmartctlBackend::parse_attribute_row(std::string_view line) -> std::optional<SmartAttribute> {
    // ID# ATTRIBUTE_NAME FLAG VALUE WORST THRESH TYPE UPDATED WHEN_FAILED RAW_VALUE
    const auto fields = util::split_whitespace(line);
    if (fields.size() < ATTRIBUTE_COLUMNS) {
        return std::nullopt;
    }

    // "---" stands for a normalized value or threshold the drive does not report
    auto normalized = [](std::string_view field, std::optional<int>& out) -> bool {
        if (field == NOT_REPORTED) {
            out.reset();
            return true;
        }
        out = util::parse_number<int>(field);
        return out.has_value();
    };

    const auto id = util::parse_number<int>(fields[0]);
    const auto flag = util::parse_number<int>(fields[2], 16);
    std::optional<int> value;
    std::optional<int> worst;
    std::optional<int> thresh;
    if (!id || !flag || !normalized(fields[3], value) || !normalized(fields[4], worst) ||
        !normalized(fields[5], thresh)) {
        return std::nullopt;
    }

    return SmartAttribute{
        .id = *id,
        .name = std::string{fields[1]},
        .flag = *flag,
        .value = value,
        .worst = worst,
        .thresh = thresh,
        .type = std::string{fields[6]},
        .updated = std::string{fields[7]},
        .when_failed = std::string{fields[8]},
        .raw_value = util::parse_leading_number(fields[9]).value_or(0),
    };
}

void SmartctlBackend::parse_nvme_field(std::string_view key, std::string_view value,
                                       NvmeAttributes& nvme) {
    const auto name = normalize_key(key);

    if (name == "Critical Warning") {
        nvme.critical_warning = util::parse_number<int>(value, 16);
        return;
    }
    for (const auto& [field_name, member] : NVME_GAUGES) {
        if (name == field_name) {
            nvme.*member = to_int(util::parse_leading_number(value));
            return;
        }
    }
    for (const auto& [field_name, member] : NVME_COUNTERS) {
        if (name == field_name) {
            nvme.*member = util::parse_leading_number(value);
            return;
        }
    }
}

}  // namespace diskinfo
