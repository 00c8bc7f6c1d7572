/**
 * @file SmartctlBackendTest.cpp
 * @brief Unit tests for SmartctlBackend command building and report parsing
 */

#include "services/SmartctlBackend.hpp"

#include "mocks/MockCommandRunner.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>

using diskinfo::DiskType;
using diskinfo::SmartctlBackend;
using diskinfo::SmartQuery;
using testing::_;
using testing::ElementsAre;
using testing::Return;

namespace {

constexpr const char* ATA_OUTPUT = R"(smartctl 7.3 2022-02-28 r5338 [x86_64-linux-6.1.0] (local build)
Copyright (C) 2002-22, Bruce Allen, Christian Franke, www.smartmontools.org

=== START OF INFORMATION SECTION ===
Model Family:     Samsung based SSDs
Device Model:     Samsung SSD 850 PRO 1TB
Serial Number:    S3D2NY0J819218R
Firmware Version: EXM04B6Q
SMART support is: Available - device has SMART capability.
SMART support is: Enabled

=== START OF READ SMART DATA SECTION ===
SMART overall-health self-assessment test result: PASSED

SMART Attributes Data Structure revision number: 1
Vendor Specific SMART Attributes with Thresholds:
ID# ATTRIBUTE_NAME          FLAG     VALUE WORST THRESH TYPE      UPDATED  WHEN_FAILED RAW_VALUE
  5 Reallocated_Sector_Ct   0x0033   100   100   010    Pre-fail  Always       -       0
  9 Power_On_Hours          0x0032   095   095   000    Old_age   Always       -       24138
 12 Power_Cycle_Count       0x0032   099   099   000    Old_age   Always       -       1024
194 Temperature_Celsius     0x0022   064   050   000    Old_age   Always       -       36 (Min/Max 20/45)

)";

constexpr const char* NVME_OUTPUT = R"(smartctl 7.3 2022-02-28 r5338 [x86_64-linux-6.1.0] (local build)

=== START OF INFORMATION SECTION ===
Model Number:                       Samsung SSD 970 EVO Plus 500GB
Serial Number:                      S4EWNX0R123456

=== START OF SMART DATA SECTION ===
SMART overall-health self-assessment test result: PASSED

SMART/Health Information (NVMe Log 0x02)
Critical Warning:                   0x04
Temperature:                        41 Celsius
Available Spare:                    100%
Available Spare Threshold:          10%
Percentage Used:                    2%
Data Units Read:                    12,345,678 [6.32 TB]
Data Units Written:                 23,456,789 [12.0 TB]
Host Read Commands:                 123,456,789
Host Write Commands:                234,567,890
Controller Busy Time:               1,234
Power Cycles:                       1,024
Power On Hours:                     6,516
Unsafe Shutdowns:                   56
Media and Data Integrity Errors:    0
Error Information Log Entries:      12
Warning  Comp. Temperature Time:    3
Critical Comp. Temperature Time:    1
Temperature Sensor 1:               45 Celsius
)";

constexpr const char* SCSI_OUTPUT = R"(=== START OF INFORMATION SECTION ===
Vendor:               SEAGATE
Product:              ST4000NM0023
SMART support is:     Available - device has SMART capability.
SMART support is:     Enabled

=== START OF READ SMART DATA SECTION ===
SMART Health Status: OK

Current Drive Temperature:     38 C
Drive Trip Temperature:        68 C
)";

constexpr const char* STANDBY_OUTPUT = R"(smartctl 7.3 2022-02-28 r5338 [x86_64-linux-6.1.0] (local build)

Device is in STANDBY mode, exit(2)
)";

}  // namespace

class SmartctlBackendTest : public ::testing::Test {
protected:
    std::shared_ptr<MockCommandRunner> runner;

    void SetUp() override { runner = std::make_shared<testing::NiceMock<MockCommandRunner>>(); }

    auto MakeBackend(bool use_sudo = false) -> SmartctlBackend {
        return SmartctlBackend{runner, diskinfo::SmartOptions{.smartctl_path = "/usr/sbin/smartctl",
                                                              .use_sudo = use_sudo}};
    }
};

// ========== build_command Tests ==========

TEST_F(SmartctlBackendTest, BuildCommand_CheckStandby_AddsNoWakeFlag) {
    auto backend = MakeBackend();
    EXPECT_THAT(backend.build_command(SmartQuery{.device_path = "/dev/sda"}),
                ElementsAre("/usr/sbin/smartctl", "-n", "standby", "-H", "-i", "-A", "/dev/sda"));
}

TEST_F(SmartctlBackendTest, BuildCommand_SkipStandbyWithSudo) {
    auto backend = MakeBackend(true);
    EXPECT_THAT(backend.build_command(SmartQuery{
                    .device_path = "/dev/sdb", .type = DiskType::HDD, .check_standby = false}),
                ElementsAre("sudo", "/usr/sbin/smartctl", "-H", "-i", "-A", "/dev/sdb"));
}

// ========== read Tests ==========

TEST_F(SmartctlBackendTest, Read_AtaOutput_ParsesReport) {
    EXPECT_CALL(*runner, run(ElementsAre("/usr/sbin/smartctl", "-n", "standby", "-H", "-i", "-A",
                                         "/dev/sda")))
        .WillOnce(Return(MockCommandRunner::Output(ATA_OUTPUT)));

    auto backend = MakeBackend();
    auto report = backend.read(SmartQuery{.device_path = "/dev/sda", .type = DiskType::SSD});
    ASSERT_TRUE(report.has_value()) << report.error().what();
    EXPECT_FALSE(report->standby);
    EXPECT_EQ(report->healthy, std::optional<bool>{true});
    EXPECT_TRUE(report->smart_capable);
    EXPECT_TRUE(report->smart_enabled);
    ASSERT_EQ(report->attributes.size(), 4u);

    const auto& reallocated = report->attributes[0];
    EXPECT_EQ(reallocated.id, 5);
    EXPECT_EQ(reallocated.name, "Reallocated_Sector_Ct");
    EXPECT_EQ(reallocated.flag, 0x33);
    EXPECT_EQ(reallocated.value, std::optional<int>{100});
    EXPECT_EQ(reallocated.thresh, std::optional<int>{10});
    EXPECT_EQ(reallocated.type, "Pre-fail");
    EXPECT_EQ(reallocated.updated, "Always");
    EXPECT_EQ(reallocated.when_failed, "-");

    EXPECT_EQ(report->attributes[1].raw_value, 24'138u);
    EXPECT_EQ(report->attributes[3].raw_value, 36u);
    EXPECT_EQ(report->temperature, std::optional<int>{36});
    EXPECT_FALSE(report->nvme.has_value());
}

TEST_F(SmartctlBackendTest, Read_StandbyOutput_ReportsStandby) {
    ON_CALL(*runner, run(_)).WillByDefault(Return(MockCommandRunner::Output(STANDBY_OUTPUT, 2)));

    auto backend = MakeBackend();
    auto report = backend.read(SmartQuery{.device_path = "/dev/sdb", .type = DiskType::HDD});
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->standby);
    EXPECT_TRUE(report->attributes.empty());
    EXPECT_FALSE(report->healthy.has_value());
}

TEST_F(SmartctlBackendTest, Read_DeviceOpenFailed_ReturnsSmartUnavailable) {
    ON_CALL(*runner, run(_))
        .WillByDefault(Return(MockCommandRunner::Output(
            "Smartctl open device: /dev/sda failed: Permission denied\n", 2)));

    auto backend = MakeBackend();
    auto report = backend.read(SmartQuery{.device_path = "/dev/sda"});
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, util::ErrorKind::SMART_UNAVAILABLE);
    EXPECT_EQ(report.error().code, EACCES);
}

TEST_F(SmartctlBackendTest, Read_CommandLineError_ReturnsSmartUnavailable) {
    ON_CALL(*runner, run(_))
        .WillByDefault(Return(MockCommandRunner::Output("", 1, "unknown option\n")));

    auto backend = MakeBackend();
    auto report = backend.read(SmartQuery{.device_path = "/dev/sda"});
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, util::ErrorKind::SMART_UNAVAILABLE);
    EXPECT_NE(report.error().message.find("unknown option"), std::string::npos);
}

TEST_F(SmartctlBackendTest, Read_FailingDiskStatusBits_StillParses) {
    // Bit 3: disk failing; the report is complete
    ON_CALL(*runner, run(_)).WillByDefault(Return(MockCommandRunner::Output(ATA_OUTPUT, 0x08)));

    auto backend = MakeBackend();
    auto report = backend.read(SmartQuery{.device_path = "/dev/sda"});
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->attributes.size(), 4u);
}

TEST_F(SmartctlBackendTest, Read_RunnerFailure_ReturnsSmartUnavailable) {
    ON_CALL(*runner, run(_))
        .WillByDefault(Return(std::expected<diskinfo::CommandOutput, util::Error>{
            std::unexpected(util::Error{util::ErrorKind::COMMAND, {}, "/usr/sbin/smartctl",
                                        "No such file or directory", ENOENT})}));

    auto backend = MakeBackend();
    auto report = backend.read(SmartQuery{.device_path = "/dev/sda"});
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, util::ErrorKind::SMART_UNAVAILABLE);
    EXPECT_EQ(report.error().code, ENOENT);
    EXPECT_EQ(report.error().device, "/dev/sda");
}

// ========== parse_report Tests ==========

TEST(SmartctlParseTest, ParseReport_Nvme_ReadsHealthLog) {
    auto report = SmartctlBackend::parse_report(NVME_OUTPUT, DiskType::NVME, "/dev/nvme0n1");
    ASSERT_TRUE(report.has_value()) << report.error().what();
    ASSERT_TRUE(report->nvme.has_value());
    const auto& nvme = *report->nvme;

    EXPECT_EQ(nvme.critical_warning, 4);
    EXPECT_EQ(nvme.temperature, 41);
    EXPECT_EQ(nvme.available_spare, 100);
    EXPECT_EQ(nvme.available_spare_threshold, 10);
    EXPECT_EQ(nvme.percentage_used, 2);
    EXPECT_EQ(nvme.data_units_read, 12'345'678u);
    EXPECT_EQ(nvme.data_units_written, 23'456'789u);
    EXPECT_EQ(nvme.host_read_commands, 123'456'789u);
    EXPECT_EQ(nvme.host_write_commands, 234'567'890u);
    EXPECT_EQ(nvme.controller_busy_time, 1'234u);
    EXPECT_EQ(nvme.power_cycles, 1'024u);
    EXPECT_EQ(nvme.power_on_hours, 6'516u);
    EXPECT_EQ(nvme.unsafe_shutdowns, 56u);
    EXPECT_EQ(nvme.media_and_data_integrity_errors, 0u);
    EXPECT_EQ(nvme.error_information_log_entries, 12u);
    EXPECT_EQ(nvme.warning_composite_temperature_time, 3u);
    EXPECT_EQ(nvme.critical_composite_temperature_time, 1u);

    EXPECT_EQ(report->healthy, std::optional<bool>{true});
    EXPECT_TRUE(report->smart_capable);
    EXPECT_TRUE(report->smart_enabled);
    EXPECT_EQ(report->temperature, std::optional<int>{41});
    EXPECT_TRUE(report->attributes.empty());
}

TEST(SmartctlParseTest, ParseReport_NvmeWithoutHealthLog_ReturnsParseError) {
    auto report = SmartctlBackend::parse_report(ATA_OUTPUT, DiskType::NVME, "/dev/nvme0n1");
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, util::ErrorKind::SMART_PARSE);
}

TEST(SmartctlParseTest, ParseReport_Scsi_ReadsHealthAndTemperature) {
    auto report = SmartctlBackend::parse_report(SCSI_OUTPUT, DiskType::HDD, "/dev/sdc");
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->healthy, std::optional<bool>{true});
    EXPECT_EQ(report->temperature, std::optional<int>{38});
    EXPECT_TRUE(report->smart_capable);
    EXPECT_TRUE(report->smart_enabled);
    EXPECT_TRUE(report->attributes.empty());
}

TEST(SmartctlParseTest, ParseReport_FailedSelfAssessment_IsUnhealthy) {
    auto report = SmartctlBackend::parse_report(
        "SMART overall-health self-assessment test result: FAILED!\n", DiskType::HDD, "/dev/sdb");
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->healthy, std::optional<bool>{false});
}

TEST(SmartctlParseTest, ParseReport_UnrecognizedOutput_ReturnsParseError) {
    auto report = SmartctlBackend::parse_report("garbage\nmore garbage\n", DiskType::HDD, "/dev/sdb");
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, util::ErrorKind::SMART_PARSE);
    EXPECT_EQ(report.error().device, "/dev/sdb");
}

TEST(SmartctlParseTest, ParseReport_UnreportedNormalizedColumns_KeepsRow) {
    auto report = SmartctlBackend::parse_report(
        "SMART overall-health self-assessment test result: PASSED\n"
        "ID# ATTRIBUTE_NAME FLAG VALUE WORST THRESH TYPE UPDATED WHEN_FAILED RAW_VALUE\n"
        "  9 Power_On_Hours 0x0032 099 099 --- Old_age Always - 1234\n"
        "194 Temperature_Celsius 0x0022 --- --- --- Old_age Always - 33\n",
        DiskType::HDD, "/dev/sdb");
    ASSERT_TRUE(report.has_value()) << report.error().what();
    EXPECT_EQ(report->healthy, std::optional<bool>{true});
    ASSERT_EQ(report->attributes.size(), 2u);

    const auto& hours = report->attributes[0];
    EXPECT_EQ(hours.value, std::optional<int>{99});
    EXPECT_EQ(hours.worst, std::optional<int>{99});
    EXPECT_EQ(hours.thresh, std::nullopt);
    EXPECT_EQ(hours.raw_value, 1234u);

    const auto& temperature = report->attributes[1];
    EXPECT_EQ(temperature.value, std::nullopt);
    EXPECT_EQ(temperature.thresh, std::nullopt);
    EXPECT_EQ(report->temperature, std::optional<int>{33});
}

TEST(SmartctlParseTest, ParseReport_NonNumericNormalizedColumn_ReturnsParseError) {
    auto report = SmartctlBackend::parse_report(
        "ID# ATTRIBUTE_NAME FLAG VALUE WORST THRESH TYPE UPDATED WHEN_FAILED RAW_VALUE\n"
        "  9 Power_On_Hours 0x0032 099 099 n/a Old_age Always - 1234\n",
        DiskType::HDD, "/dev/sdb");
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, util::ErrorKind::SMART_PARSE);
}

TEST(SmartctlParseTest, ParseReport_MalformedAttributeRow_ReturnsParseError) {
    auto report = SmartctlBackend::parse_report(
        "ID# ATTRIBUTE_NAME FLAG VALUE WORST THRESH TYPE UPDATED WHEN_FAILED RAW_VALUE\n"
        "  5 Reallocated_Sector_Ct 0x0033 100\n",
        DiskType::HDD, "/dev/sdb");
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, util::ErrorKind::SMART_PARSE);
    EXPECT_EQ(report.error().subject, "attributes");
}
