/**
 * @file MockSmartBackend.hpp
 * @brief Google Mock implementation of ISmartBackend
 */

#pragma once

#include "interfaces/ISmartBackend.hpp"

#include <gmock/gmock.h>

#include <memory>

class MockSmartBackend : public diskinfo::ISmartBackend {
public:
    MOCK_METHOD((std::expected<diskinfo::SmartReport, util::Error>), read,
                (const diskinfo::SmartQuery& query), (override));

    // Helper: Create a nice mock that reports SMART as unavailable
    static std::shared_ptr<MockSmartBackend> CreateNiceMock() {
        auto mock = std::make_shared<testing::NiceMock<MockSmartBackend>>();

        ON_CALL(*mock, read(testing::_))
            .WillByDefault(testing::Return(std::expected<diskinfo::SmartReport, util::Error>{
                std::unexpected(util::Error{util::ErrorKind::SMART_UNAVAILABLE, {}, "smartctl",
                                            "not configured"})}));

        return mock;
    }

    // Helper: Create a report of a healthy ATA disk
    static diskinfo::SmartReport CreateHealthyReport(int temperature = 36) {
        diskinfo::SmartReport report;
        report.healthy = true;
        report.smart_capable = true;
        report.smart_enabled = true;
        report.temperature = temperature;
        report.attributes.push_back(diskinfo::SmartAttribute{.id = 194,
                                                             .name = "Temperature_Celsius",
                                                             .flag = 0x22,
                                                             .value = 64,
                                                             .worst = 50,
                                                             .thresh = 0,
                                                             .type = "Old_age",
                                                             .updated = "Always",
                                                             .when_failed = "-",
                                                             .raw_value = static_cast<uint64_t>(
                                                                 temperature)});
        return report;
    }

    // Helper: Create a report of a sleeping disk
    static diskinfo::SmartReport CreateStandbyReport() {
        diskinfo::SmartReport report;
        report.standby = true;
        return report;
    }
};
