/**
 * @file HumanReadableTest.cpp
 * @brief Unit tests for size and duration formatting
 */

#include "util/HumanReadable.hpp"

#include <gtest/gtest.h>

using util::SizeUnits;
using util::TimeUnit;

// ========== size_in_hrf Tests ==========

TEST(HumanReadableTest, SizeInHrf_SmallValue_StaysInBytes) {
    auto [value, unit] = util::size_in_hrf(512);
    EXPECT_DOUBLE_EQ(value, 512.0);
    EXPECT_EQ(unit, "B");
}

TEST(HumanReadableTest, SizeInHrf_Metric_UsesPowersOf1000) {
    auto [value, unit] = util::size_in_hrf(1'000'000'000'000ULL, SizeUnits::METRIC);
    EXPECT_DOUBLE_EQ(value, 1.0);
    EXPECT_EQ(unit, "TB");
}

TEST(HumanReadableTest, SizeInHrf_Iec_UsesPowersOf1024) {
    auto [value, unit] = util::size_in_hrf(1'024ULL * 1'024 * 1'024, SizeUnits::IEC);
    EXPECT_DOUBLE_EQ(value, 1.0);
    EXPECT_EQ(unit, "GiB");
}

TEST(HumanReadableTest, SizeInHrf_Legacy_UsesPowersOf1024WithShortNames) {
    auto [value, unit] = util::size_in_hrf(1'536ULL * 1'024, SizeUnits::LEGACY);
    EXPECT_DOUBLE_EQ(value, 1.5);
    EXPECT_EQ(unit, "MB");
}

TEST(HumanReadableTest, SizeInHrf_Zero_ReturnsZeroBytes) {
    auto [value, unit] = util::size_in_hrf(0, SizeUnits::IEC);
    EXPECT_DOUBLE_EQ(value, 0.0);
    EXPECT_EQ(unit, "B");
}

// ========== time_in_hrf Tests ==========

TEST(HumanReadableTest, TimeInHrf_Seconds_ScaleToMinutes) {
    auto [value, unit] = util::time_in_hrf(90);
    EXPECT_DOUBLE_EQ(value, 1.5);
    EXPECT_EQ(unit, "minute");
}

TEST(HumanReadableTest, TimeInHrf_PowerOnHours_ScaleToDays) {
    auto [value, unit] = util::time_in_hrf(6'516, TimeUnit::HOUR);
    EXPECT_DOUBLE_EQ(value, 271.5);
    EXPECT_EQ(unit, "day");
}

TEST(HumanReadableTest, TimeInHrf_ShortFormat_UsesAbbreviations) {
    auto [value, unit] = util::time_in_hrf(17'520, TimeUnit::HOUR, true);
    EXPECT_DOUBLE_EQ(value, 2.0);
    EXPECT_EQ(unit, "yr");
}

TEST(HumanReadableTest, TimeInHrf_BelowNextUnit_KeepsInputUnit) {
    auto [value, unit] = util::time_in_hrf(23, TimeUnit::HOUR, true);
    EXPECT_DOUBLE_EQ(value, 23.0);
    EXPECT_EQ(unit, "h");
}
