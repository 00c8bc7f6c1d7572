/**
 * @file SysfsReaderTest.cpp
 * @brief Unit tests for SysfsReader over a fake /sys tree
 */

#include "services/SysfsReader.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using testing::ElementsAre;
using testing::UnorderedElementsAre;

class SysfsReaderTest : public ::testing::Test {
protected:
    std::unique_ptr<FakeSystemRoot> host;
    std::unique_ptr<diskinfo::SysfsReader> reader;

    void SetUp() override {
        host = std::make_unique<FakeSystemRoot>();
        host->populate_host();
        reader = std::make_unique<diskinfo::SysfsReader>(host->sys_root());
    }
};

// ========== device_exists Tests ==========

TEST_F(SysfsReaderTest, DeviceExists_KnownDevice_ReturnsTrue) {
    EXPECT_TRUE(reader->device_exists("sda"));
    EXPECT_TRUE(reader->device_exists("sda1"));
}

TEST_F(SysfsReaderTest, DeviceExists_UnknownDevice_ReturnsFalse) {
    EXPECT_FALSE(reader->device_exists("sdz"));
}

TEST_F(SysfsReaderTest, DeviceExists_PathTraversal_ReturnsFalse) {
    EXPECT_FALSE(reader->device_exists(".."));
    EXPECT_FALSE(reader->device_exists("../block"));
    EXPECT_FALSE(reader->device_exists(""));
}

// ========== read_attribute Tests ==========

TEST_F(SysfsReaderTest, ReadAttribute_TrimsContent) {
    auto dev = reader->read_attribute("sda", "dev");
    ASSERT_TRUE(dev.has_value());
    ASSERT_TRUE(dev->has_value());
    EXPECT_EQ(**dev, "8:0");
}

TEST_F(SysfsReaderTest, ReadAttribute_NestedAttribute) {
    auto serial = reader->read_attribute("sdb", "device/serial");
    ASSERT_TRUE(serial.has_value());
    EXPECT_EQ(serial->value_or(""), "WD-WCC4E1234567");
}

TEST_F(SysfsReaderTest, ReadAttribute_Missing_ReturnsNullopt) {
    auto wwid = reader->read_attribute("sdb", "device/wwid");
    ASSERT_TRUE(wwid.has_value());
    EXPECT_FALSE(wwid->has_value());

    auto unknown = reader->read_attribute("sdz", "dev");
    ASSERT_TRUE(unknown.has_value());
    EXPECT_FALSE(unknown->has_value());
}

TEST_F(SysfsReaderTest, ReadAttribute_Directory_ReturnsIoError) {
    auto queue = reader->read_attribute("sda", "queue");
    ASSERT_FALSE(queue.has_value());
    EXPECT_EQ(queue.error().kind, util::ErrorKind::IO);
    EXPECT_EQ(queue.error().device, "sda");
}

// ========== list_disks / list_partitions Tests ==========

TEST_F(SysfsReaderTest, ListDisks_ReturnsBlockEntries) {
    auto disks = reader->list_disks();
    ASSERT_TRUE(disks.has_value());
    EXPECT_THAT(*disks, UnorderedElementsAre("sda", "sdb", "nvme0n1", "loop0"));
}

TEST_F(SysfsReaderTest, ListDisks_NoSysfs_ReturnsEmpty) {
    diskinfo::SysfsReader missing{host->root() / "nonexistent"};
    auto disks = missing.list_disks();
    ASSERT_TRUE(disks.has_value());
    EXPECT_TRUE(disks->empty());
}

TEST_F(SysfsReaderTest, ListPartitions_ReturnsSortedPartitionDirectories) {
    auto partitions = reader->list_partitions("sda");
    ASSERT_TRUE(partitions.has_value());
    EXPECT_THAT(*partitions, ElementsAre("sda1", "sda2"));
}

TEST_F(SysfsReaderTest, ListPartitions_UnpartitionedDisk_ReturnsEmpty) {
    auto partitions = reader->list_partitions("sdb");
    ASSERT_TRUE(partitions.has_value());
    EXPECT_TRUE(partitions->empty());
}

// ========== read_hwmon_temperature Tests ==========

TEST_F(SysfsReaderTest, ReadHwmonTemperature_DrivetempLayout) {
    host->add_hwmon("sda", "device/hwmon", "36000");
    auto temp = reader->read_hwmon_temperature("sda");
    ASSERT_TRUE(temp.has_value());
    EXPECT_EQ(temp->value_or(""), "36000");
}

TEST_F(SysfsReaderTest, ReadHwmonTemperature_NvmeControllerLayout) {
    host->add_hwmon("nvme0n1", "device", "41850");
    auto temp = reader->read_hwmon_temperature("nvme0n1");
    ASSERT_TRUE(temp.has_value());
    EXPECT_EQ(temp->value_or(""), "41850");
}

TEST_F(SysfsReaderTest, ReadHwmonTemperature_NoSensor_ReturnsNullopt) {
    auto temp = reader->read_hwmon_temperature("sdb");
    ASSERT_TRUE(temp.has_value());
    EXPECT_FALSE(temp->has_value());
}
