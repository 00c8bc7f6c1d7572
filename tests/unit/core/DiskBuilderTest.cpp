/**
 * @file DiskBuilderTest.cpp
 * @brief Unit tests for DiskBuilder attribute sourcing and fallbacks
 */

#include "core/DiskBuilder.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gtest/gtest.h>

#include <cerrno>

using diskinfo::DeviceId;
using diskinfo::DiskBuilder;
using diskinfo::DiskIdentifier;
using diskinfo::DiskType;

class DiskBuilderTest : public SystemRootTestFixture {
protected:
    std::unique_ptr<DiskBuilder> builder;

    void SetUp() override {
        SystemRootTestFixture::SetUp();
        host->populate_host();
        builder = std::make_unique<DiskBuilder>(MakeSources());
    }
};

// ========== Static attribute Tests ==========

TEST_F(DiskBuilderTest, Build_UdevBackedDisk_ReadsAllAttributes) {
    auto disk = builder->build(DiskIdentifier{.name = "sda"});
    ASSERT_TRUE(disk.has_value()) << disk.error().what();

    EXPECT_EQ(disk->get_name(), "sda");
    EXPECT_EQ(disk->get_path(), host->node("sda"));
    EXPECT_EQ(disk->get_device_id(), (DeviceId{.major = 8, .minor = 0}));
    EXPECT_EQ(disk->get_type(), DiskType::SSD);
    EXPECT_TRUE(disk->is_ssd());
    EXPECT_EQ(disk->get_size(), 2'000'409'264u);

    EXPECT_EQ(disk->get_model().value(), "Samsung SSD 850 PRO 1TB");
    EXPECT_EQ(disk->get_serial_number().value(), "S3D2NY0J819218R");
    EXPECT_EQ(disk->get_firmware().value(), "EXM04B6Q");
    EXPECT_EQ(disk->get_wwn().value(), "0x5002538c40146ccb");
    EXPECT_EQ(disk->get_physical_block_size().value(), 512u);
    EXPECT_EQ(disk->get_logical_block_size().value(), 512u);
    EXPECT_EQ(disk->get_partition_table_type().value(), "gpt");
    EXPECT_EQ(disk->get_partition_table_uuid().value(), "d3f932e0-2f6c-4d5e-8b3c-1d2a5b6c7e8f");

    ASSERT_EQ(disk->get_byid_path().size(), 2u);
    EXPECT_EQ(fs::path{disk->get_byid_path().front()}.filename().string(),
              "ata-Samsung_SSD_850_PRO_1TB_S3D2NY0J819218R");
    ASSERT_EQ(disk->get_bypath_path().size(), 1u);
    EXPECT_EQ(fs::path{disk->get_bypath_path().front()}.filename().string(),
              "pci-0000:00:17.0-ata-1");
}

TEST_F(DiskBuilderTest, Build_WithoutUdevRecord_FallsBackToSysfs) {
    auto disk = builder->build(DiskIdentifier{.serial = "WD-WCC4E1234567"});
    ASSERT_TRUE(disk.has_value()) << disk.error().what();

    EXPECT_EQ(disk->get_name(), "sdb");
    EXPECT_TRUE(disk->is_hdd());
    EXPECT_EQ(disk->get_model().value(), "WDC WD40EFRX-68N32N0");
    EXPECT_EQ(disk->get_serial_number().value(), "WD-WCC4E1234567");
    EXPECT_EQ(disk->get_firmware().value(), "82.00A82");
    EXPECT_TRUE(disk->get_wwn().is_absent());
    EXPECT_TRUE(disk->get_physical_block_size().is_absent());
    EXPECT_TRUE(disk->get_partition_table_type().is_absent());
    EXPECT_TRUE(disk->get_bypath_path().empty());
}

TEST_F(DiskBuilderTest, Build_NvmeNamespace_ReadsControllerAttributes) {
    auto disk = builder->build(DiskIdentifier{.path = host->node("nvme0n1")});
    ASSERT_TRUE(disk.has_value());

    EXPECT_TRUE(disk->is_nvme());
    EXPECT_EQ(disk->get_model().value(), "Samsung SSD 970 EVO Plus 500GB");
    EXPECT_EQ(disk->get_firmware().value(), "2B2QEXM7");
    EXPECT_EQ(disk->get_wwn().value(), "eui.0025385b01234567");
    EXPECT_EQ(disk->get_byid_path().size(), 2u);
}

TEST_F(DiskBuilderTest, Build_LoopDevice_HasNoIdentity) {
    auto disk = builder->build(DiskIdentifier{.name = "loop0"});
    ASSERT_TRUE(disk.has_value());

    EXPECT_TRUE(disk->is_loop());
    EXPECT_EQ(disk->get_size(), 0u);
    EXPECT_TRUE(disk->get_model().is_absent());
    EXPECT_TRUE(disk->get_serial_number().is_absent());
    EXPECT_TRUE(disk->get_byid_path().empty());
}

// ========== Error Tests ==========

TEST_F(DiskBuilderTest, Build_UnknownDevice_ReturnsDeviceNotFound) {
    auto disk = builder->build(DiskIdentifier{.name = "sdq"});
    ASSERT_FALSE(disk.has_value());
    EXPECT_EQ(disk.error().kind, util::ErrorKind::DEVICE_NOT_FOUND);
}

TEST_F(DiskBuilderTest, Build_DeviceWithoutDevAttribute_ReturnsAttributeReadError) {
    host->add_broken_disk("sdz");

    auto disk = builder->build(DiskIdentifier{.name = "sdz"});
    ASSERT_FALSE(disk.has_value());
    EXPECT_EQ(disk.error().kind, util::ErrorKind::ATTRIBUTE_READ);
    EXPECT_EQ(disk.error().device, "sdz");
    EXPECT_EQ(disk.error().subject, "dev");
}

TEST_F(DiskBuilderTest, Build_MalformedDevAttribute_ReturnsAttributeReadError) {
    host->add_disk("sdc", "8:32", 100, "1");
    host->write_attribute("sdc", "dev", "eight:thirtytwo");

    auto disk = builder->build(DiskIdentifier{.name = "sdc"});
    ASSERT_FALSE(disk.has_value());
    EXPECT_EQ(disk.error().kind, util::ErrorKind::ATTRIBUTE_READ);
    EXPECT_EQ(disk.error().subject, "dev");
}

TEST_F(DiskBuilderTest, Build_MissingSize_ReturnsAttributeReadError) {
    host->add_disk("sdc", "8:32", 100, "1");
    fs::remove(host->sys_root() / "class" / "block" / "sdc" / "size");

    auto disk = builder->build(DiskIdentifier{.name = "sdc"});
    ASSERT_FALSE(disk.has_value());
    EXPECT_EQ(disk.error().kind, util::ErrorKind::ATTRIBUTE_READ);
    EXPECT_EQ(disk.error().subject, "size");
}

TEST_F(DiskBuilderTest, Build_MalformedSize_ReturnsAttributeReadError) {
    host->add_disk("sdc", "8:32", 100, "1");
    host->write_attribute("sdc", "size", "lots");

    auto disk = builder->build(DiskIdentifier{.name = "sdc"});
    ASSERT_FALSE(disk.has_value());
    EXPECT_EQ(disk.error().kind, util::ErrorKind::ATTRIBUTE_READ);
    EXPECT_EQ(disk.error().device, "sdc");
}

TEST_F(DiskBuilderTest, Build_MalformedBlockSize_MarksAttributeFailed) {
    host->write_attribute("sda", "queue/physical_block_size", "big");

    auto disk = builder->build(DiskIdentifier{.name = "sda"});
    ASSERT_TRUE(disk.has_value());
    ASSERT_TRUE(disk->get_physical_block_size().is_failed());
    EXPECT_EQ(disk->get_physical_block_size().get_error().kind, util::ErrorKind::ATTRIBUTE_READ);
    EXPECT_EQ(disk->get_logical_block_size().value(), 512u);
}

TEST_F(DiskBuilderTest, Build_UnreadableUdevRecord_KeepsFailureWithoutFallback) {
    host->add_disk("sdd", "8:48", 100, "1");
    host->write_attribute("sdd", "device/model", "Fallback Model");
    host->fail_udev_record("8:48", EACCES);

    auto disk = builder->build(DiskIdentifier{.name = "sdd"});
    ASSERT_TRUE(disk.has_value()) << disk.error().what();
    EXPECT_EQ(disk->get_model().value(), "Fallback Model");
    EXPECT_TRUE(disk->get_serial_number().is_failed());
    EXPECT_TRUE(disk->get_partition_table_type().is_failed());
}

// ========== to_string Tests ==========

TEST_F(DiskBuilderTest, ToString_ListsStaticAttributes) {
    auto disk = builder->build(DiskIdentifier{.name = "sdb"});
    ASSERT_TRUE(disk.has_value());

    const auto text = disk->to_string();
    EXPECT_TRUE(text.starts_with("Disk(name=sdb, path="));
    EXPECT_NE(text.find("serial=WD-WCC4E1234567"), std::string::npos);
    EXPECT_NE(text.find("type=HDD"), std::string::npos);
    EXPECT_NE(text.find("device_id=8:16"), std::string::npos);
    EXPECT_NE(text.find("wwn=,"), std::string::npos);
}
