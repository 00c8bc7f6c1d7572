/**
 * @file DiskTest.cpp
 * @brief Unit tests for the Disk, Partition and SmartSnapshot models
 */

#include "models/Disk.hpp"
#include "models/Partition.hpp"
#include "models/SmartData.hpp"

#include <gtest/gtest.h>

using diskinfo::Disk;
using diskinfo::DiskData;
using diskinfo::DiskType;

namespace {

auto MakeDisk(const std::string& name, DiskType type = DiskType::SSD) -> Disk {
    DiskData data;
    data.name = name;
    data.path = "/dev/" + name;
    data.device_id = diskinfo::DeviceId{.major = 8, .minor = 0};
    data.type = type;
    data.size = 2'000'409'264;
    return Disk{std::move(data), nullptr};
}

}  // namespace

// ========== DeviceId Tests ==========

TEST(DeviceIdTest, Parse_ValidText) {
    auto id = diskinfo::DeviceId::parse("259:0\n");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->major, 259u);
    EXPECT_EQ(id->minor, 0u);
    EXPECT_EQ(id->to_string(), "259:0");
}

TEST(DeviceIdTest, Parse_MalformedText_ReturnsNullopt) {
    EXPECT_EQ(diskinfo::DeviceId::parse("8"), std::nullopt);
    EXPECT_EQ(diskinfo::DeviceId::parse("8:x"), std::nullopt);
    EXPECT_EQ(diskinfo::DeviceId::parse(":0"), std::nullopt);
}

// ========== Disk Tests ==========

TEST(DiskTest, Equality_ComparesKernelNameOnly) {
    auto a = MakeDisk("sda", DiskType::SSD);
    auto b = MakeDisk("sda", DiskType::HDD);
    auto c = MakeDisk("sdb");
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_LT(a, c);
    EXPECT_GT(c, b);
}

TEST(DiskTest, TypePredicates_MatchType) {
    auto disk = MakeDisk("nvme0n1", DiskType::NVME);
    EXPECT_TRUE(disk.is_nvme());
    EXPECT_FALSE(disk.is_ssd());
    EXPECT_FALSE(disk.is_hdd());
    EXPECT_FALSE(disk.is_loop());
    EXPECT_EQ(disk.get_type_str(), "NVME");
}

TEST(DiskTest, GetSizeInHrf_ConvertsSectorsToBytes) {
    auto disk = MakeDisk("sda");
    auto [value, unit] = disk.get_size_in_hrf();
    EXPECT_EQ(unit, "TB");
    EXPECT_NEAR(value, 1.024, 0.001);

    auto [iec_value, iec_unit] = disk.get_size_in_hrf(util::SizeUnits::IEC);
    EXPECT_EQ(iec_unit, "GiB");
    EXPECT_NEAR(iec_value, 953.87, 0.01);
}

TEST(DiskTest, ToString_ShowsAttributeStates) {
    DiskData data;
    data.name = "sda";
    data.path = "/dev/sda";
    data.type = DiskType::HDD;
    data.model = util::Attribute<std::string>::present("WDC WD40EFRX");
    data.serial_number = util::Attribute<std::string>::failed(util::Error{});
    data.byid_paths = {"/dev/disk/by-id/a", "/dev/disk/by-id/b"};
    const Disk disk{std::move(data), nullptr};

    const auto text = disk.to_string();
    EXPECT_TRUE(text.starts_with("Disk(name=sda, path=/dev/sda"));
    EXPECT_NE(text.find("byid_path=[/dev/disk/by-id/a, /dev/disk/by-id/b]"), std::string::npos);
    EXPECT_NE(text.find("model=WDC WD40EFRX"), std::string::npos);
    EXPECT_NE(text.find("serial=<error>"), std::string::npos);
    EXPECT_NE(text.find("wwn=,"), std::string::npos);
    EXPECT_NE(text.find("type=HDD"), std::string::npos);
}

// ========== Partition Tests ==========

TEST(PartitionTest, GetPartSizeInHrf_UnknownSize_ReturnsNullopt) {
    const diskinfo::Partition part{diskinfo::PartitionData{}};
    EXPECT_FALSE(part.get_part_size_in_hrf().has_value());
    EXPECT_FALSE(part.get_fs_free_size_in_hrf().has_value());
}

TEST(PartitionTest, GetPartSizeInHrf_ConvertsSectors) {
    diskinfo::PartitionData data;
    data.part_size = util::Attribute<uint64_t>::present(2048);
    data.fs_free_size = util::Attribute<uint64_t>::present(1024);
    const diskinfo::Partition part{std::move(data)};

    auto size = part.get_part_size_in_hrf(util::SizeUnits::IEC);
    ASSERT_TRUE(size.has_value());
    EXPECT_DOUBLE_EQ(size->first, 1.0);
    EXPECT_EQ(size->second, "MiB");

    auto free_size = part.get_fs_free_size_in_hrf(util::SizeUnits::IEC);
    ASSERT_TRUE(free_size.has_value());
    EXPECT_DOUBLE_EQ(free_size->first, 512.0);
    EXPECT_EQ(free_size->second, "KiB");
}

TEST(PartitionTest, FsUsageName_ReturnsNames) {
    EXPECT_EQ(diskinfo::fs_usage_name(diskinfo::FsUsage::FILESYSTEM), "filesystem");
    EXPECT_EQ(diskinfo::fs_usage_name(diskinfo::FsUsage::OTHER), "other");
}

// ========== SmartSnapshot Tests ==========

TEST(SmartSnapshotTest, Standby_HasNothingElse) {
    auto snapshot = diskinfo::SmartSnapshot::standby();
    EXPECT_TRUE(snapshot.standby_mode());
    EXPECT_FALSE(snapshot.healthy());
    EXPECT_FALSE(snapshot.smart_capable());
    EXPECT_TRUE(snapshot.smart_attributes().empty());
    EXPECT_FALSE(snapshot.nvme_attributes().has_value());
}

TEST(SmartSnapshotTest, FindAttribute_ByIdAndName) {
    std::vector<diskinfo::SmartAttribute> attributes{
        {.id = 5, .name = "Reallocated_Sector_Ct", .raw_value = 0},
        {.id = 194, .name = "Temperature_Celsius", .raw_value = 36},
    };
    auto snapshot = diskinfo::SmartSnapshot::legacy(true, true, true, attributes);

    ASSERT_NE(snapshot.find_attribute(194), nullptr);
    EXPECT_EQ(snapshot.find_attribute(194)->raw_value, 36u);
    ASSERT_NE(snapshot.find_attribute("Reallocated"), nullptr);
    EXPECT_EQ(snapshot.find_attribute("Reallocated")->id, 5);
    EXPECT_EQ(snapshot.find_attribute(9), nullptr);
    EXPECT_EQ(snapshot.find_attribute("Power_On"), nullptr);
    EXPECT_FALSE(snapshot.nvme_attributes().has_value());
}

TEST(SmartSnapshotTest, Nvme_HasNoLegacyTable) {
    diskinfo::NvmeAttributes nvme;
    nvme.percentage_used = 2;
    auto snapshot = diskinfo::SmartSnapshot::nvme(true, true, true, nvme);
    EXPECT_FALSE(snapshot.standby_mode());
    EXPECT_TRUE(snapshot.smart_attributes().empty());
    ASSERT_TRUE(snapshot.nvme_attributes().has_value());
    EXPECT_EQ(snapshot.nvme_attributes()->percentage_used, 2);
}
