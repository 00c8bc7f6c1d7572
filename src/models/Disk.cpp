/**
 * @file Disk.cpp
 * @brief Disk dynamic attributes and text form
 */

#include "models/Disk.hpp"

#include "core/PartitionBuilder.hpp"
#include "core/SmartReader.hpp"

#include <format>

namespace diskinfo {

namespace {

constexpr uint64_t SECTOR_SIZE = 512;

template<typename T>
auto attribute_text(const util::Attribute<T>& attr) -> std::string {
    switch (attr.state()) {
        case util::Attribute<T>::State::PRESENT:
            return std::format("{}", attr.value());
        case util::Attribute<T>::State::FAILED:
            return "<error>";
        case util::Attribute<T>::State::ABSENT:
            break;
    }
    return "";
}

auto list_text(const std::vector<std::string>& items) -> std::string {
    std::string text{"["};
    for (const auto& item : items) {
        if (text.size() > 1) {
            text += ", ";
        }
        text += item;
    }
    text += ']';
    return text;
}

}  // namespace

Disk::Disk(DiskData data, std::shared_ptr<const DeviceSources> sources)
    : data_(std::move(data)), sources_(std::move(sources)) {}

auto Disk::get_size_in_hrf(util::SizeUnits units) const -> std::pair<double, std::string> {
    return util::size_in_hrf(data_.size * SECTOR_SIZE, units);
}

auto Disk::get_temperature() const -> std::expected<std::optional<double>, util::Error> {
    return SmartReader{sources_}.read_temperature(*this);
}

auto Disk::get_smart_data(bool skip_standby_check) const
    -> std::expected<SmartSnapshot, util::Error> {
    return SmartReader{sources_}.read_smart(
        *this, skip_standby_check ? StandbyPolicy::SKIP_CHECK : StandbyPolicy::CHECK);
}

auto Disk::get_partition_list() const -> std::expected<std::vector<Partition>, util::Error> {
    return PartitionBuilder{sources_}.build(*this);
}

auto Disk::to_string() const -> std::string {
    return std::format(
        "Disk(name={}, path={}, byid_path={}, by_path={}, wwn={}, model={}, serial={}, "
        "firmware={}, type={}, size={}, device_id={}, physical_block_size={}, "
        "logical_block_size={}, partition_table_type={}, partition_table_uuid={})",
        data_.name, data_.path, list_text(data_.byid_paths), list_text(data_.bypath_paths),
        attribute_text(data_.wwn), attribute_text(data_.model),
        attribute_text(data_.serial_number), attribute_text(data_.firmware), get_type_str(),
        data_.size, data_.device_id.to_string(), attribute_text(data_.physical_block_size),
        attribute_text(data_.logical_block_size), attribute_text(data_.part_table_type),
        attribute_text(data_.part_table_uuid));
}

}  // namespace diskinfo
