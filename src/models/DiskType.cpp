/**
 * @file DiskType.cpp
 * @brief Device class name parsing
 */

#include "models/DiskType.hpp"

#include "util/Strings.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace diskinfo {

namespace {

constexpr std::array ALL_TYPES{DiskType::HDD, DiskType::SSD, DiskType::NVME, DiskType::LOOP,
                               DiskType::OTHER};

}  // namespace

auto parse_disk_type(std::string_view name) -> std::optional<DiskType> {
    std::string upper{util::trim(name)};
    std::ranges::transform(upper, upper.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (const auto type : ALL_TYPES) {
        if (upper == disk_type_name(type)) {
            return type;
        }
    }
    return std::nullopt;
}

auto DiskTypeSet::to_string() const -> std::string {
    std::string out;
    for (const auto type : ALL_TYPES) {
        if (contains(type)) {
            if (!out.empty()) {
                out += ',';
            }
            out += disk_type_name(type);
        }
    }
    return out;
}

auto DiskTypeSet::parse(std::string_view list) -> std::optional<DiskTypeSet> {
    DiskTypeSet set;
    while (!list.empty()) {
        const auto comma = list.find(',');
        const auto item = util::trim(list.substr(0, comma));
        if (!item.empty()) {
            const auto type = parse_disk_type(item);
            if (!type) {
                return std::nullopt;
            }
            set.insert(*type);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        list.remove_prefix(comma + 1);
    }
    return set;
}

}  // namespace diskinfo
