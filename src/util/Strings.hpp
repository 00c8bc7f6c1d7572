/**
 * @file Strings.hpp
 * @brief Small text helpers for sysfs, udev and command output parsing
 */

#pragma once

#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace util {

[[nodiscard]] inline auto trim(std::string_view text) -> std::string_view {
    constexpr std::string_view WHITESPACE{" \t\r\n"};
    const auto first = text.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(WHITESPACE);
    return text.substr(first, last - first + 1);
}

[[nodiscard]] inline auto split_lines(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    while (!text.empty()) {
        const auto eol = text.find('\n');
        auto line = text.substr(0, eol);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (eol == std::string_view::npos) {
            break;
        }
        text.remove_prefix(eol + 1);
    }
    return lines;
}

/**
 * @brief Split on runs of whitespace
 */
[[nodiscard]] inline auto split_whitespace(std::string_view text)
    -> std::vector<std::string_view> {
    std::vector<std::string_view> fields;
    std::size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        const auto start = pos;
        while (pos < text.size() && !std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        if (pos > start) {
            fields.push_back(text.substr(start, pos - start));
        }
    }
    return fields;
}

/**
 * @brief Parse a whole string as an unsigned integer (surrounding whitespace allowed)
 */
template<typename T = uint64_t>
[[nodiscard]] auto parse_number(std::string_view text, int base = 10) -> std::optional<T> {
    text = trim(text);
    if (base == 16 && (text.starts_with("0x") || text.starts_with("0X"))) {
        text.remove_prefix(2);
    }
    if (text.empty()) {
        return std::nullopt;
    }
    T value{};
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value, base);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Parse the leading integer of a field, ignoring thousands separators
 *
 * "1,234,567 [632 GB]" -> 1234567, "36 (Min/Max 20/45)" -> 36, "100%" -> 100
 */
[[nodiscard]] inline auto parse_leading_number(std::string_view text) -> std::optional<uint64_t> {
    text = trim(text);
    std::string digits;
    for (const char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
        } else if (c == ',' && !digits.empty()) {
            continue;
        } else {
            break;
        }
    }
    return parse_number<uint64_t>(digits);
}

/**
 * @brief Decode udev "\xNN" escapes (as used by ID_*_ENC properties) into raw bytes
 */
[[nodiscard]] inline auto udev_unescape(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 3 < text.size() && text[i + 1] == 'x') {
            if (const auto byte = parse_number<unsigned>(text.substr(i + 2, 2), 16)) {
                out.push_back(static_cast<char>(*byte));
                i += 3;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

}  // namespace util
