/**
 * @file TextEncoding.hpp
 * @brief Conversion of raw device text (labels, mount points) to UTF-8
 */

#pragma once

#include "util/Result.hpp"

#include <expected>
#include <string>
#include <string_view>

namespace util {

/**
 * @class TextDecoder
 * @brief Converts byte strings in a fixed source charset to UTF-8 using GLib
 *
 * One decoder is used for all text fields of one object so they are
 * interpreted consistently.
 */
class TextDecoder {
public:
    /**
     * @param encoding Source charset name (e.g. "UTF-8", "ISO-8859-2");
     *                 empty selects the locale charset
     */
    explicit TextDecoder(std::string encoding = {});

    /**
     * @brief Convert a byte string to UTF-8
     * @param raw Bytes in the source charset
     * @return UTF-8 text, or an ENCODING error
     */
    [[nodiscard]] auto decode(std::string_view raw) const -> std::expected<std::string, Error>;

    [[nodiscard]] auto encoding() const -> const std::string& { return encoding_; }

private:
    std::string encoding_;
    bool is_utf8_ = false;
};

/**
 * @brief Name of the charset of the current locale
 */
[[nodiscard]] auto locale_charset() -> std::string;

}  // namespace util
