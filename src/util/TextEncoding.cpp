/**
 * @file TextEncoding.cpp
 * @brief GLib-based charset conversion
 */

#include "util/TextEncoding.hpp"

#include "util/GLibPtr.hpp"

#include <glib.h>

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

namespace util {

namespace {

auto normalized(std::string_view name) -> std::string {
    std::string out;
    for (const char c : name) {
        if (c != '-' && c != '_') {
            out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    return out;
}

}  // namespace

auto locale_charset() -> std::string {
    const char* charset = nullptr;
    g_get_charset(&charset);
    return charset ? std::string{charset} : std::string{"UTF-8"};
}

TextDecoder::TextDecoder(std::string encoding)
    : encoding_(encoding.empty() ? locale_charset() : std::move(encoding)),
      is_utf8_(normalized(encoding_) == "UTF8") {}

auto TextDecoder::decode(std::string_view raw) const -> std::expected<std::string, Error> {
    if (raw.empty()) {
        return std::string{};
    }
    if (is_utf8_) {
        if (!g_utf8_validate(raw.data(), static_cast<gssize>(raw.size()), nullptr)) {
            return std::unexpected(
                Error{ErrorKind::ENCODING, {}, encoding_, "invalid UTF-8 byte sequence"});
        }
        return std::string{raw};
    }

    GError* error = nullptr;
    gsize bytes_written = 0;
    GCharPtr converted{g_convert(raw.data(), static_cast<gssize>(raw.size()), "UTF-8",
                                 encoding_.c_str(), nullptr, &bytes_written, &error)};
    if (!converted) {
        GErrorPtr owned{error};
        return std::unexpected(Error{ErrorKind::ENCODING, {}, encoding_,
                                     owned ? owned->message : "conversion failed"});
    }
    return std::string{converted.get(), bytes_written};
}

}  // namespace util
