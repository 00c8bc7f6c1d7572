/**
 * @file Result.hpp
 * @brief Error type shared by every fallible diskinfo operation
 *
 * Fallible operations return std::expected<T, util::Error>. The error carries
 * a kind, the device it concerns and the attribute or operation that failed,
 * so callers can report exactly what went wrong without parsing messages.
 */

#pragma once

#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace util {

/**
 * @enum ErrorKind
 * @brief Classification of failures reported by the library
 */
enum class ErrorKind {
    CONFIGURATION,          ///< Invalid or ambiguous caller input
    DEVICE_NOT_FOUND,       ///< No device matches the given identifier
    ATTRIBUTE_READ,         ///< A mandatory attribute could not be read
    SMART_UNAVAILABLE,      ///< SMART backend missing, denied or device not openable
    SMART_PARSE,            ///< SMART backend output malformed or unsupported
    PARTITION_ENUMERATION,  ///< Partition enumeration tool failed
    IO,                     ///< Low-level file or directory access failure
    COMMAND,                ///< External command could not be spawned or collected
    ENCODING                ///< Text could not be converted to UTF-8
};

/**
 * @brief Get the canonical name of an error kind
 * @param kind Error kind
 * @return Name such as "DeviceNotFoundError"
 */
[[nodiscard]] constexpr auto error_kind_name(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::CONFIGURATION:
            return "ConfigurationError";
        case ErrorKind::DEVICE_NOT_FOUND:
            return "DeviceNotFoundError";
        case ErrorKind::ATTRIBUTE_READ:
            return "AttributeReadError";
        case ErrorKind::SMART_UNAVAILABLE:
            return "SmartUnavailableError";
        case ErrorKind::SMART_PARSE:
            return "SmartParseError";
        case ErrorKind::PARTITION_ENUMERATION:
            return "PartitionEnumerationError";
        case ErrorKind::IO:
            return "IoError";
        case ErrorKind::COMMAND:
            return "CommandError";
        case ErrorKind::ENCODING:
            return "EncodingError";
    }
    return "Error";
}

/**
 * @struct Error
 * @brief Represents an error with a kind, its subject and an optional errno code
 */
struct Error {
    ErrorKind kind = ErrorKind::IO;
    std::string device;   ///< Kernel name or path the error concerns (may be empty)
    std::string subject;  ///< Attribute or operation that failed (e.g. "size", "smartctl")
    std::string message;  ///< Human readable detail
    int code = 0;         ///< errno or exit status, 0 if not applicable

    Error() = default;
    Error(ErrorKind err_kind, std::string dev, std::string subj, std::string msg,
          int err_code = 0)
        : kind(err_kind),
          device(std::move(dev)),
          subject(std::move(subj)),
          message(std::move(msg)),
          code(err_code) {}

    /**
     * @brief Full description including kind, device and subject
     * @return Formatted text, e.g. "AttributeReadError: sda: size: file missing"
     */
    [[nodiscard]] auto what() const -> std::string {
        std::string text{error_kind_name(kind)};
        text += ": ";
        if (!device.empty()) {
            text += device;
            text += ": ";
        }
        if (!subject.empty()) {
            text += subject;
            text += ": ";
        }
        text += message;
        return text;
    }

    /**
     * @brief Copy of this error re-labelled with another kind and subject
     *
     * Used when an adapter-level failure (IO, COMMAND) becomes a domain
     * failure such as ATTRIBUTE_READ at the place it becomes fatal.
     */
    [[nodiscard]] auto as(ErrorKind new_kind, std::string_view new_subject = {}) const -> Error {
        Error copy = *this;
        copy.kind = new_kind;
        if (!new_subject.empty()) {
            copy.subject = std::string{new_subject};
        }
        return copy;
    }

    auto operator==(const Error&) const -> bool = default;
};

/**
 * @brief Build an error with a formatted message
 */
template<typename... Args>
[[nodiscard]] auto make_error(ErrorKind kind, std::string_view device, std::string_view subject,
                              std::format_string<Args...> fmt, Args&&... args) -> Error {
    return Error{kind, std::string{device}, std::string{subject},
                 std::format(fmt, std::forward<Args>(args)...)};
}

}  // namespace util
