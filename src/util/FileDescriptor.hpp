/**
 * @file FileDescriptor.hpp
 * @brief RAII wrapper for POSIX file descriptors and small-file reads
 *
 * sysfs attribute files are read through this wrapper so that a missing
 * file (normal absence) can be told apart from any other failure.
 */

#pragma once

#include "util/Result.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace util {

/**
 * @class FileDescriptor
 * @brief Owns a POSIX file descriptor and closes it on destruction
 */
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}

    ~FileDescriptor() {
        if (is_valid()) {
            ::close(fd_);
        }
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            if (is_valid()) {
                ::close(fd_);
            }
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    /**
     * @brief Open a file read-only with close-on-exec
     * @param path File to open
     * @return Descriptor wrapper; check is_valid() and errno on failure
     */
    [[nodiscard]] static auto open_readonly(const std::filesystem::path& path) -> FileDescriptor {
        return FileDescriptor{::open(path.c_str(), O_RDONLY | O_CLOEXEC)};
    }

    [[nodiscard]] constexpr auto get() const noexcept -> int { return fd_; }
    [[nodiscard]] constexpr auto is_valid() const noexcept -> bool { return fd_ >= 0; }
    explicit operator bool() const noexcept { return is_valid(); }

    /**
     * @brief Read the remaining content of the descriptor
     * @return Content, or errno on read failure
     */
    [[nodiscard]] auto read_all() const -> std::expected<std::string, int> {
        std::string content;
        char buffer[4096];
        for (;;) {
            const auto n = ::read(fd_, buffer, sizeof(buffer));
            if (n == 0) {
                break;
            }
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return std::unexpected(errno);
            }
            content.append(buffer, static_cast<std::size_t>(n));
        }
        return content;
    }

private:
    int fd_;
};

/**
 * @brief Read a small text file such as a sysfs attribute
 * @param path File path
 * @return Raw content, nullopt if the file does not exist, or an IO error
 */
[[nodiscard]] inline auto read_optional_file(const std::filesystem::path& path)
    -> std::expected<std::optional<std::string>, Error> {
    const auto fd = FileDescriptor::open_readonly(path);
    if (!fd) {
        const int err = errno;
        if (err == ENOENT || err == ENOTDIR) {
            return std::optional<std::string>{};
        }
        return std::unexpected(Error{ErrorKind::IO, {}, path.string(), std::strerror(err), err});
    }

    auto content = fd.read_all();
    if (!content) {
        // Some sysfs attributes exist but cannot be read for this device class
        if (content.error() == EINVAL || content.error() == ENODATA ||
            content.error() == EOPNOTSUPP) {
            return std::optional<std::string>{};
        }
        return std::unexpected(Error{ErrorKind::IO, {}, path.string(),
                                     std::strerror(content.error()), content.error()});
    }
    return std::optional<std::string>{std::move(*content)};
}

}  // namespace util
