/**
 * @file Attribute.hpp
 * @brief Three-state value for optional device attributes
 *
 * An optional attribute is either present, normally absent (the device class
 * does not expose it) or failed (the source reported an error). Failures are
 * kept instead of raised so construction of the owning object continues.
 */

#pragma once

#include "util/Result.hpp"

#include <optional>
#include <utility>
#include <variant>

namespace util {

/**
 * @class Attribute
 * @brief Holds a value, a normal absence, or the error that prevented a read
 *
 * @tparam T The attribute value type
 *
 * @example
 * ```cpp
 * auto model = disk.get_model();
 * if (model) {
 *     std::cout << model.value() << '\n';
 * } else if (model.is_failed()) {
 *     std::cerr << model.get_error().what() << '\n';
 * }
 * ```
 */
template<typename T>
class Attribute {
public:
    enum class State { PRESENT, ABSENT, FAILED };

    /**
     * @brief Default state is absent
     */
    Attribute() = default;

    /**
     * @brief Create a present attribute
     * @param value The attribute value
     */
    [[nodiscard]] static auto present(T value) -> Attribute {
        Attribute a;
        a.data_ = std::move(value);
        return a;
    }

    /**
     * @brief Create an absent attribute
     */
    [[nodiscard]] static auto absent() -> Attribute { return Attribute{}; }

    /**
     * @brief Create a failed attribute
     * @param err The error reported by the source
     */
    [[nodiscard]] static auto failed(Error err) -> Attribute {
        Attribute a;
        a.data_ = std::move(err);
        return a;
    }

    /**
     * @brief Wrap an optional, mapping nullopt to absent
     */
    [[nodiscard]] static auto from_optional(std::optional<T> value) -> Attribute {
        if (value) {
            return present(std::move(*value));
        }
        return absent();
    }

    [[nodiscard]] auto state() const -> State {
        if (std::holds_alternative<T>(data_)) {
            return State::PRESENT;
        }
        if (std::holds_alternative<Error>(data_)) {
            return State::FAILED;
        }
        return State::ABSENT;
    }

    [[nodiscard]] auto is_present() const -> bool { return std::holds_alternative<T>(data_); }
    [[nodiscard]] auto is_absent() const -> bool {
        return std::holds_alternative<std::monostate>(data_);
    }
    [[nodiscard]] auto is_failed() const -> bool { return std::holds_alternative<Error>(data_); }

    /**
     * @brief Boolean conversion (true if present)
     */
    explicit operator bool() const { return is_present(); }

    /**
     * @brief Get the value
     * @throws std::bad_variant_access if the attribute is not present
     */
    [[nodiscard]] auto value() const -> const T& { return std::get<T>(data_); }

    /**
     * @brief Get the value or a default when absent or failed
     */
    [[nodiscard]] auto value_or(T default_value) const -> T {
        if (is_present()) {
            return std::get<T>(data_);
        }
        return default_value;
    }

    /**
     * @brief Get the error of a failed attribute
     * @throws std::bad_variant_access if the attribute did not fail
     */
    [[nodiscard]] auto get_error() const -> const Error& { return std::get<Error>(data_); }

    /**
     * @brief Collapse to an optional (absent and failed both become nullopt)
     */
    [[nodiscard]] auto to_optional() const -> std::optional<T> {
        if (is_present()) {
            return std::get<T>(data_);
        }
        return std::nullopt;
    }

    auto operator==(const Attribute&) const -> bool = default;

private:
    std::variant<std::monostate, T, Error> data_;
};

}  // namespace util
