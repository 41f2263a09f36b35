/**
 * @file types.h
 * @brief Core result and error types for delivery_client
 */

#ifndef KCENON_DELIVERY_CLIENT_CORE_TYPES_H
#define KCENON_DELIVERY_CLIENT_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::delivery_client {

/**
 * @brief Error codes for download session operations
 */
enum class error_code {
    success = 0,

    // Session errors (-100 to -119)
    invalid_download_id = -100,
    no_callback_sink = -101,
    invalid_argument = -102,
    property_type_mismatch = -103,

    // Remote call errors (-120 to -139)
    remote_call_failed = -120,
    invalid_state = -121,
    unknown_property = -122,
    read_only_property = -123,
    download_not_found = -124,
    service_unavailable = -125,

    // Wait errors (-140 to -159)
    wait_timeout = -140,

    // Marshaling errors (-160 to -179)
    marshaling_failed = -160,
    range_count_overflow = -161,

    // Internal errors (-200 to -219)
    internal_error = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_download_id:
            return "invalid download id";
        case error_code::no_callback_sink:
            return "no callback sink";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::property_type_mismatch:
            return "property type mismatch";
        case error_code::remote_call_failed:
            return "remote call failed";
        case error_code::invalid_state:
            return "invalid state";
        case error_code::unknown_property:
            return "unknown property";
        case error_code::read_only_property:
            return "read-only property";
        case error_code::download_not_found:
            return "download not found";
        case error_code::service_unavailable:
            return "service unavailable";
        case error_code::wait_timeout:
            return "wait timeout";
        case error_code::marshaling_failed:
            return "marshaling failed";
        case error_code::range_count_overflow:
            return "range count overflow";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code, message and the originating service code
 *
 * service_code holds the raw 32-bit status reported by the remote
 * download service, or 0 when the error was raised locally.
 */
struct error {
    error_code code;
    std::string message;
    int32_t service_code = 0;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, int32_t svc)
        : code(c), message(std::move(msg)), service_code(svc) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::delivery_client

#endif  // KCENON_DELIVERY_CLIENT_CORE_TYPES_H
