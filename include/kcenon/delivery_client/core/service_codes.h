/**
 * @file service_codes.h
 * @brief Status codes reported by the remote download service
 *
 * The download service reports failures as 32-bit HRESULT-style values.
 * Codes in the 0x80D0xxxx facility belong to the download service itself;
 * a few generic platform codes are also surfaced through the same channel.
 */

#ifndef KCENON_DELIVERY_CLIENT_CORE_SERVICE_CODES_H
#define KCENON_DELIVERY_CLIENT_CORE_SERVICE_CODES_H

#include <cstdint>
#include <string>
#include <string_view>

#include "kcenon/delivery_client/core/types.h"

namespace kcenon::delivery_client {

/**
 * @brief Known service status codes
 */
enum class service_code : uint32_t {
    ok = 0x00000000u,

    // Download service facility
    no_service = 0x80D01001u,
    download_no_progress = 0x80D02002u,
    job_not_found = 0x80D02003u,
    no_downloads = 0x80D02005u,
    job_too_old = 0x80D0200Cu,
    unknown_property_id = 0x80D02011u,
    read_only_property = 0x80D02012u,
    invalid_state = 0x80D02013u,
    download_sink_unspecified = 0x80D02018u,

    // Generic platform codes
    out_of_memory = 0x8007000Eu,
    invalid_arg = 0x80070057u,
    not_implemented = 0x80004001u,
    fail = 0x80004005u,
};

/**
 * @brief Raw signed representation used on the wire and in download_status
 */
[[nodiscard]] constexpr auto to_raw(service_code code) noexcept -> int32_t {
    return static_cast<int32_t>(static_cast<uint32_t>(code));
}

/**
 * @brief Check whether a raw status denotes failure (high bit set)
 */
[[nodiscard]] constexpr auto is_failure(int32_t raw) noexcept -> bool {
    return raw < 0;
}

/**
 * @brief Describe a service status code
 */
[[nodiscard]] constexpr auto to_string(service_code code) noexcept
    -> std::string_view {
    switch (code) {
        case service_code::ok:
            return "ok";
        case service_code::no_service:
            return "download service is not available";
        case service_code::download_no_progress:
            return "download made no progress within the no-progress timeout";
        case service_code::job_not_found:
            return "download not found";
        case service_code::no_downloads:
            return "no downloads";
        case service_code::job_too_old:
            return "download expired";
        case service_code::unknown_property_id:
            return "unknown property id";
        case service_code::read_only_property:
            return "property is read-only";
        case service_code::invalid_state:
            return "operation is not valid in the current download state";
        case service_code::download_sink_unspecified:
            return "no destination specified for the download";
        case service_code::out_of_memory:
            return "out of memory";
        case service_code::invalid_arg:
            return "invalid argument";
        case service_code::not_implemented:
            return "not implemented";
        case service_code::fail:
            return "unspecified failure";
        default:
            return "unknown service code";
    }
}

/**
 * @brief Map a raw service status to the library error_code
 */
[[nodiscard]] constexpr auto to_error_code(int32_t raw) noexcept -> error_code {
    if (!is_failure(raw)) {
        return error_code::success;
    }
    switch (static_cast<service_code>(static_cast<uint32_t>(raw))) {
        case service_code::invalid_state:
            return error_code::invalid_state;
        case service_code::unknown_property_id:
            return error_code::unknown_property;
        case service_code::read_only_property:
            return error_code::read_only_property;
        case service_code::job_not_found:
        case service_code::job_too_old:
            return error_code::download_not_found;
        case service_code::no_service:
            return error_code::service_unavailable;
        case service_code::invalid_arg:
            return error_code::invalid_argument;
        default:
            return error_code::remote_call_failed;
    }
}

/**
 * @brief Format a raw status as 0xXXXXXXXX
 */
[[nodiscard]] auto format_service_code(int32_t raw) -> std::string;

/**
 * @brief Build an error for a failed remote call
 * @param operation Name of the remote operation, used in the message
 * @param raw Raw service status
 */
[[nodiscard]] auto make_service_error(std::string_view operation, int32_t raw)
    -> error;

}  // namespace kcenon::delivery_client

#endif  // KCENON_DELIVERY_CLIENT_CORE_SERVICE_CODES_H
