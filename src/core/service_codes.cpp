/**
 * @file service_codes.cpp
 * @brief Formatting helpers for remote service status codes
 */

#include "kcenon/delivery_client/core/service_codes.h"

#include <iomanip>
#include <sstream>

namespace kcenon::delivery_client {

auto format_service_code(int32_t raw) -> std::string {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setfill('0') << std::setw(8)
        << static_cast<uint32_t>(raw);
    return oss.str();
}

auto make_service_error(std::string_view operation, int32_t raw) -> error {
    std::string message(operation);
    message += " failed: ";
    message += to_string(static_cast<service_code>(static_cast<uint32_t>(raw)));
    message += " (";
    message += format_service_code(raw);
    message += ")";
    return error{to_error_code(raw), std::move(message), raw};
}

}  // namespace kcenon::delivery_client
