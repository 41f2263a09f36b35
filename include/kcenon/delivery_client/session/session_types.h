/**
 * @file session_types.h
 * @brief Configuration types for download_session
 */

#ifndef KCENON_DELIVERY_CLIENT_SESSION_SESSION_TYPES_H
#define KCENON_DELIVERY_CLIENT_SESSION_SESSION_TYPES_H

#include <chrono>
#include <optional>
#include <string>

#include "kcenon/delivery_client/core/download_types.h"

namespace kcenon::delivery_client {

/**
 * @brief Default budget of start_and_wait_until_transferring()
 */
inline constexpr std::chrono::seconds default_transferring_wait{15};

/**
 * @brief Property settings applied to a session in one call
 *
 * Unset members leave the corresponding remote property untouched.
 */
struct session_options {
    std::optional<cost_policy> cost;
    std::optional<bool> foreground;
    std::optional<std::chrono::seconds> no_progress_timeout;
    std::optional<std::string> uri;
    bool callbacks_enabled = true;
};

}  // namespace kcenon::delivery_client

#endif  // KCENON_DELIVERY_CLIENT_SESSION_SESSION_TYPES_H
