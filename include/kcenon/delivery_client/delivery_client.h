/**
 * @file delivery_client.h
 * @brief Main header for the delivery_client library
 * @version 0.1.0
 *
 * This is the primary include file for the delivery_client library.
 * Include this header to drive downloads owned by the download service.
 *
 * @code
 * #include <kcenon/delivery_client/delivery_client.h>
 *
 * using namespace kcenon::delivery_client;
 *
 * download_file file{"https://example.com/update.bin", "/tmp/update.bin"};
 * auto session = download_session::builder()
 *     .with_file(file)
 *     .with_remote(std::make_unique<simulated_download>())
 *     .build();
 * @endcode
 */

#ifndef KCENON_DELIVERY_CLIENT_DELIVERY_CLIENT_H
#define KCENON_DELIVERY_CLIENT_DELIVERY_CLIENT_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/delivery_client/core/types.h"
#include "kcenon/delivery_client/core/service_codes.h"
#include "kcenon/delivery_client/core/download_types.h"
#include "kcenon/delivery_client/core/download_ranges.h"
#include "kcenon/delivery_client/core/range_encoder.h"

// Service
#include "kcenon/delivery_client/service/remote_download.h"
#include "kcenon/delivery_client/service/simulated_download.h"

// Session
#include "kcenon/delivery_client/session/session_types.h"
#include "kcenon/delivery_client/session/callback_sink.h"
#include "kcenon/delivery_client/session/download_session.h"

namespace kcenon::delivery_client {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::delivery_client

#endif  // KCENON_DELIVERY_CLIENT_DELIVERY_CLIENT_H
