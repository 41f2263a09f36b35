/**
 * @file remote_download.h
 * @brief Interfaces between a download session and the download service
 * @version 0.1.0
 *
 * remote_download is the handle to one download owned by the out-of-process
 * service. download_callback is the notification sink the service invokes,
 * from its own threads, whenever the download's status changes.
 */

#ifndef KCENON_DELIVERY_CLIENT_SERVICE_REMOTE_DOWNLOAD_H
#define KCENON_DELIVERY_CLIENT_SERVICE_REMOTE_DOWNLOAD_H

#include <kcenon/delivery_client/core/download_types.h>
#include <kcenon/delivery_client/core/types.h>

#include <cstddef>

namespace kcenon::delivery_client {

/**
 * @brief Receiver of asynchronous status notifications
 *
 * Implementations must tolerate calls from any thread, concurrently with
 * the thread that owns the download.
 */
class download_callback {
public:
    virtual ~download_callback() = default;

    /**
     * @brief Called by the service when the download's status changed
     * @param id Identifier of the download the status belongs to
     * @param status New status
     */
    virtual void on_status_changed(const download_id& id,
                                   const download_status& status) = 0;
};

/**
 * @brief Handle to a download owned by the remote service
 *
 * Every call is synchronous: it returns once the service accepted or
 * rejected the request, not when the transfer reaches any state. Failures
 * carry the service status code in error::service_code.
 */
class remote_download {
public:
    virtual ~remote_download() = default;

    [[nodiscard]] virtual auto get_property(download_property property)
        -> result<property_value> = 0;

    /**
     * @brief Write a property
     *
     * Setting download_property::callback_interface to std::monostate
     * revokes the current callback registration.
     */
    [[nodiscard]] virtual auto set_property(download_property property,
                                            const property_value& value)
        -> result<void> = 0;

    /**
     * @brief Start or resume the transfer
     * @param ranges_info Range-list wire buffer, or nullptr for the whole
     *        file. Only read during the call.
     */
    [[nodiscard]] virtual auto start(const std::byte* ranges_info) -> result<void> = 0;

    [[nodiscard]] virtual auto pause() -> result<void> = 0;

    [[nodiscard]] virtual auto abort() -> result<void> = 0;

    /**
     * @brief Commit the transferred file and release service resources
     */
    [[nodiscard]] virtual auto finalize() -> result<void> = 0;

    [[nodiscard]] virtual auto get_status() -> result<download_status> = 0;
};

}  // namespace kcenon::delivery_client

#endif  // KCENON_DELIVERY_CLIENT_SERVICE_REMOTE_DOWNLOAD_H
