/**
 * @file callback_sink.h
 * @brief Thread-safe receiver of download status notifications
 * @version 0.1.0
 *
 * callback_sink turns push-style notifications from the download service
 * into a state the owning thread can query or block on. Updates and checks
 * happen under the same mutex, so a waiter always re-evaluates its exit
 * conditions against a complete snapshot and never misses a notification
 * delivered between two checks.
 */

#ifndef KCENON_DELIVERY_CLIENT_SESSION_CALLBACK_SINK_H
#define KCENON_DELIVERY_CLIENT_SESSION_CALLBACK_SINK_H

#include <kcenon/delivery_client/core/download_types.h>
#include <kcenon/delivery_client/core/types.h>
#include <kcenon/delivery_client/service/remote_download.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <vector>

namespace kcenon::delivery_client {

/**
 * @brief Why a wait ended without timing out
 */
enum class wait_reason {
    reached,         ///< Target state reported
    bailed_out,      ///< One of the bailout states reported
    error_reported,  ///< Non-zero error or extended error reported
};

[[nodiscard]] constexpr auto to_string(wait_reason reason) noexcept -> const char* {
    switch (reason) {
        case wait_reason::reached: return "reached";
        case wait_reason::bailed_out: return "bailed_out";
        case wait_reason::error_reported: return "error_reported";
        default: return "unknown";
    }
}

/**
 * @brief Result of a wait that ended before its timeout
 */
struct wait_outcome {
    wait_reason reason = wait_reason::reached;
    download_status status;  ///< Snapshot that ended the wait

    [[nodiscard]] auto reached() const noexcept -> bool {
        return reason == wait_reason::reached;
    }
};

/**
 * @brief Consistent view of the sink's state
 */
struct sink_snapshot {
    download_status status;
    bool has_status = false;  ///< A notification arrived since creation or reset
    bool complete = false;    ///< transferred has been reported
};

/**
 * @brief Callback receiver bound to one download
 *
 * @code
 * auto sink = std::make_shared<callback_sink>(session_id);
 * remote.set_property(download_property::callback_interface,
 *                     std::shared_ptr<download_callback>(sink));
 *
 * auto outcome = sink->wait_for_state(download_state::transferred,
 *                                     std::chrono::seconds(30),
 *                                     {download_state::paused});
 * @endcode
 */
class callback_sink : public download_callback {
public:
    explicit callback_sink(const download_id& id);
    ~callback_sink() override = default;

    callback_sink(const callback_sink&) = delete;
    auto operator=(const callback_sink&) -> callback_sink& = delete;

    /**
     * @brief Record a status update and wake every waiter
     *
     * Ignored when the id does not match or after detach().
     */
    void on_status_changed(const download_id& id,
                           const download_status& status) override;

    /**
     * @brief Block until a terminal condition or the timeout
     * @param target State that ends the wait successfully
     * @param timeout Wall-clock budget for this call; zero checks once
     * @param bailouts States that end the wait as bailed_out
     * @return Outcome, or wait_timeout / no_callback_sink
     *
     * Exit conditions, checked in this order whenever a status is present:
     * a non-zero error or extended error, the target state, a bailout state.
     * There is no way to interrupt the wait other than its timeout or
     * detach().
     */
    [[nodiscard]] auto wait_for_state(download_state target,
                                      std::chrono::milliseconds timeout,
                                      const std::vector<download_state>& bailouts = {})
        -> result<wait_outcome>;

    /**
     * @brief Clear status, error and completion back to the initial state
     */
    void reset();

    /**
     * @brief Stop accepting notifications and release all waiters
     *
     * Waiters blocked in wait_for_state() fail with no_callback_sink.
     */
    void detach();

    /**
     * @brief Accept notifications again after detach()
     */
    void attach();

    [[nodiscard]] auto is_attached() const -> bool;

    [[nodiscard]] auto snapshot() const -> sink_snapshot;

    [[nodiscard]] auto last_status() const -> download_status;

    [[nodiscard]] auto is_complete() const -> bool;

    /// Number of accepted notifications since construction
    [[nodiscard]] auto notification_count() const -> uint64_t;

    [[nodiscard]] auto id() const noexcept -> const download_id& { return id_; }

private:
    const download_id id_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    download_status status_;
    bool has_status_ = false;
    bool complete_ = false;
    bool attached_ = true;
    uint64_t notifications_ = 0;
};

}  // namespace kcenon::delivery_client

#endif  // KCENON_DELIVERY_CLIENT_SESSION_CALLBACK_SINK_H
