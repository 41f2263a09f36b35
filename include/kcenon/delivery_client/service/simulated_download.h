/**
 * @file simulated_download.h
 * @brief In-process stand-in for a download owned by the remote service
 * @version 0.1.0
 *
 * simulated_download implements remote_download without any network or
 * disk I/O. A worker thread advances a byte counter in fixed steps and
 * delivers every status change to the registered callback from that
 * thread, the way the real service calls back from its own threads. The
 * service-side state rules are enforced with the same status codes the
 * real service returns.
 */

#ifndef KCENON_DELIVERY_CLIENT_SERVICE_SIMULATED_DOWNLOAD_H
#define KCENON_DELIVERY_CLIENT_SERVICE_SIMULATED_DOWNLOAD_H

#include <kcenon/delivery_client/core/download_ranges.h>
#include <kcenon/delivery_client/core/download_types.h>
#include <kcenon/delivery_client/core/types.h>
#include <kcenon/delivery_client/service/remote_download.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace kcenon::delivery_client {

/**
 * @brief Behaviour of a simulated download
 */
struct simulated_download_config {
    std::optional<download_id> id;          ///< Generated when unset
    uint64_t total_bytes = 1024 * 1024;     ///< Reported file size
    uint32_t steps = 4;                     ///< Progress steps to transfer the target
    std::chrono::milliseconds step_interval{5};

    /// When non-zero, the download pauses with this error at fail_at_step
    int32_t fail_with_error = 0;
    int32_t fail_with_extended_error = 0;
    uint32_t fail_at_step = 1;
};

/**
 * @brief remote_download backed by a local worker thread
 *
 * State rules:
 * - start: created or paused -> transferring; ignored while transferring;
 *   invalid state otherwise. A non-null range buffer restarts the byte
 *   counter against the sum of the requested ranges.
 * - pause: transferring -> paused; ignored while paused; invalid otherwise.
 * - abort: any state except aborted and finalized -> aborted.
 * - finalize: transferred -> finalized; invalid otherwise.
 */
class simulated_download final : public remote_download {
public:
    explicit simulated_download(simulated_download_config config = {});
    ~simulated_download() override;

    simulated_download(const simulated_download&) = delete;
    auto operator=(const simulated_download&) -> simulated_download& = delete;

    [[nodiscard]] auto get_property(download_property property)
        -> result<property_value> override;

    [[nodiscard]] auto set_property(download_property property,
                                    const property_value& value)
        -> result<void> override;

    [[nodiscard]] auto start(const std::byte* ranges_info) -> result<void> override;
    [[nodiscard]] auto pause() -> result<void> override;
    [[nodiscard]] auto abort() -> result<void> override;
    [[nodiscard]] auto finalize() -> result<void> override;
    [[nodiscard]] auto get_status() -> result<download_status> override;

    // ========================================================================
    // Inspection and fault injection
    // ========================================================================

    [[nodiscard]] auto id() const noexcept -> const download_id& { return id_; }

    /**
     * @brief Report an error: the download pauses with the given codes
     */
    void inject_error(int32_t error, int32_t extended_error = 0);

    /// Ranges decoded from the most recent start() call; empty for a null buffer
    [[nodiscard]] auto last_start_ranges() const -> std::vector<byte_range>;

    /// Whether the most recent start() call received a non-null buffer
    [[nodiscard]] auto last_start_had_buffer() const -> bool;

    [[nodiscard]] auto start_count() const -> uint64_t;
    [[nodiscard]] auto abort_count() const -> uint64_t;

    /// Number of times a non-null callback was registered
    [[nodiscard]] auto callback_registrations() const -> uint64_t;

    /// Number of times the callback registration was cleared
    [[nodiscard]] auto callback_revocations() const -> uint64_t;

    [[nodiscard]] auto registered_callback() const -> std::shared_ptr<download_callback>;

    /**
     * @brief Block until every queued notification has been delivered
     */
    void drain_notifications();

private:
    void worker_loop();
    void advance_locked();
    void enqueue_locked();
    [[nodiscard]] auto fail_locked(const char* operation) const -> result<void>;

    const download_id id_;
    const simulated_download_config config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable drained_cv_;
    download_status status_;
    uint64_t target_bytes_ = 0;
    uint32_t steps_done_ = 0;
    bool failure_reported_ = false;
    std::map<download_property, property_value> properties_;
    std::shared_ptr<download_callback> callback_;
    std::deque<download_status> pending_;
    bool delivering_ = false;
    bool stopping_ = false;

    std::vector<byte_range> last_ranges_;
    bool last_had_buffer_ = false;
    uint64_t start_count_ = 0;
    uint64_t abort_count_ = 0;
    uint64_t registrations_ = 0;
    uint64_t revocations_ = 0;

    std::thread worker_;
};

}  // namespace kcenon::delivery_client

#endif  // KCENON_DELIVERY_CLIENT_SERVICE_SIMULATED_DOWNLOAD_H
