/**
 * @file download_session.h
 * @brief Controller for one download owned by the remote download service
 * @version 0.1.0
 */

#ifndef KCENON_DELIVERY_CLIENT_SESSION_DOWNLOAD_SESSION_H
#define KCENON_DELIVERY_CLIENT_SESSION_DOWNLOAD_SESSION_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/delivery_client/core/download_ranges.h"
#include "kcenon/delivery_client/core/download_types.h"
#include "kcenon/delivery_client/core/types.h"
#include "kcenon/delivery_client/service/remote_download.h"
#include "kcenon/delivery_client/session/callback_sink.h"
#include "kcenon/delivery_client/session/session_types.h"

namespace kcenon::delivery_client {

struct session_log_context;

/**
 * @brief Drives the lifecycle of one remote download
 *
 * The session exclusively owns the remote handle, caches the download id
 * read from it at construction and owns the callback sink registered with
 * the service. Lifecycle commands return as soon as the remote call
 * returns; wait_for_state() and its wrappers are the only blocking calls.
 *
 * A session is driven from one thread. The registered sink is updated from
 * the service's threads concurrently.
 *
 * Finalization is never implicit: call finalize() to commit the file.
 *
 * @code
 * download_file file{"https://example.com/big.iso", "/tmp/big.iso"};
 * auto session = download_session::builder()
 *     .with_file(file)
 *     .with_remote(std::move(remote))
 *     .with_foreground(true)
 *     .build();
 *
 * if (session.has_value()) {
 *     auto outcome = session.value().start_and_wait_until_transferred(
 *         std::chrono::minutes(5));
 *     if (outcome && outcome.value().reached()) {
 *         (void)session.value().finalize();
 *     }
 * }
 * @endcode
 */
class download_session {
public:
    /**
     * @brief Builder for download_session
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the file description (required, referenced not copied)
         */
        auto with_file(const download_file& file) -> builder&;

        /**
         * @brief Set the remote handle (required)
         */
        auto with_remote(std::unique_ptr<remote_download> remote) -> builder&;

        auto with_cost_policy(cost_policy policy) -> builder&;

        auto with_foreground(bool foreground) -> builder&;

        auto with_no_progress_timeout(std::chrono::seconds timeout) -> builder&;

        auto with_uri(std::string uri) -> builder&;

        /**
         * @brief Keep (default) or revoke the callback sink after creation
         */
        auto with_callbacks(bool enable) -> builder&;

        auto with_options(const session_options& options) -> builder&;

        /**
         * @brief Wrap the remote handle and apply the configured options
         * @return The session, or the first error encountered
         */
        [[nodiscard]] auto build() -> result<download_session>;

    private:
        const download_file* file_ = nullptr;
        std::unique_ptr<remote_download> remote_;
        session_options options_;
    };

    /**
     * @brief Wrap a remote handle
     * @param file Description of the downloaded file; must outlive the session
     * @param remote Handle to the remote download; ownership is taken
     * @return Session with a fresh callback sink registered, or an error
     *
     * Reads the id property once and installs a new callback_sink.
     */
    [[nodiscard]] static auto create(const download_file& file,
                                     std::unique_ptr<remote_download> remote)
        -> result<download_session>;

    download_session(const download_session&) = delete;
    auto operator=(const download_session&) -> download_session& = delete;
    download_session(download_session&&) noexcept;
    auto operator=(download_session&&) noexcept -> download_session&;
    ~download_session();

    [[nodiscard]] auto id() const noexcept -> const download_id& { return id_; }
    [[nodiscard]] auto file() const noexcept -> const download_file& { return *file_; }
    [[nodiscard]] auto remote() noexcept -> remote_download& { return *remote_; }

    /**
     * @brief Currently installed sink, or nullptr after set_no_callbacks()
     */
    [[nodiscard]] auto handler() const noexcept -> const std::shared_ptr<callback_sink>& {
        return handler_;
    }

    // ========================================================================
    // Configuration
    // ========================================================================

    [[nodiscard]] auto set_cost_policy(cost_policy policy) -> result<void>;
    [[nodiscard]] auto get_cost_policy() -> result<cost_policy>;

    [[nodiscard]] auto set_uri(std::string_view uri) -> result<void>;
    [[nodiscard]] auto get_uri() -> result<std::string>;

    /**
     * @brief Set ForegroundPriority to true. Downloads default to background.
     */
    [[nodiscard]] auto set_foreground() -> result<void>;

    /**
     * @brief Set ForegroundPriority to false.
     */
    [[nodiscard]] auto set_background() -> result<void>;

    [[nodiscard]] auto is_foreground() -> result<bool>;
    [[nodiscard]] auto is_background() -> result<bool>;

    [[nodiscard]] auto set_no_progress_timeout(std::chrono::seconds timeout) -> result<void>;
    [[nodiscard]] auto get_no_progress_timeout() -> result<std::chrono::seconds>;

    [[nodiscard]] auto get_total_size_bytes() -> result<uint64_t>;

    /**
     * @brief Replace the callback sink
     * @param handler New sink bound to this session's id, or nullptr
     *
     * The old registration is revoked and the old sink detached before the
     * new sink is registered, so the old sink never sees another
     * notification.
     */
    [[nodiscard]] auto set_handler(std::shared_ptr<callback_sink> handler) -> result<void>;

    /**
     * @brief Revoke the callback registration and drop the sink
     *
     * Afterwards every wait fails with no_callback_sink.
     */
    [[nodiscard]] auto set_no_callbacks() -> result<void>;

    /**
     * @brief Apply a set of options; stops at the first failure
     */
    [[nodiscard]] auto configure(const session_options& options) -> result<void>;

    // ========================================================================
    // Status
    // ========================================================================

    [[nodiscard]] auto get_status() -> result<download_status>;
    [[nodiscard]] auto get_state() -> result<download_state>;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Start transferring the whole file
     */
    [[nodiscard]] auto start() -> result<void>;

    /**
     * @brief Start transferring the given ranges
     *
     * An empty collection is the same as start(). The encoded range buffer
     * is released before this call returns, whether or not the remote call
     * succeeded.
     */
    [[nodiscard]] auto start(const download_ranges& ranges) -> result<void>;

    /**
     * @brief Clear the sink's error and completion state, then start with no ranges
     */
    [[nodiscard]] auto resume() -> result<void>;

    [[nodiscard]] auto pause() -> result<void>;

    /**
     * @brief Abort the download; a no-op when it is already aborted
     */
    [[nodiscard]] auto abort() -> result<void>;

    /**
     * @brief Commit the download and release service-side resources
     */
    [[nodiscard]] auto finalize() -> result<void>;

    // ========================================================================
    // Waiting
    // ========================================================================

    /**
     * @brief Block until target, a bailout state, a reported error or timeout
     * @return Outcome, or wait_timeout / no_callback_sink
     */
    [[nodiscard]] auto wait_for_state(download_state target,
                                      std::chrono::milliseconds timeout,
                                      const std::vector<download_state>& bailouts = {})
        -> result<wait_outcome>;

    /**
     * @brief Wait until the download is transferring
     * @param timeout How long to wait
     * @param is_from_paused Whether the download was resumed from paused.
     *        If true, a paused report does not end the wait.
     */
    [[nodiscard]] auto wait_until_transferring(std::chrono::milliseconds timeout,
                                               bool is_from_paused = false)
        -> result<wait_outcome>;

    /**
     * @brief Wait until transferred; paused and aborted end the wait early
     */
    [[nodiscard]] auto wait_until_transferred(std::chrono::milliseconds timeout)
        -> result<wait_outcome>;

    [[nodiscard]] auto start_and_wait_until_transferred(const download_ranges& ranges,
                                                        std::chrono::milliseconds timeout)
        -> result<wait_outcome>;

    [[nodiscard]] auto start_and_wait_until_transferred(std::chrono::milliseconds timeout)
        -> result<wait_outcome>;

    [[nodiscard]] auto resume_and_wait_until_transferred(std::chrono::milliseconds timeout)
        -> result<wait_outcome>;

    [[nodiscard]] auto start_and_wait_until_transferring(
        std::chrono::milliseconds timeout = default_transferring_wait,
        const download_ranges* ranges = nullptr) -> result<wait_outcome>;

    // ========================================================================
    // Sink state
    // ========================================================================

    /**
     * @brief Clear any reported error and completion from the sink
     *
     * Useful before resuming a download that previously failed.
     */
    void reset_handler_state();

    [[nodiscard]] auto last_error_code() const -> int32_t;
    [[nodiscard]] auto last_extended_error_code() const -> int32_t;
    [[nodiscard]] auto is_status_complete() const -> bool;
    [[nodiscard]] auto is_status_error() const -> bool;
    [[nodiscard]] auto is_status_extended_error() const -> bool;

private:
    download_session(const download_file& file,
                     std::unique_ptr<remote_download> remote,
                     const download_id& id);

    [[nodiscard]] auto register_handler() -> result<void>;
    [[nodiscard]] auto revoke_handler() -> result<void>;
    [[nodiscard]] auto start_with(const std::byte* ranges_info, std::size_t range_count)
        -> result<void>;
    [[nodiscard]] auto make_log_context() const -> session_log_context;
    [[nodiscard]] auto sink_snapshot_or_default() const -> sink_snapshot;

    const download_file* file_;
    std::unique_ptr<remote_download> remote_;
    download_id id_;
    std::shared_ptr<callback_sink> handler_;
};

}  // namespace kcenon::delivery_client

#endif  // KCENON_DELIVERY_CLIENT_SESSION_DOWNLOAD_SESSION_H
