/**
 * @file download_session.cpp
 * @brief Implementation of download_session
 */

#include "kcenon/delivery_client/session/download_session.h"

#include <kcenon/delivery_client/core/logging.h>
#include <kcenon/delivery_client/core/range_encoder.h>

#include <algorithm>
#include <limits>
#include <string>
#include <utility>
#include <variant>

namespace kcenon::delivery_client {

namespace {

template <typename T>
auto get_property_as(remote_download& remote, download_property property) -> result<T> {
    auto value = remote.get_property(property);
    if (!value) {
        return unexpected{value.error()};
    }
    if (const auto* typed = std::get_if<T>(&value.value())) {
        return *typed;
    }
    return unexpected{error{error_code::property_type_mismatch,
        std::string("Unexpected value type for property ") + to_string(property)}};
}

}  // namespace

// ============================================================================
// Builder
// ============================================================================

download_session::builder::builder() = default;

auto download_session::builder::with_file(const download_file& file) -> builder& {
    file_ = &file;
    return *this;
}

auto download_session::builder::with_remote(std::unique_ptr<remote_download> remote)
    -> builder& {
    remote_ = std::move(remote);
    return *this;
}

auto download_session::builder::with_cost_policy(cost_policy policy) -> builder& {
    options_.cost = policy;
    return *this;
}

auto download_session::builder::with_foreground(bool foreground) -> builder& {
    options_.foreground = foreground;
    return *this;
}

auto download_session::builder::with_no_progress_timeout(std::chrono::seconds timeout)
    -> builder& {
    options_.no_progress_timeout = timeout;
    return *this;
}

auto download_session::builder::with_uri(std::string uri) -> builder& {
    options_.uri = std::move(uri);
    return *this;
}

auto download_session::builder::with_callbacks(bool enable) -> builder& {
    options_.callbacks_enabled = enable;
    return *this;
}

auto download_session::builder::with_options(const session_options& options) -> builder& {
    options_ = options;
    return *this;
}

auto download_session::builder::build() -> result<download_session> {
    if (file_ == nullptr) {
        return unexpected{error{error_code::invalid_argument,
                               "A download file description is required"}};
    }

    auto session = create(*file_, std::move(remote_));
    if (!session) {
        return session;
    }

    auto configured = session.value().configure(options_);
    if (!configured) {
        return unexpected{configured.error()};
    }

    return session;
}

// ============================================================================
// Construction
// ============================================================================

auto download_session::create(const download_file& file,
                              std::unique_ptr<remote_download> remote)
    -> result<download_session> {
    get_logger().initialize();

    if (!remote) {
        return unexpected{error{error_code::invalid_argument,
                               "Remote download handle is null"}};
    }

    auto id_value = get_property_as<std::string>(*remote, download_property::id);
    if (!id_value) {
        DC_LOG_ERROR(log_category::session,
                     "Failed to read download id: " + id_value.error().message);
        return unexpected{id_value.error()};
    }

    auto id = download_id::from_string(id_value.value());
    if (!id) {
        return unexpected{error{error_code::invalid_download_id,
                               "Download id is not a GUID: " + id_value.value()}};
    }

    download_session session(file, std::move(remote), *id);

    auto registered = session.register_handler();
    if (!registered) {
        auto ctx = session.make_log_context();
        ctx.error_message = registered.error().message;
        DC_LOG_ERROR_CTX(log_category::session, "Failed to register callback sink", ctx);
        return unexpected{registered.error()};
    }

    auto ctx = session.make_log_context();
    DC_LOG_DEBUG_CTX(log_category::session, "Download session created", ctx);

    return result<download_session>(std::move(session));
}

download_session::download_session(const download_file& file,
                                   std::unique_ptr<remote_download> remote,
                                   const download_id& id)
    : file_(&file)
    , remote_(std::move(remote))
    , id_(id)
    , handler_(std::make_shared<callback_sink>(id)) {}

download_session::download_session(download_session&&) noexcept = default;
auto download_session::operator=(download_session&&) noexcept
    -> download_session& = default;
download_session::~download_session() = default;

// ============================================================================
// Configuration
// ============================================================================

auto download_session::set_cost_policy(cost_policy policy) -> result<void> {
    return remote_->set_property(download_property::cost_policy,
                                 static_cast<uint32_t>(policy));
}

auto download_session::get_cost_policy() -> result<cost_policy> {
    auto value = get_property_as<uint32_t>(*remote_, download_property::cost_policy);
    if (!value) {
        return unexpected{value.error()};
    }
    return static_cast<cost_policy>(value.value());
}

auto download_session::set_uri(std::string_view uri) -> result<void> {
    return remote_->set_property(download_property::uri, std::string(uri));
}

auto download_session::get_uri() -> result<std::string> {
    return get_property_as<std::string>(*remote_, download_property::uri);
}

auto download_session::set_foreground() -> result<void> {
    return remote_->set_property(download_property::foreground_priority, true);
}

auto download_session::set_background() -> result<void> {
    return remote_->set_property(download_property::foreground_priority, false);
}

auto download_session::is_foreground() -> result<bool> {
    return get_property_as<bool>(*remote_, download_property::foreground_priority);
}

auto download_session::is_background() -> result<bool> {
    auto foreground = is_foreground();
    if (!foreground) {
        return foreground;
    }
    return !foreground.value();
}

auto download_session::set_no_progress_timeout(std::chrono::seconds timeout)
    -> result<void> {
    if (timeout.count() < 0) {
        return unexpected{error{error_code::invalid_argument,
                               "No-progress timeout must not be negative"}};
    }
    if (timeout.count() > std::numeric_limits<uint32_t>::max()) {
        return unexpected{error{error_code::invalid_argument,
                               "No-progress timeout exceeds " +
                               std::to_string(std::numeric_limits<uint32_t>::max()) +
                               " seconds"}};
    }
    return remote_->set_property(download_property::no_progress_timeout_seconds,
                                 static_cast<uint32_t>(timeout.count()));
}

auto download_session::get_no_progress_timeout() -> result<std::chrono::seconds> {
    auto value = get_property_as<uint32_t>(*remote_,
                                           download_property::no_progress_timeout_seconds);
    if (!value) {
        return unexpected{value.error()};
    }
    return std::chrono::seconds(value.value());
}

auto download_session::get_total_size_bytes() -> result<uint64_t> {
    auto value = remote_->get_property(download_property::total_size_bytes);
    if (!value) {
        return unexpected{value.error()};
    }
    if (const auto* size = std::get_if<uint64_t>(&value.value())) {
        return *size;
    }
    if (const auto* size = std::get_if<uint32_t>(&value.value())) {
        return static_cast<uint64_t>(*size);
    }
    return unexpected{error{error_code::property_type_mismatch,
                           "Unexpected value type for property total_size_bytes"}};
}

auto download_session::set_handler(std::shared_ptr<callback_sink> handler)
    -> result<void> {
    if (handler && handler->id() != id_) {
        return unexpected{error{error_code::invalid_argument,
            "Callback sink belongs to download " + handler->id().to_string()}};
    }

    if (!handler) {
        return set_no_callbacks();
    }

    if (handler_ && handler_ != handler) {
        auto revoked = revoke_handler();
        if (!revoked) {
            return revoked;
        }
        handler_->detach();
    }

    handler_ = std::move(handler);
    handler_->attach();
    return register_handler();
}

auto download_session::set_no_callbacks() -> result<void> {
    auto revoked = revoke_handler();
    if (!revoked) {
        return revoked;
    }

    if (handler_) {
        handler_->reset();
        handler_->detach();
        handler_.reset();
    }

    auto ctx = make_log_context();
    DC_LOG_DEBUG_CTX(log_category::session, "Callbacks disabled", ctx);
    return {};
}

auto download_session::configure(const session_options& options) -> result<void> {
    if (options.cost) {
        auto r = set_cost_policy(*options.cost);
        if (!r) return r;
    }
    if (options.foreground) {
        auto r = *options.foreground ? set_foreground() : set_background();
        if (!r) return r;
    }
    if (options.no_progress_timeout) {
        auto r = set_no_progress_timeout(*options.no_progress_timeout);
        if (!r) return r;
    }
    if (options.uri) {
        auto r = set_uri(*options.uri);
        if (!r) return r;
    }
    if (!options.callbacks_enabled) {
        return set_no_callbacks();
    }
    if (!handler_) {
        return set_handler(std::make_shared<callback_sink>(id_));
    }
    return {};
}

// ============================================================================
// Status
// ============================================================================

auto download_session::get_status() -> result<download_status> {
    return remote_->get_status();
}

auto download_session::get_state() -> result<download_state> {
    auto status = get_status();
    if (!status) {
        return unexpected{status.error()};
    }
    return status.value().state;
}

// ============================================================================
// Lifecycle
// ============================================================================

auto download_session::start() -> result<void> {
    return start_with(nullptr, 0);
}

auto download_session::start(const download_ranges& ranges) -> result<void> {
    auto encoded = range_encoder::encode(ranges.ranges());
    if (!encoded) {
        auto ctx = make_log_context();
        ctx.range_count = ranges.count();
        ctx.error_message = encoded.error().message;
        DC_LOG_ERROR_CTX(log_category::session, "Failed to encode download ranges", ctx);
        return unexpected{encoded.error()};
    }

    // The buffer stays alive until the remote call returns and is released
    // when `encoded` goes out of scope.
    const auto& buffer = encoded.value();
    return start_with(buffer.data(), buffer.count());
}

auto download_session::resume() -> result<void> {
    auto ctx = make_log_context();
    DC_LOG_INFO_CTX(log_category::session, "Resuming download", ctx);

    reset_handler_state();

    auto started = remote_->start(nullptr);
    if (!started) {
        ctx.error_message = started.error().message;
        DC_LOG_ERROR_CTX(log_category::session, "Resume failed", ctx);
    }
    return started;
}

auto download_session::pause() -> result<void> {
    auto ctx = make_log_context();
    DC_LOG_INFO_CTX(log_category::session, "Pausing download", ctx);

    auto paused = remote_->pause();
    if (!paused) {
        ctx.error_message = paused.error().message;
        DC_LOG_ERROR_CTX(log_category::session, "Pause failed", ctx);
    }
    return paused;
}

auto download_session::abort() -> result<void> {
    auto ctx = make_log_context();
    DC_LOG_INFO_CTX(log_category::session, "Aborting download", ctx);

    // Aborting an aborted download is rejected by the service as invalid state
    auto state = get_state();
    if (!state) {
        ctx.error_message = state.error().message;
        DC_LOG_ERROR_CTX(log_category::session, "Abort failed: state query failed", ctx);
        return unexpected{state.error()};
    }
    if (state.value() == download_state::aborted) {
        DC_LOG_DEBUG_CTX(log_category::session, "Download already aborted", ctx);
        return {};
    }

    auto aborted = remote_->abort();
    if (!aborted) {
        ctx.error_message = aborted.error().message;
        DC_LOG_ERROR_CTX(log_category::session, "Abort failed", ctx);
    }
    return aborted;
}

auto download_session::finalize() -> result<void> {
    auto ctx = make_log_context();
    DC_LOG_INFO_CTX(log_category::session, "Finalizing download", ctx);

    auto finalized = remote_->finalize();
    if (!finalized) {
        ctx.error_message = finalized.error().message;
        DC_LOG_ERROR_CTX(log_category::session, "Finalize failed", ctx);
    }
    return finalized;
}

auto download_session::start_with(const std::byte* ranges_info, std::size_t range_count)
    -> result<void> {
    auto ctx = make_log_context();
    ctx.range_count = range_count;
    DC_LOG_INFO_CTX(log_category::session,
                    "Starting download with " + std::to_string(range_count) + " ranges",
                    ctx);

    auto started = remote_->start(ranges_info);
    if (!started) {
        ctx.error_message = started.error().message;
        DC_LOG_ERROR_CTX(log_category::session, "Start failed", ctx);
    }
    return started;
}

// ============================================================================
// Waiting
// ============================================================================

auto download_session::wait_for_state(download_state target,
                                      std::chrono::milliseconds timeout,
                                      const std::vector<download_state>& bailouts)
    -> result<wait_outcome> {
    auto ctx = make_log_context();
    ctx.target_state = to_string(target);
    ctx.timeout_ms = static_cast<uint64_t>(std::max<int64_t>(timeout.count(), 0));

    // Keep the sink alive for the whole wait even if it is replaced meanwhile
    auto handler = handler_;
    if (!handler) {
        DC_LOG_WARN_CTX(log_category::session, "Wait requested without a callback sink", ctx);
        return unexpected{error{error_code::no_callback_sink,
            "Callbacks are disabled for download " + id_.to_string()}};
    }

    DC_LOG_DEBUG_CTX(log_category::session, "Waiting for state", ctx);

    auto outcome = handler->wait_for_state(target, timeout, bailouts);
    if (!outcome) {
        ctx.error_message = outcome.error().message;
        DC_LOG_WARN_CTX(log_category::session, "Wait failed", ctx);
        return outcome;
    }

    const auto& status = outcome.value().status;
    ctx.state = to_string(status.state);
    ctx.error_code = status.error;
    ctx.extended_error_code = status.extended_error;
    ctx.bytes_transferred = status.bytes_transferred;

    switch (outcome.value().reason) {
        case wait_reason::reached:
            DC_LOG_DEBUG_CTX(log_category::session, "Target state reached", ctx);
            break;
        case wait_reason::bailed_out:
            DC_LOG_WARN_CTX(log_category::session, "Wait bailed out", ctx);
            break;
        case wait_reason::error_reported:
            DC_LOG_WARN_CTX(log_category::session, "Download reported an error", ctx);
            break;
    }

    return outcome;
}

auto download_session::wait_until_transferring(std::chrono::milliseconds timeout,
                                               bool is_from_paused)
    -> result<wait_outcome> {
    // A pause while waiting to begin is a legitimate outcome after a resume
    if (is_from_paused) {
        return wait_for_state(download_state::transferring, timeout);
    }
    return wait_for_state(download_state::transferring, timeout,
                          {download_state::paused});
}

auto download_session::wait_until_transferred(std::chrono::milliseconds timeout)
    -> result<wait_outcome> {
    return wait_for_state(download_state::transferred, timeout,
                          {download_state::paused, download_state::aborted});
}

auto download_session::start_and_wait_until_transferred(
    const download_ranges& ranges, std::chrono::milliseconds timeout)
    -> result<wait_outcome> {
    auto started = start(ranges);
    if (!started) {
        return unexpected{started.error()};
    }
    return wait_until_transferred(timeout);
}

auto download_session::start_and_wait_until_transferred(std::chrono::milliseconds timeout)
    -> result<wait_outcome> {
    auto started = start();
    if (!started) {
        return unexpected{started.error()};
    }
    return wait_until_transferred(timeout);
}

auto download_session::resume_and_wait_until_transferred(std::chrono::milliseconds timeout)
    -> result<wait_outcome> {
    auto resumed = resume();
    if (!resumed) {
        return unexpected{resumed.error()};
    }
    return wait_until_transferred(timeout);
}

auto download_session::start_and_wait_until_transferring(
    std::chrono::milliseconds timeout, const download_ranges* ranges)
    -> result<wait_outcome> {
    auto started = download_ranges::is_null_or_empty(ranges) ? start() : start(*ranges);
    if (!started) {
        return unexpected{started.error()};
    }
    return wait_until_transferring(timeout);
}

// ============================================================================
// Sink state
// ============================================================================

void download_session::reset_handler_state() {
    if (handler_) {
        handler_->reset();
    }
}

auto download_session::last_error_code() const -> int32_t {
    return sink_snapshot_or_default().status.error;
}

auto download_session::last_extended_error_code() const -> int32_t {
    return sink_snapshot_or_default().status.extended_error;
}

auto download_session::is_status_complete() const -> bool {
    return sink_snapshot_or_default().complete;
}

auto download_session::is_status_error() const -> bool {
    return last_error_code() != 0;
}

auto download_session::is_status_extended_error() const -> bool {
    return last_extended_error_code() != 0;
}

// ============================================================================
// Helpers
// ============================================================================

auto download_session::register_handler() -> result<void> {
    return remote_->set_property(download_property::callback_interface,
                                 std::shared_ptr<download_callback>(handler_));
}

auto download_session::revoke_handler() -> result<void> {
    return remote_->set_property(download_property::callback_interface,
                                 std::monostate{});
}

auto download_session::make_log_context() const -> session_log_context {
    session_log_context ctx;
    ctx.download_id = id_.to_string();
    if (file_ != nullptr) {
        ctx.uri = file_->uri;
        ctx.local_path = file_->local_path.string();
    }
    return ctx;
}

auto download_session::sink_snapshot_or_default() const -> sink_snapshot {
    if (!handler_) {
        return sink_snapshot{};
    }
    return handler_->snapshot();
}

}  // namespace kcenon::delivery_client
