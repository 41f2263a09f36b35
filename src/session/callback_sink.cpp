/**
 * @file callback_sink.cpp
 * @brief Implementation of callback_sink
 */

#include <kcenon/delivery_client/session/callback_sink.h>
#include <kcenon/delivery_client/core/logging.h>

#include <algorithm>
#include <string>

namespace kcenon::delivery_client {

callback_sink::callback_sink(const download_id& id) : id_(id) {}

void callback_sink::on_status_changed(const download_id& id,
                                      const download_status& status) {
    if (id != id_) {
        DC_LOG_WARN(log_category::callback,
                    "Ignoring notification for download " + id.to_string() +
                    " received by sink of " + id_.to_string());
        return;
    }

    {
        std::lock_guard lock(mutex_);
        if (!attached_) {
            return;
        }
        status_ = status;
        has_status_ = true;
        if (status.state == download_state::transferred) {
            complete_ = true;
        }
        ++notifications_;
    }
    cv_.notify_all();

    if (get_logger().is_enabled(log_level::trace)) {
        session_log_context ctx;
        ctx.download_id = id_.to_string();
        ctx.state = to_string(status.state);
        ctx.error_code = status.error;
        ctx.extended_error_code = status.extended_error;
        ctx.bytes_transferred = status.bytes_transferred;
        DC_LOG_CTX(log_level::trace, log_category::callback, "Status changed", ctx);
    }
}

auto callback_sink::wait_for_state(download_state target,
                                   std::chrono::milliseconds timeout,
                                   const std::vector<download_state>& bailouts)
    -> result<wait_outcome> {
    // Budgets past the clock's range would overflow the deadline; wait unbounded
    const auto now = std::chrono::steady_clock::now();
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::time_point::max() - now);
    const bool unbounded = timeout >= headroom;
    const auto deadline = now +
        (unbounded ? std::chrono::milliseconds::zero()
                   : std::max(timeout, std::chrono::milliseconds::zero()));

    std::unique_lock lock(mutex_);
    while (true) {
        if (!attached_) {
            return unexpected{error{error_code::no_callback_sink,
                "Callback sink was detached while waiting for " +
                std::string(to_string(target))}};
        }

        if (has_status_) {
            if (status_.has_error()) {
                return wait_outcome{wait_reason::error_reported, status_};
            }
            if (status_.state == target) {
                return wait_outcome{wait_reason::reached, status_};
            }
            if (std::find(bailouts.begin(), bailouts.end(), status_.state) !=
                bailouts.end()) {
                return wait_outcome{wait_reason::bailed_out, status_};
            }
        }

        if (unbounded) {
            cv_.wait(lock);
            continue;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            return unexpected{error{error_code::wait_timeout,
                "Timed out after " + std::to_string(timeout.count()) +
                " ms waiting for " + to_string(target) + " (last state: " +
                (has_status_ ? to_string(status_.state) : "none") + ")"}};
        }

        cv_.wait_until(lock, deadline);
    }
}

void callback_sink::reset() {
    std::lock_guard lock(mutex_);
    status_ = download_status{};
    has_status_ = false;
    complete_ = false;
}

void callback_sink::detach() {
    {
        std::lock_guard lock(mutex_);
        attached_ = false;
    }
    cv_.notify_all();
}

void callback_sink::attach() {
    std::lock_guard lock(mutex_);
    attached_ = true;
}

auto callback_sink::is_attached() const -> bool {
    std::lock_guard lock(mutex_);
    return attached_;
}

auto callback_sink::snapshot() const -> sink_snapshot {
    std::lock_guard lock(mutex_);
    return sink_snapshot{status_, has_status_, complete_};
}

auto callback_sink::last_status() const -> download_status {
    std::lock_guard lock(mutex_);
    return status_;
}

auto callback_sink::is_complete() const -> bool {
    std::lock_guard lock(mutex_);
    return complete_;
}

auto callback_sink::notification_count() const -> uint64_t {
    std::lock_guard lock(mutex_);
    return notifications_;
}

}  // namespace kcenon::delivery_client
