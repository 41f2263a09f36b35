/**
 * @file simulated_download.cpp
 * @brief Implementation of simulated_download
 */

#include <kcenon/delivery_client/service/simulated_download.h>
#include <kcenon/delivery_client/core/logging.h>
#include <kcenon/delivery_client/core/range_encoder.h>
#include <kcenon/delivery_client/core/service_codes.h>

#include <algorithm>
#include <string>
#include <variant>

namespace kcenon::delivery_client {

namespace {

auto brace_id(const download_id& id) -> std::string {
    return "{" + id.to_string() + "}";
}

/**
 * @brief Expected value type of each writable property
 */
auto accepts(download_property property, const property_value& value) -> bool {
    switch (property) {
        case download_property::uri:
        case download_property::display_name:
        case download_property::local_path:
            return std::holds_alternative<std::string>(value);
        case download_property::cost_policy:
        case download_property::callback_freq_percent:
        case download_property::callback_freq_seconds:
        case download_property::no_progress_timeout_seconds:
            return std::holds_alternative<uint32_t>(value);
        case download_property::foreground_priority:
            return std::holds_alternative<bool>(value);
        default:
            return false;
    }
}

auto is_known(download_property property) -> bool {
    switch (property) {
        case download_property::id:
        case download_property::uri:
        case download_property::display_name:
        case download_property::local_path:
        case download_property::cost_policy:
        case download_property::callback_freq_percent:
        case download_property::callback_freq_seconds:
        case download_property::no_progress_timeout_seconds:
        case download_property::foreground_priority:
        case download_property::callback_interface:
        case download_property::total_size_bytes:
            return true;
        default:
            return false;
    }
}

auto requested_bytes(const std::vector<byte_range>& ranges, uint64_t total) -> uint64_t {
    uint64_t sum = 0;
    for (const auto& range : ranges) {
        if (range.offset >= total) {
            continue;
        }
        const auto available = total - range.offset;
        sum += (range.length == byte_range::to_end_of_file)
                   ? available
                   : std::min(range.length, available);
    }
    return sum;
}

}  // namespace

simulated_download::simulated_download(simulated_download_config config)
    : id_(config.id ? *config.id : download_id::generate())
    , config_(std::move(config)) {
    properties_[download_property::uri] = std::string{};
    properties_[download_property::display_name] = std::string{};
    properties_[download_property::local_path] = std::string{};
    properties_[download_property::cost_policy] =
        static_cast<uint32_t>(cost_policy::standard_background);
    properties_[download_property::callback_freq_percent] = uint32_t{0};
    properties_[download_property::callback_freq_seconds] = uint32_t{0};
    properties_[download_property::no_progress_timeout_seconds] = uint32_t{0};
    properties_[download_property::foreground_priority] = false;

    worker_ = std::thread([this] { worker_loop(); });
}

simulated_download::~simulated_download() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

// ============================================================================
// Properties
// ============================================================================

auto simulated_download::get_property(download_property property)
    -> result<property_value> {
    if (!is_known(property)) {
        return unexpected{make_service_error("get_property",
                                             to_raw(service_code::unknown_property_id))};
    }

    std::lock_guard lock(mutex_);
    switch (property) {
        case download_property::id:
            return property_value{brace_id(id_)};
        case download_property::total_size_bytes:
            return property_value{config_.total_bytes};
        case download_property::callback_interface:
            if (callback_) {
                return property_value{callback_};
            }
            return property_value{std::monostate{}};
        default:
            return properties_[property];
    }
}

auto simulated_download::set_property(download_property property,
                                      const property_value& value) -> result<void> {
    if (!is_known(property)) {
        return unexpected{make_service_error("set_property",
                                             to_raw(service_code::unknown_property_id))};
    }
    if (property == download_property::id ||
        property == download_property::total_size_bytes) {
        return unexpected{make_service_error("set_property",
                                             to_raw(service_code::read_only_property))};
    }

    std::lock_guard lock(mutex_);

    if (property == download_property::callback_interface) {
        if (std::holds_alternative<std::monostate>(value)) {
            callback_.reset();
            ++revocations_;
            return {};
        }
        const auto* callback = std::get_if<std::shared_ptr<download_callback>>(&value);
        if (callback == nullptr || !*callback) {
            return unexpected{make_service_error("set_property",
                                                 to_raw(service_code::invalid_arg))};
        }
        callback_ = *callback;
        ++registrations_;
        return {};
    }

    if (!accepts(property, value)) {
        return unexpected{make_service_error("set_property",
                                             to_raw(service_code::invalid_arg))};
    }
    properties_[property] = value;
    return {};
}

// ============================================================================
// Lifecycle
// ============================================================================

auto simulated_download::start(const std::byte* ranges_info) -> result<void> {
    // The buffer is only valid during this call, so decode it right away
    auto ranges = range_encoder::decode(ranges_info);

    std::lock_guard lock(mutex_);
    ++start_count_;
    last_had_buffer_ = ranges_info != nullptr;
    last_ranges_ = ranges;

    switch (status_.state) {
        case download_state::transferring:
            return {};
        case download_state::created:
        case download_state::paused:
            break;
        default:
            return fail_locked("start");
    }

    if (ranges_info != nullptr) {
        target_bytes_ = requested_bytes(ranges, config_.total_bytes);
        status_.bytes_transferred = 0;
        steps_done_ = 0;
    } else if (status_.state == download_state::created) {
        target_bytes_ = config_.total_bytes;
    }

    status_.state = download_state::transferring;
    status_.bytes_total = config_.total_bytes;
    status_.error = 0;
    status_.extended_error = 0;
    enqueue_locked();

    DC_LOG_DEBUG(log_category::service,
                 "Simulated download " + id_.to_string() + " transferring " +
                 std::to_string(target_bytes_) + " bytes");
    return {};
}

auto simulated_download::pause() -> result<void> {
    std::lock_guard lock(mutex_);
    if (status_.state == download_state::paused) {
        return {};
    }
    if (status_.state != download_state::transferring) {
        return fail_locked("pause");
    }
    status_.state = download_state::paused;
    enqueue_locked();
    return {};
}

auto simulated_download::abort() -> result<void> {
    std::lock_guard lock(mutex_);
    ++abort_count_;
    if (status_.state == download_state::aborted ||
        status_.state == download_state::finalized) {
        return fail_locked("abort");
    }
    status_.state = download_state::aborted;
    enqueue_locked();
    return {};
}

auto simulated_download::finalize() -> result<void> {
    std::lock_guard lock(mutex_);
    if (status_.state != download_state::transferred) {
        return fail_locked("finalize");
    }
    status_.state = download_state::finalized;
    enqueue_locked();
    return {};
}

auto simulated_download::get_status() -> result<download_status> {
    std::lock_guard lock(mutex_);
    return status_;
}

// ============================================================================
// Inspection and fault injection
// ============================================================================

void simulated_download::inject_error(int32_t error, int32_t extended_error) {
    std::lock_guard lock(mutex_);
    status_.state = download_state::paused;
    status_.error = error;
    status_.extended_error = extended_error;
    enqueue_locked();
}

auto simulated_download::last_start_ranges() const -> std::vector<byte_range> {
    std::lock_guard lock(mutex_);
    return last_ranges_;
}

auto simulated_download::last_start_had_buffer() const -> bool {
    std::lock_guard lock(mutex_);
    return last_had_buffer_;
}

auto simulated_download::start_count() const -> uint64_t {
    std::lock_guard lock(mutex_);
    return start_count_;
}

auto simulated_download::abort_count() const -> uint64_t {
    std::lock_guard lock(mutex_);
    return abort_count_;
}

auto simulated_download::callback_registrations() const -> uint64_t {
    std::lock_guard lock(mutex_);
    return registrations_;
}

auto simulated_download::callback_revocations() const -> uint64_t {
    std::lock_guard lock(mutex_);
    return revocations_;
}

auto simulated_download::registered_callback() const
    -> std::shared_ptr<download_callback> {
    std::lock_guard lock(mutex_);
    return callback_;
}

void simulated_download::drain_notifications() {
    std::unique_lock lock(mutex_);
    drained_cv_.wait(lock, [this] {
        return stopping_ || (pending_.empty() && !delivering_);
    });
}

// ============================================================================
// Worker
// ============================================================================

void simulated_download::worker_loop() {
    std::unique_lock lock(mutex_);
    while (!stopping_) {
        if (!pending_.empty()) {
            auto status = pending_.front();
            pending_.pop_front();
            auto callback = callback_;
            delivering_ = true;

            // Never call out while holding the lock: the callback may query us
            lock.unlock();
            if (callback) {
                callback->on_status_changed(id_, status);
            }
            lock.lock();

            delivering_ = false;
            drained_cv_.notify_all();
            continue;
        }

        if (status_.state == download_state::transferring) {
            bool interrupted = cv_.wait_for(lock, config_.step_interval, [this] {
                return stopping_ || !pending_.empty() ||
                       status_.state != download_state::transferring;
            });
            if (!interrupted) {
                advance_locked();
            }
            continue;
        }

        cv_.wait(lock, [this] {
            return stopping_ || !pending_.empty() ||
                   status_.state == download_state::transferring;
        });
    }
    drained_cv_.notify_all();
}

void simulated_download::advance_locked() {
    const uint32_t steps = std::max<uint32_t>(config_.steps, 1);
    ++steps_done_;

    if (config_.fail_with_error != 0 && !failure_reported_ &&
        steps_done_ >= config_.fail_at_step) {
        failure_reported_ = true;
        status_.state = download_state::paused;
        status_.error = config_.fail_with_error;
        status_.extended_error = config_.fail_with_extended_error;
        enqueue_locked();
        return;
    }

    const uint64_t increment = std::max<uint64_t>(target_bytes_ / steps, 1);
    status_.bytes_transferred = std::min(status_.bytes_transferred + increment, target_bytes_);

    if (status_.bytes_transferred >= target_bytes_) {
        status_.state = download_state::transferred;
    }
    enqueue_locked();
}

void simulated_download::enqueue_locked() {
    pending_.push_back(status_);
    cv_.notify_all();
}

auto simulated_download::fail_locked(const char* operation) const -> result<void> {
    DC_LOG_DEBUG(log_category::service,
                 std::string("Simulated download rejected ") + operation + " in state " +
                 to_string(status_.state));
    return unexpected{make_service_error(operation, to_raw(service_code::invalid_state))};
}

}  // namespace kcenon::delivery_client
