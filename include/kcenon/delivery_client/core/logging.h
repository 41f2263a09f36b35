// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

// logger_system integration requires common_system
#if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
#define DELIVERY_CLIENT_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::delivery_client {

/**
 * @brief Log categories for delivery_client
 */
struct log_category {
    static constexpr std::string_view session = "delivery_client.session";
    static constexpr std::string_view encoder = "delivery_client.encoder";
    static constexpr std::string_view callback = "delivery_client.callback";
    static constexpr std::string_view service = "delivery_client.service";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Configuration for sensitive information masking
 *
 * URIs of a download frequently carry access tokens in their query string,
 * and local paths reveal user directory names.
 */
struct masking_config {
    bool mask_uri_queries = false;
    bool mask_paths = false;
    std::string mask_char = "*";

    static masking_config all_masked() {
        return {true, true, "*"};
    }

    static masking_config none() {
        return {false, false, "*"};
    }
};

/**
 * @brief Masks sensitive parts of log messages
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    /**
     * @brief Mask every URI query string and local path found in a message
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_uri_queries && !config_.mask_paths) {
            return input;
        }

        std::string result = input;

        if (config_.mask_uri_queries) {
            result = replace_matches(result, uri_pattern(),
                                     [this](const std::string& m) { return mask_uri(m); });
        }

        if (config_.mask_paths) {
            result = replace_matches(result, path_pattern(),
                                     [this](const std::string& m) { return mask_path(m); });
        }

        return result;
    }

    /**
     * @brief Replace the query string of a URI, keeping scheme, host and path
     */
    [[nodiscard]] auto mask_uri(const std::string& uri) const -> std::string {
        if (!config_.mask_uri_queries || uri.empty()) {
            return uri;
        }

        auto query = uri.find('?');
        if (query == std::string::npos) {
            return uri;
        }

        auto fragment = uri.find('#', query);
        auto query_len = (fragment == std::string::npos ? uri.size() : fragment) - query - 1;

        std::string masked = uri.substr(0, query + 1);
        masked += std::string(query_len, config_.mask_char[0]);
        if (fragment != std::string::npos) {
            masked += uri.substr(fragment);
        }
        return masked;
    }

    /**
     * @brief Mask the directory part of a local path, keeping the file name
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }

        std::string masked_dir(last_sep, config_.mask_char[0]);
        return masked_dir + "/" + path.substr(last_sep + 1);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    static auto uri_pattern() -> const std::regex& {
        static const std::regex pattern(R"([a-zA-Z][a-zA-Z0-9+.-]*://[^\s"]+)");
        return pattern;
    }

    static auto path_pattern() -> const std::regex& {
        static const std::regex pattern(
            R"((?:^|[\s"'=])((?:\/[a-zA-Z0-9._-]+)+|(?:[a-zA-Z]:\\(?:[a-zA-Z0-9._-]+\\?)+)))");
        return pattern;
    }

    template <typename Fn>
    static auto replace_matches(const std::string& input, const std::regex& pattern,
                                Fn&& replace) -> std::string {
        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), pattern);
        std::sregex_iterator end;

        std::size_t last_pos = 0;
        for (; it != end; ++it) {
            // Replace the innermost capture when the pattern has one
            const auto& m = it->size() > 1 && (*it)[1].matched ? (*it)[1] : (*it)[0];
            auto pos = static_cast<std::size_t>(m.first - input.begin());
            result += input.substr(last_pos, pos - last_pos);
            result += replace(m.str());
            last_pos = pos + static_cast<std::size_t>(m.length());
        }
        result += input.substr(last_pos);

        return result;
    }

    masking_config config_;
};

namespace detail {

inline auto escape_json_string(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured log context for a download session
 */
struct session_log_context {
    std::string download_id;
    std::string uri;
    std::string local_path;
    std::optional<std::string> state;
    std::optional<std::string> target_state;
    std::optional<int32_t> error_code;
    std::optional<int32_t> extended_error_code;
    std::optional<uint64_t> range_count;
    std::optional<uint64_t> bytes_total;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> timeout_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };
        auto add_code = [&](const char* name, int32_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"0x" << std::hex << std::uppercase
                << std::setfill('0') << std::setw(8) << static_cast<uint32_t>(value)
                << std::dec << std::nouppercase << std::setfill(' ') << "\"";
            first = false;
        };

        if (!download_id.empty()) add_field("download_id", download_id);
        if (!uri.empty()) add_field("uri", masker ? masker->mask_uri(uri) : uri);
        if (!local_path.empty()) {
            add_field("local_path", masker ? masker->mask_path(local_path) : local_path);
        }
        if (state) add_field("state", *state);
        if (target_state) add_field("target_state", *target_state);
        if (error_code) add_code("error", *error_code);
        if (extended_error_code) add_code("extended_error", *extended_error_code);
        if (range_count) add_uint("range_count", *range_count);
        if (bytes_total) add_uint("bytes_total", *bytes_total);
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (timeout_ms) add_uint("timeout_ms", *timeout_ms);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<session_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{";
            oss << "\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder for structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::session)
 *     .with_message("Download transferred")
 *     .with_download_id("5a0c...")
 *     .with_state("transferred")
 *     .with_bytes_transferred(1048576)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_download_id(std::string_view id) -> log_entry_builder& {
        ensure_context();
        entry_.context->download_id = std::string(id);
        return *this;
    }

    auto with_uri(std::string_view uri) -> log_entry_builder& {
        ensure_context();
        entry_.context->uri = std::string(uri);
        return *this;
    }

    auto with_state(std::string_view state) -> log_entry_builder& {
        ensure_context();
        entry_.context->state = std::string(state);
        return *this;
    }

    auto with_error_code(int32_t code) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_code = code;
        return *this;
    }

    auto with_range_count(uint64_t count) -> log_entry_builder& {
        ensure_context();
        entry_.context->range_count = count;
        return *this;
    }

    auto with_bytes_transferred(uint64_t bytes) -> log_entry_builder& {
        ensure_context();
        entry_.context->bytes_transferred = bytes;
        return *this;
    }

    auto with_error_message(std::string_view error) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_message = std::string(error);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function)
        -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const session_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

    [[nodiscard]] auto build_json_masked(const sensitive_info_masker& masker) const
        -> std::string {
        return entry_.to_json_with_masking(&masker);
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = session_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger for delivery_client
 */
class delivery_client_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const session_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&,
                                                 const std::string&)>;

    delivery_client_logger() = default;
    ~delivery_client_logger() = default;

    delivery_client_logger(const delivery_client_logger&) = delete;
    delivery_client_logger& operator=(const delivery_client_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; subsequent calls are no-ops.
     * Called when a download session is created.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#ifdef DELIVERY_CLIENT_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(kcenon::logger::log_level::info)
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#ifdef DELIVERY_CLIENT_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#ifdef DELIVERY_CLIENT_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    void enable_masking(bool enable = true) {
        set_masking_config(enable ? masking_config::all_masked() : masking_config::none());
    }

    /**
     * @brief Set a callback that sees every enabled message
     *
     * Pass an empty function to remove it.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const session_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {

        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        if (format == log_output_format::json) {
            log_json(level, category, message, context, file, line, function, current_masker);
        } else {
            log_text(level, category, message, context, current_masker);
        }
    }

    void flush() {
#ifdef DELIVERY_CLIENT_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void log_json(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const session_log_context* context,
                  const char* file,
                  int line,
                  const char* function,
                  const sensitive_info_masker& masker) {

        auto builder = log_entry_builder()
            .with_level(level)
            .with_category(category)
            .with_message(message);

        if (file || line > 0 || function) {
            builder.with_source_location(file, line, function);
        }

        if (context) {
            builder.with_context(*context);
        }

        auto entry = builder.build();
        std::string json_str = entry.to_json_with_masking(&masker);

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
            }
        }

#ifdef DELIVERY_CLIENT_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), json_str, file, line, function);
            } else {
                logger_->log(to_logger_level(level), json_str);
            }
        }
#else
        output_to_stderr(json_str);
#endif
    }

    void log_text(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const session_log_context* context,
                  const sensitive_info_masker& masker) {
        std::ostringstream oss;
#ifndef DELIVERY_CLIENT_USE_LOGGER_SYSTEM
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] ";
#endif
        oss << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json_with_masking(&masker);
        }

#ifdef DELIVERY_CLIENT_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->log(to_logger_level(level), oss.str());
        }
#else
        output_to_stderr(oss.str());
#endif
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#ifdef DELIVERY_CLIENT_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline delivery_client_logger& get_logger() {
    static delivery_client_logger instance;
    return instance;
}

#define DC_LOG(level, category, message) \
    kcenon::delivery_client::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define DC_LOG_CTX(level, category, message, context) \
    kcenon::delivery_client::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define DC_LOG_TRACE(category, message) \
    DC_LOG(kcenon::delivery_client::log_level::trace, category, message)

#define DC_LOG_DEBUG(category, message) \
    DC_LOG(kcenon::delivery_client::log_level::debug, category, message)

#define DC_LOG_INFO(category, message) \
    DC_LOG(kcenon::delivery_client::log_level::info, category, message)

#define DC_LOG_WARN(category, message) \
    DC_LOG(kcenon::delivery_client::log_level::warn, category, message)

#define DC_LOG_ERROR(category, message) \
    DC_LOG(kcenon::delivery_client::log_level::error, category, message)

#define DC_LOG_FATAL(category, message) \
    DC_LOG(kcenon::delivery_client::log_level::fatal, category, message)

#define DC_LOG_DEBUG_CTX(category, message, ctx) \
    DC_LOG_CTX(kcenon::delivery_client::log_level::debug, category, message, ctx)

#define DC_LOG_INFO_CTX(category, message, ctx) \
    DC_LOG_CTX(kcenon::delivery_client::log_level::info, category, message, ctx)

#define DC_LOG_WARN_CTX(category, message, ctx) \
    DC_LOG_CTX(kcenon::delivery_client::log_level::warn, category, message, ctx)

#define DC_LOG_ERROR_CTX(category, message, ctx) \
    DC_LOG_CTX(kcenon::delivery_client::log_level::error, category, message, ctx)

} // namespace kcenon::delivery_client
