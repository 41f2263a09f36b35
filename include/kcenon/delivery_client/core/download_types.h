/**
 * @file download_types.h
 * @brief Download state, property and status definitions
 * @version 0.1.0
 *
 * Numeric values of the enumerations match the remote download
 * service's interface and must not be reordered.
 */

#ifndef KCENON_DELIVERY_CLIENT_CORE_DOWNLOAD_TYPES_H
#define KCENON_DELIVERY_CLIENT_CORE_DOWNLOAD_TYPES_H

#include <array>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace kcenon::delivery_client {

class download_callback;

/**
 * @brief Identifier of a remote download (16-byte GUID)
 */
struct download_id {
    std::array<uint8_t, 16> bytes{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};

    constexpr download_id() noexcept = default;

    explicit constexpr download_id(const std::array<uint8_t, 16>& b) noexcept
        : bytes(b) {}

    /**
     * @brief Generate a new random identifier (version 4 GUID)
     */
    [[nodiscard]] static auto generate() -> download_id;

    /**
     * @brief Convert to lowercase GUID string without braces
     */
    [[nodiscard]] auto to_string() const -> std::string;

    /**
     * @brief Parse from GUID string
     *
     * Accepts the dashed form with or without surrounding braces.
     */
    [[nodiscard]] static auto from_string(std::string_view str)
        -> std::optional<download_id>;

    [[nodiscard]] constexpr auto is_null() const noexcept -> bool {
        for (const auto& b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr auto operator==(const download_id& other) const
        noexcept -> bool = default;

    [[nodiscard]] constexpr auto operator<(const download_id& other) const
        noexcept -> bool {
        return bytes < other.bytes;
    }
};

/**
 * @brief Download state as reported by the remote service
 */
enum class download_state : uint32_t {
    created = 0,
    transferring = 1,
    transferred = 2,
    finalized = 3,
    aborted = 4,
    paused = 5,
};

[[nodiscard]] constexpr auto to_string(download_state state) noexcept
    -> const char* {
    switch (state) {
        case download_state::created: return "created";
        case download_state::transferring: return "transferring";
        case download_state::transferred: return "transferred";
        case download_state::finalized: return "finalized";
        case download_state::aborted: return "aborted";
        case download_state::paused: return "paused";
        default: return "unknown";
    }
}

/**
 * @brief Check if the state admits no further transfer
 */
[[nodiscard]] constexpr auto is_terminal_state(download_state state) noexcept
    -> bool {
    return state == download_state::finalized ||
           state == download_state::aborted;
}

/**
 * @brief Network cost policy for a download
 */
enum class cost_policy : uint32_t {
    always = 0,               ///< Download regardless of cost
    unrestricted = 1,         ///< Unrestricted networks only
    standard_background = 2,  ///< Default background policy
    no_roaming = 3,
    no_surcharge = 4,
    no_cellular = 5,
};

[[nodiscard]] constexpr auto to_string(cost_policy policy) noexcept
    -> const char* {
    switch (policy) {
        case cost_policy::always: return "always";
        case cost_policy::unrestricted: return "unrestricted";
        case cost_policy::standard_background: return "standard_background";
        case cost_policy::no_roaming: return "no_roaming";
        case cost_policy::no_surcharge: return "no_surcharge";
        case cost_policy::no_cellular: return "no_cellular";
        default: return "unknown";
    }
}

/**
 * @brief Property keys of a remote download
 */
enum class download_property : uint32_t {
    id = 0,                            ///< string, read-only
    uri = 1,                           ///< string
    display_name = 3,                  ///< string
    local_path = 4,                    ///< string
    cost_policy = 6,                   ///< uint32 (cost_policy)
    callback_freq_percent = 8,         ///< uint32
    callback_freq_seconds = 9,         ///< uint32
    no_progress_timeout_seconds = 10,  ///< uint32
    foreground_priority = 11,          ///< bool, default false
    callback_interface = 13,           ///< download_callback or null
    total_size_bytes = 21,             ///< uint64, read-only
};

[[nodiscard]] constexpr auto to_string(download_property property) noexcept
    -> const char* {
    switch (property) {
        case download_property::id: return "id";
        case download_property::uri: return "uri";
        case download_property::display_name: return "display_name";
        case download_property::local_path: return "local_path";
        case download_property::cost_policy: return "cost_policy";
        case download_property::callback_freq_percent: return "callback_freq_percent";
        case download_property::callback_freq_seconds: return "callback_freq_seconds";
        case download_property::no_progress_timeout_seconds:
            return "no_progress_timeout_seconds";
        case download_property::foreground_priority: return "foreground_priority";
        case download_property::callback_interface: return "callback_interface";
        case download_property::total_size_bytes: return "total_size_bytes";
        default: return "unknown";
    }
}

/**
 * @brief Value of a download property
 *
 * std::monostate is the null value, used to clear the callback interface.
 */
using property_value = std::variant<
    std::monostate,
    bool,
    uint32_t,
    uint64_t,
    std::string,
    std::shared_ptr<download_callback>>;

/**
 * @brief Status snapshot of a remote download
 */
struct download_status {
    download_state state = download_state::created;
    int32_t error = 0;            ///< Service status of the transfer, 0 if none
    int32_t extended_error = 0;   ///< Additional detail for error
    uint64_t bytes_total = 0;     ///< Total size, 0 while unknown
    uint64_t bytes_transferred = 0;

    [[nodiscard]] auto has_error() const noexcept -> bool {
        return error != 0 || extended_error != 0;
    }

    [[nodiscard]] auto operator==(const download_status& other) const
        -> bool = default;
};

/**
 * @brief Description of the file a session downloads
 *
 * Owned by the caller; a download_session only references it.
 */
struct download_file {
    std::string uri;                     ///< Source URI
    std::filesystem::path local_path;    ///< Destination on disk
    std::optional<uint64_t> size;        ///< Expected size, if known
};

}  // namespace kcenon::delivery_client

template <>
struct std::hash<kcenon::delivery_client::download_id> {
    auto operator()(const kcenon::delivery_client::download_id& id) const noexcept
        -> std::size_t {
        std::size_t seed = 0;
        for (auto b : id.bytes) {
            seed = seed * 131 + b;
        }
        return seed;
    }
};

#endif  // KCENON_DELIVERY_CLIENT_CORE_DOWNLOAD_TYPES_H
