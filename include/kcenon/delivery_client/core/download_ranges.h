/**
 * @file download_ranges.h
 * @brief Byte ranges requested from a remote download
 */

#ifndef KCENON_DELIVERY_CLIENT_CORE_DOWNLOAD_RANGES_H
#define KCENON_DELIVERY_CLIENT_CORE_DOWNLOAD_RANGES_H

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <span>
#include <utility>
#include <vector>

namespace kcenon::delivery_client {

/**
 * @brief A single (offset, length) byte range
 */
struct byte_range {
    /// Length value meaning "from offset through the end of the file"
    static constexpr uint64_t to_end_of_file = std::numeric_limits<uint64_t>::max();

    uint64_t offset = 0;
    uint64_t length = 0;

    [[nodiscard]] constexpr auto operator==(const byte_range& other) const noexcept
        -> bool = default;
};

/**
 * @brief Ordered collection of byte ranges for a partial transfer
 *
 * An empty collection means "no range restriction": the whole file is
 * transferred.
 */
class download_ranges {
public:
    download_ranges() = default;

    download_ranges(std::initializer_list<byte_range> ranges)
        : ranges_(ranges) {}

    explicit download_ranges(std::vector<byte_range> ranges)
        : ranges_(std::move(ranges)) {}

    /**
     * @brief Append a range
     * @return Reference to this collection for chaining
     */
    auto add(uint64_t offset, uint64_t length) -> download_ranges& {
        ranges_.push_back(byte_range{offset, length});
        return *this;
    }

    [[nodiscard]] auto count() const noexcept -> std::size_t { return ranges_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return ranges_.empty(); }

    [[nodiscard]] auto ranges() const noexcept -> std::span<const byte_range> {
        return ranges_;
    }

    void clear() noexcept { ranges_.clear(); }

    /**
     * @brief Check if a collection is absent or holds no ranges
     */
    [[nodiscard]] static auto is_null_or_empty(const download_ranges* ranges) noexcept
        -> bool {
        return ranges == nullptr || ranges->empty();
    }

private:
    std::vector<byte_range> ranges_;
};

}  // namespace kcenon::delivery_client

#endif  // KCENON_DELIVERY_CLIENT_CORE_DOWNLOAD_RANGES_H
