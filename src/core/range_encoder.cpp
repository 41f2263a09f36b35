/**
 * @file range_encoder.cpp
 * @brief Implementation of the range-list wire encoder
 */

#include <kcenon/delivery_client/core/range_encoder.h>
#include <kcenon/delivery_client/core/logging.h>

#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>
#include <utility>

namespace kcenon::delivery_client {

namespace {

class malloc_allocator final : public buffer_allocator {
public:
    auto allocate(std::size_t size) -> void* override {
        return std::malloc(size);
    }

    void release(void* ptr) noexcept override {
        std::free(ptr);
    }
};

}  // namespace

auto default_buffer_allocator() -> buffer_allocator& {
    static malloc_allocator instance;
    return instance;
}

// ============================================================================
// ranges_buffer
// ============================================================================

ranges_buffer::ranges_buffer(std::byte* data, std::size_t size, std::size_t count,
                             buffer_allocator* allocator) noexcept
    : data_(data), size_(size), count_(count), allocator_(allocator) {}

ranges_buffer::~ranges_buffer() {
    reset();
}

ranges_buffer::ranges_buffer(ranges_buffer&& other) noexcept
    : data_(other.data_)
    , size_(other.size_)
    , count_(other.count_)
    , allocator_(other.allocator_) {
    other.data_ = nullptr;
    other.size_ = 0;
    other.count_ = 0;
    other.allocator_ = nullptr;
}

auto ranges_buffer::operator=(ranges_buffer&& other) noexcept -> ranges_buffer& {
    if (this != &other) {
        reset();
        data_ = other.data_;
        size_ = other.size_;
        count_ = other.count_;
        allocator_ = other.allocator_;
        other.data_ = nullptr;
        other.size_ = 0;
        other.count_ = 0;
        other.allocator_ = nullptr;
    }
    return *this;
}

void ranges_buffer::reset() noexcept {
    if (data_ != nullptr && allocator_ != nullptr) {
        allocator_->release(data_);
    }
    data_ = nullptr;
    size_ = 0;
    count_ = 0;
    allocator_ = nullptr;
}

// ============================================================================
// range_encoder
// ============================================================================

auto range_encoder::encode(std::span<const byte_range> ranges,
                           const range_buffer_layout& layout,
                           buffer_allocator& allocator) -> result<ranges_buffer> {
    if (!layout.is_valid()) {
        return unexpected{error{error_code::invalid_argument,
            "Unsupported pointer size: " + std::to_string(layout.pointer_size)}};
    }

    if (ranges.empty()) {
        return ranges_buffer{};
    }

    if (ranges.size() > std::numeric_limits<uint32_t>::max()) {
        return unexpected{error{error_code::range_count_overflow,
            "Too many ranges: " + std::to_string(ranges.size())}};
    }

    const auto size = layout.buffer_size(ranges.size());
    auto* raw = static_cast<std::byte*>(allocator.allocate(size));
    if (raw == nullptr) {
        DC_LOG_ERROR(log_category::encoder,
                     "Range buffer allocation failed (" + std::to_string(size) + " bytes)");
        return unexpected{error{error_code::marshaling_failed,
            "Failed to allocate " + std::to_string(size) + " bytes for ranges"}};
    }

    // Owns the memory from here on, so every return path releases it.
    ranges_buffer buffer(raw, size, ranges.size(), &allocator);

    std::memset(raw, 0, layout.pointer_size);
    const auto count = static_cast<uint32_t>(ranges.size());
    std::memcpy(raw, &count, sizeof(count));

    std::byte* record = raw + layout.array_offset();
    for (const auto& range : ranges) {
        std::memcpy(record, &range.offset, sizeof(uint64_t));
        std::memcpy(record + sizeof(uint64_t), &range.length, sizeof(uint64_t));
        record += range_buffer_layout::record_size;
    }

    DC_LOG_TRACE(log_category::encoder,
                 "Encoded " + std::to_string(count) + " ranges into " +
                 std::to_string(size) + " bytes");

    return result<ranges_buffer>(std::move(buffer));
}

auto range_encoder::decode(const std::byte* buffer, const range_buffer_layout& layout)
    -> std::vector<byte_range> {
    std::vector<byte_range> ranges;
    if (buffer == nullptr || !layout.is_valid()) {
        return ranges;
    }

    const auto count = read_count(buffer);
    ranges.reserve(count);

    const std::byte* record = buffer + layout.array_offset();
    for (uint32_t i = 0; i < count; ++i) {
        byte_range range;
        std::memcpy(&range.offset, record, sizeof(uint64_t));
        std::memcpy(&range.length, record + sizeof(uint64_t), sizeof(uint64_t));
        ranges.push_back(range);
        record += range_buffer_layout::record_size;
    }

    return ranges;
}

auto range_encoder::read_count(const std::byte* buffer) noexcept -> uint32_t {
    if (buffer == nullptr) {
        return 0;
    }
    uint32_t count = 0;
    std::memcpy(&count, buffer, sizeof(count));
    return count;
}

}  // namespace kcenon::delivery_client
