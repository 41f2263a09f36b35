/**
 * @file range_encoder.h
 * @brief Encoder for the range-list wire buffer passed to a remote start call
 * @version 0.1.0
 *
 * Wire layout (all integers in host byte order):
 *
 * @code
 * offset 0                 : uint32 range count, zero-padded to pointer_size bytes
 * offset pointer_size      : range[0].offset (uint64), range[0].length (uint64)
 * offset pointer_size + 16 : range[1] ...
 * @endcode
 *
 * The count slot is one pointer wide on every target, so the record array
 * starts pointer_size bytes into the buffer: 4 on 32-bit targets and 8 on
 * 64-bit targets. Records are 16 bytes and need no padding between them.
 * An empty range list is never encoded; it travels as a null buffer.
 */

#ifndef KCENON_DELIVERY_CLIENT_CORE_RANGE_ENCODER_H
#define KCENON_DELIVERY_CLIENT_CORE_RANGE_ENCODER_H

#include <kcenon/delivery_client/core/download_ranges.h>
#include <kcenon/delivery_client/core/types.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace kcenon::delivery_client {

/**
 * @brief Memory layout parameters of the range-list buffer
 */
struct range_buffer_layout {
    static constexpr std::size_t record_size = 2 * sizeof(uint64_t);

    std::size_t pointer_size = sizeof(void*);

    /**
     * @brief Layout of the platform this library is compiled for
     */
    [[nodiscard]] static constexpr auto native() noexcept -> range_buffer_layout {
        return range_buffer_layout{sizeof(void*)};
    }

    /**
     * @brief Layout of a target with the given pointer width (4 or 8)
     */
    [[nodiscard]] static constexpr auto for_pointer_size(std::size_t size) noexcept
        -> range_buffer_layout {
        return range_buffer_layout{size};
    }

    [[nodiscard]] constexpr auto is_valid() const noexcept -> bool {
        return pointer_size == 4 || pointer_size == 8;
    }

    /// Byte offset of the first range record
    [[nodiscard]] constexpr auto array_offset() const noexcept -> std::size_t {
        return pointer_size;
    }

    [[nodiscard]] constexpr auto buffer_size(std::size_t count) const noexcept
        -> std::size_t {
        return pointer_size + record_size * count;
    }
};

/**
 * @brief Source of the native memory handed across the process boundary
 *
 * allocate() returns nullptr on failure. release() is called exactly once
 * for every non-null pointer allocate() returned.
 */
class buffer_allocator {
public:
    virtual ~buffer_allocator() = default;

    [[nodiscard]] virtual auto allocate(std::size_t size) -> void* = 0;
    virtual void release(void* ptr) noexcept = 0;
};

/**
 * @brief Process-wide allocator backed by std::malloc / std::free
 */
[[nodiscard]] auto default_buffer_allocator() -> buffer_allocator&;

/**
 * @brief Scoped owner of an encoded range-list buffer
 *
 * Move-only. The memory goes back to its allocator when the buffer is
 * destroyed or reset, whichever comes first. A default-constructed buffer
 * is the null "no ranges" buffer.
 */
class ranges_buffer {
public:
    ranges_buffer() noexcept = default;
    ~ranges_buffer();

    ranges_buffer(const ranges_buffer&) = delete;
    auto operator=(const ranges_buffer&) -> ranges_buffer& = delete;
    ranges_buffer(ranges_buffer&& other) noexcept;
    auto operator=(ranges_buffer&& other) noexcept -> ranges_buffer&;

    /// Pointer to pass to the remote start call; nullptr for no ranges
    [[nodiscard]] auto data() const noexcept -> const std::byte* { return data_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return size_; }
    [[nodiscard]] auto count() const noexcept -> std::size_t { return count_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return data_ == nullptr; }

    [[nodiscard]] auto bytes() const noexcept -> std::span<const std::byte> {
        return {data_, size_};
    }

    /**
     * @brief Release the memory now
     */
    void reset() noexcept;

private:
    friend class range_encoder;

    ranges_buffer(std::byte* data, std::size_t size, std::size_t count,
                  buffer_allocator* allocator) noexcept;

    std::byte* data_ = nullptr;
    std::size_t size_ = 0;
    std::size_t count_ = 0;
    buffer_allocator* allocator_ = nullptr;
};

/**
 * @brief Converts byte ranges to and from the range-list wire buffer
 *
 * @code
 * download_ranges ranges{{0, 4096}, {65536, byte_range::to_end_of_file}};
 * auto buffer = range_encoder::encode(ranges.ranges());
 * if (buffer) {
 *     remote.start(buffer.value().data());
 * }  // memory released here, whether or not start() succeeded
 * @endcode
 */
class range_encoder {
public:
    /**
     * @brief Encode ranges into a newly allocated buffer
     * @param ranges Ranges in request order; empty yields the null buffer
     * @param layout Target memory layout
     * @param allocator Allocator for the buffer memory
     * @return Owned buffer, or invalid_argument / range_count_overflow /
     *         marshaling_failed
     */
    [[nodiscard]] static auto encode(
        std::span<const byte_range> ranges,
        const range_buffer_layout& layout = range_buffer_layout::native(),
        buffer_allocator& allocator = default_buffer_allocator())
        -> result<ranges_buffer>;

    /**
     * @brief Read ranges back from a wire buffer
     * @param buffer Encoded buffer, or nullptr for no ranges
     * @param layout Memory layout the buffer was written with
     */
    [[nodiscard]] static auto decode(
        const std::byte* buffer,
        const range_buffer_layout& layout = range_buffer_layout::native())
        -> std::vector<byte_range>;

    /**
     * @brief Read the range count field of a wire buffer
     */
    [[nodiscard]] static auto read_count(const std::byte* buffer) noexcept -> uint32_t;
};

}  // namespace kcenon::delivery_client

#endif  // KCENON_DELIVERY_CLIENT_CORE_RANGE_ENCODER_H
