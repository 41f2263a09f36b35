/**
 * @file test_range_encoder.cpp
 * @brief Unit tests for the range-list wire encoder
 */

#include <gtest/gtest.h>

#include <kcenon/delivery_client/core/range_encoder.h>

#include <cstdlib>
#include <cstring>
#include <vector>

namespace kcenon::delivery_client::test {

namespace {

auto read_u32(const std::byte* p) -> uint32_t {
    uint32_t value = 0;
    std::memcpy(&value, p, sizeof(value));
    return value;
}

auto read_u64(const std::byte* p) -> uint64_t {
    uint64_t value = 0;
    std::memcpy(&value, p, sizeof(value));
    return value;
}

class counting_allocator : public buffer_allocator {
public:
    auto allocate(std::size_t size) -> void* override {
        ++allocations;
        last_size = size;
        // Garbage in the padding must not leak into the wire buffer
        void* p = std::malloc(size);
        if (p != nullptr) {
            std::memset(p, 0xAB, size);
        }
        return p;
    }

    void release(void* ptr) noexcept override {
        ++releases;
        std::free(ptr);
    }

    int allocations = 0;
    int releases = 0;
    std::size_t last_size = 0;
};

class failing_allocator : public buffer_allocator {
public:
    auto allocate(std::size_t) -> void* override { return nullptr; }
    void release(void*) noexcept override { ++releases; }

    int releases = 0;
};

}  // namespace

class RangeEncoderTest : public ::testing::Test {
protected:
    download_ranges ranges_{{0, 4096}, {1048576, byte_range::to_end_of_file}};
};

TEST_F(RangeEncoderTest, LayoutOffsets) {
    EXPECT_EQ(range_buffer_layout::record_size, 16u);
    EXPECT_EQ(range_buffer_layout::for_pointer_size(4).array_offset(), 4u);
    EXPECT_EQ(range_buffer_layout::for_pointer_size(8).array_offset(), 8u);
    EXPECT_EQ(range_buffer_layout::for_pointer_size(8).buffer_size(3), 56u);
    EXPECT_EQ(range_buffer_layout::native().pointer_size, sizeof(void*));
    EXPECT_FALSE(range_buffer_layout::for_pointer_size(2).is_valid());
}

TEST_F(RangeEncoderTest, EncodesWith64BitLayout) {
    counting_allocator alloc;
    auto layout = range_buffer_layout::for_pointer_size(8);

    auto encoded = range_encoder::encode(ranges_.ranges(), layout, alloc);
    ASSERT_TRUE(encoded.has_value());

    const auto& buffer = encoded.value();
    ASSERT_EQ(buffer.size(), 8u + 2 * 16u);
    EXPECT_EQ(buffer.count(), 2u);

    const std::byte* p = buffer.data();
    EXPECT_EQ(read_u32(p), 2u);
    EXPECT_EQ(read_u32(p + 4), 0u) << "count slot padding must be zeroed";

    EXPECT_EQ(read_u64(p + 8), 0u);
    EXPECT_EQ(read_u64(p + 16), 4096u);
    EXPECT_EQ(read_u64(p + 24), 1048576u);
    EXPECT_EQ(read_u64(p + 32), byte_range::to_end_of_file);
}

TEST_F(RangeEncoderTest, EncodesWith32BitLayout) {
    counting_allocator alloc;
    auto layout = range_buffer_layout::for_pointer_size(4);

    auto encoded = range_encoder::encode(ranges_.ranges(), layout, alloc);
    ASSERT_TRUE(encoded.has_value());

    const auto& buffer = encoded.value();
    ASSERT_EQ(buffer.size(), 4u + 2 * 16u);

    const std::byte* p = buffer.data();
    EXPECT_EQ(read_u32(p), 2u);
    EXPECT_EQ(read_u64(p + 4), 0u);
    EXPECT_EQ(read_u64(p + 12), 4096u);
    EXPECT_EQ(read_u64(p + 20), 1048576u);
    EXPECT_EQ(read_u64(p + 28), byte_range::to_end_of_file);
}

TEST_F(RangeEncoderTest, EmptyRangesYieldNullBuffer) {
    counting_allocator alloc;
    download_ranges empty;

    auto encoded = range_encoder::encode(empty.ranges(), range_buffer_layout::native(), alloc);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_TRUE(encoded.value().empty());
    EXPECT_EQ(encoded.value().data(), nullptr);
    EXPECT_EQ(alloc.allocations, 0);
}

TEST_F(RangeEncoderTest, BufferReleasedExactlyOnce) {
    counting_allocator alloc;
    {
        auto encoded = range_encoder::encode(ranges_.ranges(),
                                             range_buffer_layout::native(), alloc);
        ASSERT_TRUE(encoded.has_value());

        // Moving the buffer transfers ownership without releasing
        ranges_buffer moved = std::move(encoded.value());
        EXPECT_EQ(alloc.releases, 0);
        EXPECT_FALSE(moved.empty());
    }
    EXPECT_EQ(alloc.allocations, 1);
    EXPECT_EQ(alloc.releases, 1);
}

TEST_F(RangeEncoderTest, ResetReleasesEarly) {
    counting_allocator alloc;
    auto encoded = range_encoder::encode(ranges_.ranges(), range_buffer_layout::native(), alloc);
    ASSERT_TRUE(encoded.has_value());

    encoded.value().reset();
    EXPECT_EQ(alloc.releases, 1);
    EXPECT_TRUE(encoded.value().empty());

    encoded.value().reset();
    EXPECT_EQ(alloc.releases, 1);
}

TEST_F(RangeEncoderTest, ReleasedWhenConsumerFails) {
    counting_allocator alloc;
    auto failing_start = [](const std::byte* ranges_info) -> result<void> {
        if (ranges_info == nullptr) {
            return {};
        }
        return unexpected{error{error_code::invalid_state, "rejected"}};
    };

    {
        auto encoded = range_encoder::encode(ranges_.ranges(),
                                             range_buffer_layout::native(), alloc);
        ASSERT_TRUE(encoded.has_value());
        auto started = failing_start(encoded.value().data());
        EXPECT_FALSE(started.has_value());
    }

    EXPECT_EQ(alloc.allocations, 1);
    EXPECT_EQ(alloc.releases, 1);
}

TEST_F(RangeEncoderTest, AllocationFailureIsMarshalingError) {
    failing_allocator alloc;

    auto encoded = range_encoder::encode(ranges_.ranges(), range_buffer_layout::native(), alloc);
    ASSERT_FALSE(encoded.has_value());
    EXPECT_EQ(encoded.error().code, error_code::marshaling_failed);
    EXPECT_EQ(alloc.releases, 0);
}

TEST_F(RangeEncoderTest, InvalidLayoutRejected) {
    counting_allocator alloc;

    auto encoded = range_encoder::encode(ranges_.ranges(),
                                         range_buffer_layout::for_pointer_size(2), alloc);
    ASSERT_FALSE(encoded.has_value());
    EXPECT_EQ(encoded.error().code, error_code::invalid_argument);
    EXPECT_EQ(alloc.allocations, 0);
}

TEST_F(RangeEncoderTest, DecodeReadsBackRanges) {
    for (std::size_t pointer_size : {std::size_t{4}, std::size_t{8}}) {
        auto layout = range_buffer_layout::for_pointer_size(pointer_size);
        auto encoded = range_encoder::encode(ranges_.ranges(), layout);
        ASSERT_TRUE(encoded.has_value());

        auto decoded = range_encoder::decode(encoded.value().data(), layout);
        ASSERT_EQ(decoded.size(), 2u) << "pointer size " << pointer_size;
        EXPECT_EQ(decoded[0], (byte_range{0, 4096}));
        EXPECT_EQ(decoded[1], (byte_range{1048576, byte_range::to_end_of_file}));
        EXPECT_EQ(range_encoder::read_count(encoded.value().data()), 2u);
    }
}

TEST_F(RangeEncoderTest, DecodeNullIsEmpty) {
    EXPECT_TRUE(range_encoder::decode(nullptr).empty());
    EXPECT_EQ(range_encoder::read_count(nullptr), 0u);
}

}  // namespace kcenon::delivery_client::test
