/**
 * @file bench_range_encoder.cpp
 * @brief Benchmarks for encoding and decoding range-list buffers
 */

#include <benchmark/benchmark.h>

#include <kcenon/delivery_client/core/range_encoder.h>

#include <cstdint>
#include <vector>

namespace kcenon::delivery_client::benchmark {

namespace {

auto make_ranges(std::size_t count) -> download_ranges {
    download_ranges ranges;
    for (std::size_t i = 0; i < count; ++i) {
        ranges.add(static_cast<uint64_t>(i) * 65536, 4096);
    }
    return ranges;
}

}  // namespace

/**
 * @brief Encode a range list into a freshly allocated buffer and release it
 */
static void BM_RangeEncoder_Encode(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    auto ranges = make_ranges(count);

    for (auto _ : state) {
        auto encoded = range_encoder::encode(ranges.ranges());
        if (!encoded) {
            state.SkipWithError("Failed to encode ranges");
            return;
        }
        ::benchmark::DoNotOptimize(encoded.value().data());
    }

    const auto layout = range_buffer_layout::native();
    state.SetBytesProcessed(static_cast<int64_t>(layout.buffer_size(count)) *
                           static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>(count) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Decode a pre-encoded buffer
 */
static void BM_RangeEncoder_Decode(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    auto ranges = make_ranges(count);

    auto encoded = range_encoder::encode(ranges.ranges());
    if (!encoded) {
        state.SkipWithError("Failed to encode ranges");
        return;
    }

    for (auto _ : state) {
        auto decoded = range_encoder::decode(encoded.value().data());
        ::benchmark::DoNotOptimize(decoded.data());
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                           static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_RangeEncoder_Encode)->RangeMultiplier(8)->Range(1, 32768);
BENCHMARK(BM_RangeEncoder_Decode)->RangeMultiplier(8)->Range(1, 32768);

}  // namespace kcenon::delivery_client::benchmark
