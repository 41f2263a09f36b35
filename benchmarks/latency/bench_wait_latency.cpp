/**
 * @file bench_wait_latency.cpp
 * @brief Benchmarks for status notification and wait wake-up latency
 *
 * Performance Targets:
 * - Notification to waiter wake-up: < 1ms
 */

#include <benchmark/benchmark.h>

#include <kcenon/delivery_client/delivery_client.h>
#include <kcenon/delivery_client/core/logging.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace kcenon::delivery_client::benchmark {

/**
 * @brief Cost of recording one notification with no waiter
 */
static void BM_CallbackSink_Notify(::benchmark::State& state) {
    auto id = download_id::generate();
    callback_sink sink(id);

    download_status status;
    status.state = download_state::transferring;

    for (auto _ : state) {
        ++status.bytes_transferred;
        sink.on_status_changed(id, status);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Time from a notification on another thread to the waiter returning
 */
static void BM_CallbackSink_WakeUp(::benchmark::State& state) {
    auto id = download_id::generate();
    auto sink = std::make_shared<callback_sink>(id);

    for (auto _ : state) {
        state.PauseTiming();
        sink->reset();
        std::atomic<bool> go{false};
        std::thread notifier([&] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            download_status status;
            status.state = download_state::transferred;
            sink->on_status_changed(id, status);
        });
        state.ResumeTiming();

        go = true;
        auto outcome = sink->wait_for_state(download_state::transferred,
                                            std::chrono::seconds(5));
        ::benchmark::DoNotOptimize(outcome);

        state.PauseTiming();
        notifier.join();
        if (!outcome) {
            state.SkipWithError("Wait did not reach transferred");
            return;
        }
        state.ResumeTiming();
    }
}

/**
 * @brief Full start-to-transferred cycle against the simulated service
 */
static void BM_Session_StartToTransferred(::benchmark::State& state) {
    download_file file{"https://bench.example.com/file.bin", "/tmp/file.bin", std::nullopt};
    get_logger().set_level(log_level::warn);

    for (auto _ : state) {
        simulated_download_config config;
        config.total_bytes = 1024 * 1024;
        config.steps = static_cast<uint32_t>(state.range(0));
        config.step_interval = std::chrono::milliseconds(0);

        auto session = download_session::create(file,
                                                std::make_unique<simulated_download>(config));
        if (!session) {
            state.SkipWithError("Failed to create session");
            return;
        }

        auto outcome = session.value().start_and_wait_until_transferred(
            std::chrono::seconds(10));
        if (!outcome || !outcome.value().reached()) {
            state.SkipWithError("Download did not complete");
            return;
        }
    }
}

BENCHMARK(BM_CallbackSink_Notify);
BENCHMARK(BM_CallbackSink_WakeUp)->UseRealTime();
BENCHMARK(BM_Session_StartToTransferred)->Arg(4)->Arg(64)->UseRealTime();

}  // namespace kcenon::delivery_client::benchmark
