/**
 * @file test_callback_sink.cpp
 * @brief Unit tests for callback_sink
 */

#include <gtest/gtest.h>

#include <kcenon/delivery_client/session/callback_sink.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

namespace kcenon::delivery_client::test {

using namespace std::chrono_literals;

namespace {

auto make_status(download_state state, uint64_t transferred = 0) -> download_status {
    download_status status;
    status.state = state;
    status.bytes_total = 1000;
    status.bytes_transferred = transferred;
    return status;
}

}  // namespace

class CallbackSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        id_ = download_id::generate();
        sink_ = std::make_shared<callback_sink>(id_);
    }

    void notify_later(download_status status, std::chrono::milliseconds delay) {
        notifier_ = std::thread([this, status, delay] {
            std::this_thread::sleep_for(delay);
            sink_->on_status_changed(id_, status);
        });
    }

    void TearDown() override {
        if (notifier_.joinable()) {
            notifier_.join();
        }
    }

    download_id id_;
    std::shared_ptr<callback_sink> sink_;
    std::thread notifier_;
};

TEST_F(CallbackSinkTest, InitialState) {
    auto snap = sink_->snapshot();

    EXPECT_FALSE(snap.has_status);
    EXPECT_FALSE(snap.complete);
    EXPECT_TRUE(sink_->is_attached());
    EXPECT_EQ(sink_->notification_count(), 0u);
    EXPECT_EQ(sink_->id(), id_);
}

TEST_F(CallbackSinkTest, ReachesTargetFromOtherThread) {
    notify_later(make_status(download_state::transferring), 20ms);

    auto outcome = sink_->wait_for_state(download_state::transferring, 5s);

    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome.value().reached());
    EXPECT_EQ(outcome.value().status.state, download_state::transferring);
}

TEST_F(CallbackSinkTest, AlreadyInTargetReturnsImmediately) {
    sink_->on_status_changed(id_, make_status(download_state::transferred, 1000));

    auto outcome = sink_->wait_for_state(download_state::transferred, 0ms);

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value().reason, wait_reason::reached);
    EXPECT_TRUE(sink_->is_complete());
}

TEST_F(CallbackSinkTest, BailoutStateEndsWait) {
    notify_later(make_status(download_state::paused), 10ms);

    auto outcome = sink_->wait_for_state(download_state::transferred, 5s,
                                         {download_state::paused, download_state::aborted});

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value().reason, wait_reason::bailed_out);
    EXPECT_EQ(outcome.value().status.state, download_state::paused);
}

TEST_F(CallbackSinkTest, StateOutsideBailoutsKeepsWaiting) {
    sink_->on_status_changed(id_, make_status(download_state::paused));

    auto outcome = sink_->wait_for_state(download_state::transferring, 30ms);

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::wait_timeout);
}

TEST_F(CallbackSinkTest, ZeroTimeoutWithoutStatusTimesOut) {
    auto start = std::chrono::steady_clock::now();
    auto outcome = sink_->wait_for_state(download_state::transferring, 0ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::wait_timeout);
    EXPECT_LT(elapsed, 1s);
}

TEST_F(CallbackSinkTest, TimeoutHonorsBudget) {
    auto start = std::chrono::steady_clock::now();
    auto outcome = sink_->wait_for_state(download_state::transferred, 50ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::wait_timeout);
    EXPECT_GE(elapsed, 50ms);
}

TEST_F(CallbackSinkTest, ErrorTakesPrecedenceOverTarget) {
    auto status = make_status(download_state::transferring);
    status.error = static_cast<int32_t>(0x80D02002u);
    sink_->on_status_changed(id_, status);

    auto outcome = sink_->wait_for_state(download_state::transferring, 1s);

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value().reason, wait_reason::error_reported);
    EXPECT_EQ(outcome.value().status.error, static_cast<int32_t>(0x80D02002u));
}

TEST_F(CallbackSinkTest, ExtendedErrorAloneEndsWait) {
    auto status = make_status(download_state::paused);
    status.extended_error = 12029;
    notify_later(status, 10ms);

    auto outcome = sink_->wait_for_state(download_state::transferred, 5s);

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value().reason, wait_reason::error_reported);
}

TEST_F(CallbackSinkTest, ResetClearsErrorAndCompletion) {
    auto status = make_status(download_state::transferred, 1000);
    sink_->on_status_changed(id_, status);
    status.error = -1;
    sink_->on_status_changed(id_, status);
    ASSERT_TRUE(sink_->is_complete());

    sink_->reset();

    auto snap = sink_->snapshot();
    EXPECT_FALSE(snap.has_status);
    EXPECT_FALSE(snap.complete);
    EXPECT_EQ(snap.status.error, 0);

    // The reset sink must not report the stale error again
    auto outcome = sink_->wait_for_state(download_state::transferring, 0ms);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::wait_timeout);
}

TEST_F(CallbackSinkTest, ForeignIdIgnored) {
    sink_->on_status_changed(download_id::generate(),
                             make_status(download_state::transferred));

    EXPECT_FALSE(sink_->snapshot().has_status);
    EXPECT_EQ(sink_->notification_count(), 0u);
}

TEST_F(CallbackSinkTest, DetachReleasesWaiter) {
    auto waiter = std::async(std::launch::async, [this] {
        return sink_->wait_for_state(download_state::transferred,
                                     std::chrono::milliseconds::max());
    });

    std::this_thread::sleep_for(20ms);
    sink_->detach();

    ASSERT_EQ(waiter.wait_for(5s), std::future_status::ready);
    auto outcome = waiter.get();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::no_callback_sink);
}

TEST_F(CallbackSinkTest, DetachedSinkIgnoresNotifications) {
    sink_->detach();
    sink_->on_status_changed(id_, make_status(download_state::transferring));

    EXPECT_FALSE(sink_->is_attached());
    EXPECT_FALSE(sink_->snapshot().has_status);
}

TEST_F(CallbackSinkTest, UnboundedWaitWakesOnNotification) {
    notify_later(make_status(download_state::transferred, 1000), 20ms);

    auto outcome = sink_->wait_for_state(download_state::transferred,
                                         std::chrono::milliseconds::max());

    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome.value().reached());
}

TEST_F(CallbackSinkTest, BudgetBeyondClockRangeWaitsForNotification) {
    notify_later(make_status(download_state::transferred, 1000), 50ms);

    auto started = std::chrono::steady_clock::now();
    auto outcome = sink_->wait_for_state(
        download_state::transferred,
        std::chrono::milliseconds(std::chrono::milliseconds::max().count() - 1));
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_TRUE(outcome.value().reached());
    EXPECT_GE(elapsed, 40ms);
}

TEST_F(CallbackSinkTest, AttachAfterDetachAcceptsNotifications) {
    sink_->detach();
    sink_->attach();
    notify_later(make_status(download_state::transferring, 10), 10ms);

    auto outcome = sink_->wait_for_state(download_state::transferring, 5s);

    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_TRUE(outcome.value().reached());
    EXPECT_TRUE(sink_->is_attached());
}

TEST_F(CallbackSinkTest, SnapshotIsNeverTorn) {
    // Writers keep bytes_transferred equal to error so a mixed snapshot shows
    constexpr int writers = 4;
    constexpr int updates = 2000;
    std::atomic<bool> done{false};
    std::atomic<int> torn{0};

    std::thread reader([&] {
        while (!done.load()) {
            auto snap = sink_->snapshot();
            if (snap.has_status &&
                static_cast<int64_t>(snap.status.bytes_transferred) != snap.status.error) {
                ++torn;
            }
        }
    });

    std::vector<std::thread> threads;
    for (int w = 0; w < writers; ++w) {
        threads.emplace_back([this, w] {
            for (int i = 1; i <= updates; ++i) {
                download_status status;
                status.state = download_state::transferring;
                status.error = w * updates + i;
                status.bytes_transferred = static_cast<uint64_t>(w * updates + i);
                sink_->on_status_changed(id_, status);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    done = true;
    reader.join();

    EXPECT_EQ(torn.load(), 0);
    EXPECT_EQ(sink_->notification_count(), static_cast<uint64_t>(writers * updates));
}

}  // namespace kcenon::delivery_client::test
