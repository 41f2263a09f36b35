/**
 * @file test_core_types.cpp
 * @brief Unit tests for core types (error_code, result, download types, ranges)
 */

#include <gtest/gtest.h>

#include <kcenon/delivery_client/core/download_ranges.h>
#include <kcenon/delivery_client/core/download_types.h>
#include <kcenon/delivery_client/core/types.h>

#include <string>
#include <vector>

namespace kcenon::delivery_client::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    EXPECT_EQ(static_cast<int>(error_code::success), 0);

    // Session errors: -100 to -119
    EXPECT_EQ(static_cast<int>(error_code::invalid_download_id), -100);
    EXPECT_EQ(static_cast<int>(error_code::property_type_mismatch), -103);

    // Remote errors: -120 to -139
    EXPECT_EQ(static_cast<int>(error_code::remote_call_failed), -120);
    EXPECT_EQ(static_cast<int>(error_code::service_unavailable), -125);

    // Wait errors: -140 to -159
    EXPECT_EQ(static_cast<int>(error_code::wait_timeout), -140);

    // Marshaling errors: -160 to -179
    EXPECT_EQ(static_cast<int>(error_code::marshaling_failed), -160);
    EXPECT_EQ(static_cast<int>(error_code::range_count_overflow), -161);

    EXPECT_EQ(static_cast<int>(error_code::internal_error), -200);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STRNE(to_string(error_code::wait_timeout), "unknown error");
    EXPECT_STRNE(to_string(error_code::no_callback_sink), "unknown error");
}

// =============================================================================
// result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r = 42;

    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
    EXPECT_FALSE(static_cast<bool>(r.error()));
}

TEST_F(ResultTest, HoldsError) {
    result<int> r = unexpected{error{error_code::invalid_state, "bad state", -2133843949}};

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::invalid_state);
    EXPECT_EQ(r.error().message, "bad state");
    EXPECT_EQ(r.error().service_code, -2133843949);
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected{error{error_code::wait_timeout}};
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::wait_timeout);
    EXPECT_EQ(failed.error().service_code, 0);
}

TEST_F(ResultTest, ErrorWithCodeOnlyUsesDescription) {
    error err{error_code::no_callback_sink};

    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_EQ(err.message, to_string(error_code::no_callback_sink));
}

// =============================================================================
// download_state / cost_policy / download_property Tests
// =============================================================================

class DownloadEnumTest : public ::testing::Test {};

TEST_F(DownloadEnumTest, StateValuesMatchService) {
    EXPECT_EQ(static_cast<uint32_t>(download_state::created), 0u);
    EXPECT_EQ(static_cast<uint32_t>(download_state::transferring), 1u);
    EXPECT_EQ(static_cast<uint32_t>(download_state::transferred), 2u);
    EXPECT_EQ(static_cast<uint32_t>(download_state::finalized), 3u);
    EXPECT_EQ(static_cast<uint32_t>(download_state::aborted), 4u);
    EXPECT_EQ(static_cast<uint32_t>(download_state::paused), 5u);
}

TEST_F(DownloadEnumTest, StateToString) {
    EXPECT_STREQ(to_string(download_state::created), "created");
    EXPECT_STREQ(to_string(download_state::transferring), "transferring");
    EXPECT_STREQ(to_string(download_state::paused), "paused");
    EXPECT_STREQ(to_string(static_cast<download_state>(99)), "unknown");
}

TEST_F(DownloadEnumTest, TerminalStates) {
    EXPECT_TRUE(is_terminal_state(download_state::finalized));
    EXPECT_TRUE(is_terminal_state(download_state::aborted));
    EXPECT_FALSE(is_terminal_state(download_state::transferred));
    EXPECT_FALSE(is_terminal_state(download_state::paused));
}

TEST_F(DownloadEnumTest, CostPolicyValues) {
    EXPECT_EQ(static_cast<uint32_t>(cost_policy::always), 0u);
    EXPECT_EQ(static_cast<uint32_t>(cost_policy::standard_background), 2u);
    EXPECT_EQ(static_cast<uint32_t>(cost_policy::no_cellular), 5u);
    EXPECT_STREQ(to_string(cost_policy::no_roaming), "no_roaming");
}

TEST_F(DownloadEnumTest, PropertyIdsMatchService) {
    EXPECT_EQ(static_cast<uint32_t>(download_property::id), 0u);
    EXPECT_EQ(static_cast<uint32_t>(download_property::uri), 1u);
    EXPECT_EQ(static_cast<uint32_t>(download_property::cost_policy), 6u);
    EXPECT_EQ(static_cast<uint32_t>(download_property::no_progress_timeout_seconds), 10u);
    EXPECT_EQ(static_cast<uint32_t>(download_property::foreground_priority), 11u);
    EXPECT_EQ(static_cast<uint32_t>(download_property::callback_interface), 13u);
    EXPECT_EQ(static_cast<uint32_t>(download_property::total_size_bytes), 21u);
}

// =============================================================================
// download_status Tests
// =============================================================================

TEST(DownloadStatusTest, DefaultHasNoError) {
    download_status status;

    EXPECT_EQ(status.state, download_state::created);
    EXPECT_FALSE(status.has_error());
}

TEST(DownloadStatusTest, ExtendedErrorAloneCountsAsError) {
    download_status status;
    status.extended_error = 12007;

    EXPECT_TRUE(status.has_error());
}

// =============================================================================
// download_ranges Tests
// =============================================================================

class DownloadRangesTest : public ::testing::Test {};

TEST_F(DownloadRangesTest, KeepsInsertionOrder) {
    download_ranges ranges;
    ranges.add(4096, 100).add(0, 10);

    ASSERT_EQ(ranges.count(), 2u);
    EXPECT_EQ(ranges.ranges()[0], (byte_range{4096, 100}));
    EXPECT_EQ(ranges.ranges()[1], (byte_range{0, 10}));
}

TEST_F(DownloadRangesTest, NullOrEmpty) {
    download_ranges empty;
    download_ranges one{{0, byte_range::to_end_of_file}};

    EXPECT_TRUE(download_ranges::is_null_or_empty(nullptr));
    EXPECT_TRUE(download_ranges::is_null_or_empty(&empty));
    EXPECT_FALSE(download_ranges::is_null_or_empty(&one));
}

TEST_F(DownloadRangesTest, ClearEmptiesCollection) {
    download_ranges ranges{{0, 1}, {2, 3}};
    ranges.clear();

    EXPECT_TRUE(ranges.empty());
    EXPECT_EQ(ranges.count(), 0u);
}

}  // namespace kcenon::delivery_client::test
