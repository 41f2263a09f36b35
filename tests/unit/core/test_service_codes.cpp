/**
 * @file test_service_codes.cpp
 * @brief Unit tests for remote service status codes and their mapping
 */

#include <gtest/gtest.h>

#include <kcenon/delivery_client/core/service_codes.h>

#include <string>

namespace kcenon::delivery_client::test {

class ServiceCodeTest : public ::testing::Test {};

TEST_F(ServiceCodeTest, RawValues) {
    EXPECT_EQ(static_cast<uint32_t>(to_raw(service_code::invalid_state)), 0x80D02013u);
    EXPECT_EQ(static_cast<uint32_t>(to_raw(service_code::job_not_found)), 0x80D02003u);
    EXPECT_EQ(to_raw(service_code::ok), 0);
}

TEST_F(ServiceCodeTest, FailureIsNegative) {
    EXPECT_TRUE(is_failure(to_raw(service_code::invalid_state)));
    EXPECT_TRUE(is_failure(to_raw(service_code::fail)));
    EXPECT_FALSE(is_failure(0));
    EXPECT_FALSE(is_failure(1));
}

TEST_F(ServiceCodeTest, MapsToErrorCode) {
    EXPECT_EQ(to_error_code(to_raw(service_code::invalid_state)), error_code::invalid_state);
    EXPECT_EQ(to_error_code(to_raw(service_code::unknown_property_id)),
              error_code::unknown_property);
    EXPECT_EQ(to_error_code(to_raw(service_code::read_only_property)),
              error_code::read_only_property);
    EXPECT_EQ(to_error_code(to_raw(service_code::job_not_found)),
              error_code::download_not_found);
    EXPECT_EQ(to_error_code(to_raw(service_code::job_too_old)),
              error_code::download_not_found);
    EXPECT_EQ(to_error_code(to_raw(service_code::no_service)),
              error_code::service_unavailable);
    EXPECT_EQ(to_error_code(to_raw(service_code::invalid_arg)), error_code::invalid_argument);
}

TEST_F(ServiceCodeTest, UnknownFailureIsRemoteCallFailed) {
    EXPECT_EQ(to_error_code(to_raw(service_code::fail)), error_code::remote_call_failed);
    EXPECT_EQ(to_error_code(static_cast<int32_t>(0x80D0FFFFu)), error_code::remote_call_failed);
}

TEST_F(ServiceCodeTest, SuccessMapsToSuccess) {
    EXPECT_EQ(to_error_code(0), error_code::success);
}

TEST_F(ServiceCodeTest, FormatIsUppercaseHex) {
    EXPECT_EQ(format_service_code(to_raw(service_code::invalid_state)), "0x80D02013");
    EXPECT_EQ(format_service_code(0), "0x00000000");
}

TEST_F(ServiceCodeTest, MakeServiceErrorKeepsRawCode) {
    auto raw = to_raw(service_code::invalid_state);
    auto err = make_service_error("abort", raw);

    EXPECT_EQ(err.code, error_code::invalid_state);
    EXPECT_EQ(err.service_code, raw);
    EXPECT_NE(err.message.find("abort"), std::string::npos);
    EXPECT_NE(err.message.find("0x80D02013"), std::string::npos);
}

}  // namespace kcenon::delivery_client::test
