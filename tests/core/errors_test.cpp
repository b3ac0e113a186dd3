#include "relay/core/errors.hpp"
#include "relay/core/result.hpp"

#include <gtest/gtest.h>

#include <string>

using relay::FailureReason;
using relay::UploadError;
using relay::UploadErrorKind;

TEST(UploadErrorTest, OnlyTransportFailuresAreRetryable) {
    EXPECT_TRUE(relay::is_retryable(UploadErrorKind::TransportFailure));
    EXPECT_FALSE(relay::is_retryable(UploadErrorKind::RateLimited));
    EXPECT_FALSE(relay::is_retryable(UploadErrorKind::EmptyChunk));
    EXPECT_FALSE(relay::is_retryable(UploadErrorKind::OversizedChunk));
    EXPECT_FALSE(relay::is_retryable(UploadErrorKind::PartLimitExceeded));
    EXPECT_FALSE(relay::is_retryable(UploadErrorKind::TimedOut));
    EXPECT_FALSE(relay::is_retryable(UploadErrorKind::Io));
}

TEST(UploadErrorTest, MapsKindsOntoUserFacingReasons) {
    EXPECT_EQ(relay::failure_reason(UploadError(UploadErrorKind::RejectedPlan, "")), FailureReason::SizeExceeded);
    EXPECT_EQ(relay::failure_reason(UploadError(UploadErrorKind::PartLimitExceeded, "")), FailureReason::SizeExceeded);
    EXPECT_EQ(relay::failure_reason(UploadError(UploadErrorKind::FileTooLarge, "")), FailureReason::SizeExceeded);
    EXPECT_EQ(relay::failure_reason(UploadError(UploadErrorKind::RateLimited, "")), FailureReason::RateLimited);
    EXPECT_EQ(relay::failure_reason(UploadError(UploadErrorKind::TransportFailure, "")), FailureReason::UploadFailed);
    EXPECT_EQ(relay::failure_reason(UploadError(UploadErrorKind::TimedOut, "")), FailureReason::UploadFailed);
    EXPECT_EQ(relay::failure_reason(UploadError(UploadErrorKind::Io, "")), FailureReason::UploadFailed);

    EXPECT_STREQ(relay::user_message(FailureReason::SizeExceeded), "File exceeds the maximum allowed size");
    EXPECT_STREQ(relay::user_message(FailureReason::UploadFailed), "Failed to send the file");
}

TEST(UploadErrorTest, DescribeIncludesPartAndRetryAfter) {
    UploadError error(UploadErrorKind::RateLimited, "FLOOD_WAIT");
    error.for_part(7);
    error.retry_after = std::chrono::seconds{30};

    const auto text = relay::describe(error);
    EXPECT_NE(text.find("RateLimited"), std::string::npos);
    EXPECT_NE(text.find("FLOOD_WAIT"), std::string::npos);
    EXPECT_NE(text.find("part 7"), std::string::npos);
    EXPECT_NE(text.find("retry_after=30s"), std::string::npos);
}

TEST(ResultTest, CarriesValueOrError) {
    relay::Result<int, UploadError> ok = relay::Ok(42);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 42);

    relay::Result<int, UploadError> err = relay::Err(UploadError(UploadErrorKind::Io, "gone"));
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.error().kind, UploadErrorKind::Io);
    EXPECT_EQ(err.value_or(-1), -1);

    relay::Result<void> unit = relay::Ok();
    EXPECT_TRUE(unit.is_ok());
}
