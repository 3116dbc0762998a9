#include <gtest/gtest.h>
#include "error/Error.hpp"

#include <filesystem>

using namespace skiff;

TEST(ErrorTest, CodesRoundTripThroughStrings) {
    for (const auto code : {ErrorCode::NotFound, ErrorCode::InvalidState, ErrorCode::RemoteUnavailable,
                            ErrorCode::PermissionDenied, ErrorCode::QuotaExceeded, ErrorCode::LocalIO})
        EXPECT_EQ(to_error_code(to_string(code)), code);

    EXPECT_THROW(to_error_code("teapot"), std::invalid_argument);
}

TEST(ErrorTest, OnlyTransientFailuresAreRetryable) {
    EXPECT_TRUE(isRetryable(ErrorCode::RemoteUnavailable));
    EXPECT_TRUE(isRetryable(ErrorCode::LocalIO));
    EXPECT_FALSE(isRetryable(ErrorCode::PermissionDenied));
    EXPECT_FALSE(isRetryable(ErrorCode::QuotaExceeded));
    EXPECT_FALSE(isRetryable(ErrorCode::NotFound));
}

TEST(ErrorTest, SubclassesCarryTheirCode) {
    try {
        throw QuotaExceeded("drive full");
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::QuotaExceeded);
        EXPECT_STREQ(e.what(), "drive full");
    }
}

TEST(ErrorTest, ClassifyMapsForeignExceptions) {
    EXPECT_EQ(classify(PermissionDenied("x")), ErrorCode::PermissionDenied);
    EXPECT_EQ(classify(std::filesystem::filesystem_error("x", std::make_error_code(std::errc::io_error))),
              ErrorCode::LocalIO);
    EXPECT_EQ(classify(std::runtime_error("socket closed")), ErrorCode::RemoteUnavailable);
}

TEST(ErrorTest, PermissionAndQuotaMessagesWarnThatRetryAloneWillNotHelp) {
    const auto perm = describeFailure(ErrorCode::PermissionDenied, "403");
    const auto quota = describeFailure(ErrorCode::QuotaExceeded, "storageQuotaExceeded");
    const auto net = describeFailure(ErrorCode::RemoteUnavailable, "timeout");

    EXPECT_NE(perm.find("re-authenticate"), std::string::npos);
    EXPECT_NE(quota.find("free space"), std::string::npos);
    EXPECT_EQ(net.find("before retrying"), std::string::npos);
    EXPECT_NE(net.find("timeout"), std::string::npos);
}
