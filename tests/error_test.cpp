#include <gtest/gtest.h>

#include "infra/error_handler/error.hpp"

using rfetch::infra::ErrorClass;
using rfetch::infra::ErrorCode;

TEST(ErrorTest, StatusCodesMapOntoTaxonomy)
{
    auto e500 = rfetch::infra::make_status_error(500, "Internal Server Error");
    EXPECT_EQ(e500.code, ErrorCode::ServerError);
    EXPECT_EQ(e500.classification(), ErrorClass::Transient);
    EXPECT_TRUE(e500.is_transient());
    EXPECT_FALSE(e500.is_fatal());
    EXPECT_EQ(e500.status_code, 500);

    auto e404 = rfetch::infra::make_status_error(404, "Not Found");
    EXPECT_EQ(e404.code, ErrorCode::ClientError);
    EXPECT_EQ(e404.classification(), ErrorClass::FatalClient);
    EXPECT_TRUE(e404.is_fatal());
    EXPECT_EQ(e404.message, "request failed with status 404 (Not Found)");

    auto e302 = rfetch::infra::make_status_error(302, "Found");
    EXPECT_EQ(e302.code, ErrorCode::UnexpectedStatus);
    EXPECT_EQ(e302.classification(), ErrorClass::FatalProtocol);
}

TEST(ErrorTest, IntegrityFailuresAreFatalProtocol)
{
    for (auto code : {ErrorCode::IdentityMismatch, ErrorCode::ChecksumMismatch}) {
        auto err = rfetch::infra::make_error(code, "boom");
        EXPECT_EQ(err.classification(), ErrorClass::FatalProtocol);
        EXPECT_FALSE(err.is_transient());
        EXPECT_TRUE(err.is_fatal());
    }
}

TEST(ErrorTest, AbortIsNotFatal)
{
    auto err = rfetch::infra::make_error(ErrorCode::Aborted, "aborted");
    EXPECT_EQ(err.classification(), ErrorClass::UserAbort);
    EXPECT_FALSE(err.is_fatal());
    EXPECT_EQ(rfetch::infra::make_error(ErrorCode::Interrupted, "").to_exit_code(), 130);
}

TEST(ErrorTest, CapturesSourceLocation)
{
    auto err = rfetch::infra::make_error(ErrorCode::NetworkFailure, "connect failed");
    EXPECT_NE(err.file.find("error_test.cpp"), std::string::npos);
    EXPECT_GT(err.line, 0);
    EXPECT_STREQ(err.what(), "connect failed");
    EXPECT_EQ(rfetch::infra::to_string(err.code), "NetworkFailure");
}

TEST(ErrorTest, LogAndReturnKeepsError)
{
    auto err = rfetch::infra::log_and_return(
        rfetch::infra::make_error(ErrorCode::ChecksumMismatch, "md5 mismatch"));
    EXPECT_EQ(err.code, ErrorCode::ChecksumMismatch);
    EXPECT_EQ(err.message, "md5 mismatch");
}
