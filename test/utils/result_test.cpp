// test/utils/result_test.cpp
#include <gtest/gtest.h>

#include "types/error_codes/result.hpp"

namespace subghz {
namespace test {

TEST(ResultTest, DefaultIsSuccess) {
    Result result;
    EXPECT_TRUE(result.IsSuccess());
    EXPECT_TRUE(result);
    EXPECT_EQ(result.getErrorCode(), SubGhzErrorCode::kSuccess);
    EXPECT_EQ(result.GetErrorMessage(), "Success");
    EXPECT_EQ(result.GetErrorCount(), 0u);
}

TEST(ResultTest, SuccessCodeDoesNotRecordAnError) {
    Result result(SubGhzErrorCode::kSuccess);
    EXPECT_TRUE(result.IsSuccess());
    EXPECT_EQ(result.GetErrorCount(), 0u);
}

TEST(ResultTest, ErrorCarriesCategoryMessage) {
    Result result = Result::Error(SubGhzErrorCode::kBusTimeout);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.getErrorCode(), SubGhzErrorCode::kBusTimeout);
    EXPECT_EQ(result.GetErrorMessage(), "Busy signal did not clear in time");
}

TEST(ResultTest, WrapKeepsRootCause) {
    Result cause = Result::Error(SubGhzErrorCode::kIllegalTransition);
    Result wrapped = Result::Wrap("StartTransmit", cause);

    EXPECT_EQ(wrapped.getErrorCode(), SubGhzErrorCode::kRadioError);
    EXPECT_EQ(wrapped.GetRootCause(), SubGhzErrorCode::kIllegalTransition);
    EXPECT_TRUE(wrapped.HasError(SubGhzErrorCode::kIllegalTransition));
    EXPECT_EQ(wrapped.GetErrorCount(), 2u);
    EXPECT_NE(wrapped.GetErrorMessage().find("StartTransmit failed"),
              std::string::npos);
}

TEST(ResultTest, WrapOfSuccessIsSuccess) {
    Result wrapped = Result::Wrap("Standby", Result::Success());
    EXPECT_TRUE(wrapped);
    EXPECT_EQ(wrapped.GetErrorCount(), 0u);
}

TEST(ResultTest, MergeErrorsAppends) {
    Result result = Result::Error(SubGhzErrorCode::kTimeout);
    result.MergeErrors(Result::Success());
    EXPECT_EQ(result.GetErrorCount(), 1u);

    result.MergeErrors(Result::Error(SubGhzErrorCode::kTransportError));
    std::vector<SubGhzErrorCode> codes = result.GetAllErrorCodes();
    ASSERT_EQ(codes.size(), 2u);
    EXPECT_EQ(codes[0], SubGhzErrorCode::kTimeout);
    EXPECT_EQ(codes[1], SubGhzErrorCode::kTransportError);
    EXPECT_EQ(result.GetRootCause(), SubGhzErrorCode::kTransportError);
}

TEST(ResultTest, InvalidArgumentKeepsMessage) {
    Result result = Result::InvalidArgument("Frequency out of range");
    EXPECT_EQ(result.getErrorCode(), SubGhzErrorCode::kInvalidParameter);
    EXPECT_EQ(result.GetErrorMessage(), "Frequency out of range");
}

TEST(ResultTest, ConvertsToStdErrorCode) {
    std::error_code code =
        Result::Error(SubGhzErrorCode::kBufferOverflow).AsErrorCode();
    EXPECT_EQ(code.value(),
              static_cast<int>(SubGhzErrorCode::kBufferOverflow));
    EXPECT_STREQ(code.category().name(), "subghz_error");
    EXPECT_EQ(code.message(), "Buffer overflow detected");
}

}  // namespace test
}  // namespace subghz
