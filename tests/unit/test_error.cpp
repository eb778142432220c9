#include <gtest/gtest.h>

#include <system_error>

#include "sccplib/error.hpp"
#include "sccplib/expected.hpp"

using namespace sccplib;

class ErrorTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// Codes carry the library category
TEST_F(ErrorTest, CategoryAndValues) {
    std::error_code ec = SccpErrc::unexpected_eof;
    EXPECT_EQ(ec.category(), sccp_error_category());
    EXPECT_EQ(ec.value(), 1);
    EXPECT_STREQ(ec.category().name(), "sccplib");
    EXPECT_TRUE(static_cast<bool>(ec));

    std::error_code ok = SccpErrc::ok;
    EXPECT_FALSE(static_cast<bool>(ok));
}

TEST_F(ErrorTest, Messages) {
    EXPECT_EQ(make_error_code(SccpErrc::unexpected_eof).message(), "unexpected end of buffer");
    EXPECT_EQ(make_error_code(SccpErrc::unimplemented_type).message(), "message type not implemented");
    EXPECT_EQ(make_error_code(SccpErrc::unknown_type).message(), "unknown message type");
    EXPECT_EQ(make_error_code(SccpErrc::value_too_long).message(), "value exceeds 255 octets");
    EXPECT_EQ(make_error_code(SccpErrc::invalid_pointer).message(), "invalid pointer");
    EXPECT_EQ(make_error_code(SccpErrc::type_mismatch).message(), "message type mismatch");
    EXPECT_EQ(make_error_code(SccpErrc::invalid_parameter).message(), "invalid parameter");
}

// Truncation condition groups only the end-of-buffer code
TEST_F(ErrorTest, TruncatedBufferCondition) {
    EXPECT_TRUE(make_error_code(SccpErrc::unexpected_eof) == SccpCondition::truncated_buffer);
    EXPECT_FALSE(make_error_code(SccpErrc::value_too_long) == SccpCondition::truncated_buffer);
    EXPECT_FALSE(make_error_code(SccpErrc::invalid_pointer) == SccpCondition::truncated_buffer);
    EXPECT_FALSE(make_error_code(SccpErrc::unknown_type) == SccpCondition::truncated_buffer);
}

// Unsupported type covers both reserved and out-of-range tags
TEST_F(ErrorTest, UnsupportedTypeCondition) {
    EXPECT_TRUE(make_error_code(SccpErrc::unimplemented_type) == SccpCondition::unsupported_type);
    EXPECT_TRUE(make_error_code(SccpErrc::unknown_type) == SccpCondition::unsupported_type);
    EXPECT_FALSE(make_error_code(SccpErrc::unexpected_eof) == SccpCondition::unsupported_type);
    EXPECT_FALSE(make_error_code(SccpErrc::type_mismatch) == SccpCondition::unsupported_type);
}

// Codes from other categories never match library conditions
TEST_F(ErrorTest, ForeignCategory) {
    auto ec = std::make_error_code(std::errc::invalid_argument);
    EXPECT_FALSE(ec == SccpCondition::truncated_buffer);
    EXPECT_FALSE(ec == SccpCondition::unsupported_type);
    EXPECT_NE(ec, make_error_code(SccpErrc::invalid_parameter));
}

TEST_F(ErrorTest, ConditionMessages) {
    EXPECT_EQ(make_error_condition(SccpCondition::truncated_buffer).message(), "truncated buffer");
    EXPECT_EQ(make_error_condition(SccpCondition::unsupported_type).message(), "unsupported type");
    EXPECT_STREQ(sccp_condition_category().name(), "sccplib.condition");
}

TEST_F(ErrorTest, ResultHoldsValueOrError) {
    Result<int> good(42);
    ASSERT_TRUE(good.has_value());
    EXPECT_TRUE(static_cast<bool>(good));
    EXPECT_EQ(good.value(), 42);

    Result<int> bad(make_error_code(SccpErrc::invalid_pointer));
    EXPECT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error(), make_error_code(SccpErrc::invalid_pointer));
}
