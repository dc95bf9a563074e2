// =============================================================================
// Tapdeck - Result Type Unit Tests
// =============================================================================

#include <gtest/gtest.h>
#include "result.hpp"

#include <vector>

using namespace tapdeck;

// =============================================================================
// Test: Basic Ok/Err Creation
// =============================================================================

TEST(ResultTest, OkCreation) {
    Result<int, Error> result = Ok(42);

    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrCreation) {
    Result<int, Error> result = Err<int>("Something went wrong", kErrParse);

    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(result.error().message, "Something went wrong");
    EXPECT_EQ(result.error().code, kErrParse);
}

TEST(ResultTest, BoolConversion) {
    Result<int, Error> ok = Ok(1);
    Result<int, Error> err = Err<int>("error");

    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
}

// =============================================================================
// Test: Value Access
// =============================================================================

TEST(ResultTest, ValueAccess) {
    Result<std::string, Error> result = Ok(std::string("hello"));
    EXPECT_EQ(result.value(), "hello");
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int, Error> result = Err<int>("boom");
    EXPECT_THROW(result.value(), std::runtime_error);
}

TEST(ResultTest, ErrorOnOkThrows) {
    Result<int, Error> result = Ok(5);
    EXPECT_THROW(result.error(), std::runtime_error);
}

TEST(ResultTest, ValueOr) {
    Result<int, Error> ok = Ok(10);
    Result<int, Error> err = Err<int>("nope");

    EXPECT_EQ(ok.value_or(0), 10);
    EXPECT_EQ(err.value_or(0), 0);
}

TEST(ResultTest, OptionalErr) {
    Result<int, Error> ok = Ok(10);
    Result<int, Error> err = Err<int>("missing", kErrNotFound);

    EXPECT_FALSE(ok.err().has_value());
    ASSERT_TRUE(err.err().has_value());
    EXPECT_EQ(err.err()->code, kErrNotFound);
}

TEST(ResultTest, MoveValueOut) {
    Result<std::vector<int>, Error> result = Ok(std::vector<int>{1, 2, 3});
    std::vector<int> v = std::move(result).value();
    EXPECT_EQ(v.size(), 3u);
}

// =============================================================================
// Test: Result<void>
// =============================================================================

TEST(ResultTest, VoidOk) {
    Result<void, Error> result = Ok();
    EXPECT_TRUE(result.is_ok());
    EXPECT_TRUE(static_cast<bool>(result));
}

TEST(ResultTest, VoidErr) {
    Result<void, Error> result = Err<void>("validation failed", kErrValidation);
    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(result.error().message, "validation failed");
    EXPECT_EQ(result.error().code, kErrValidation);
}

// =============================================================================
// Test: Error equality
// =============================================================================

TEST(ResultTest, ErrorEquality) {
    EXPECT_EQ(Error("x", 1), Error("x", 1));
    EXPECT_FALSE(Error("x", 1) == Error("x", 2));
    EXPECT_FALSE(Error("x", 1) == Error("y", 1));
}

// =============================================================================
// Test: Function returning Result
// =============================================================================

namespace {

Result<int> parsePort(const std::string& s) {
    if (s.empty()) return Err<int>("empty port", kErrParse);
    for (char c : s) {
        if (c < '0' || c > '9') return Err<int>("not a number: " + s, kErrParse);
    }
    int port = std::stoi(s);
    if (port > 65535) return Err<int>("out of range: " + s, kErrValidation);
    return Ok(port);
}

} // namespace

TEST(ResultTest, FunctionReturningResult) {
    EXPECT_EQ(parsePort("5037").value(), 5037);
    EXPECT_EQ(parsePort("").error().code, kErrParse);
    EXPECT_EQ(parsePort("50a").error().code, kErrParse);
    EXPECT_EQ(parsePort("70000").error().code, kErrValidation);
}
