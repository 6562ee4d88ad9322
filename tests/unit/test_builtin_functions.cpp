#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <regex>
#include <set>
#include <string>

#include "src/variables/builtins/builtin_functions.hpp"

using namespace variables::builtins;
using namespace std::chrono;

namespace {
    // 2015-10-21T07:28:00.123Z
    system_clock::time_point fixed_time() { return system_clock::from_time_t(1445412480) + milliseconds{123}; }
}  // namespace

TEST(BuiltinFunctionsTest, SigilMarksBuiltins) {
    EXPECT_TRUE(is_builtin("$guid"));
    EXPECT_FALSE(is_builtin("guid"));
    EXPECT_FALSE(is_builtin(""));
}

TEST(BuiltinFunctionsTest, GuidIsVersion4) {
    const std::regex v4("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        const std::string guid = generate_guid();
        EXPECT_TRUE(std::regex_match(guid, v4)) << guid;
        seen.insert(guid);
    }
    EXPECT_EQ(seen.size(), 50U);
}

TEST(BuiltinFunctionsTest, RandomIntStaysInHalfOpenRange) {
    for (int i = 0; i < 200; ++i) {
        const int value = std::stoi(random_int("1, 4"));
        EXPECT_GE(value, 1);
        EXPECT_LT(value, 4);
    }
}

TEST(BuiltinFunctionsTest, RandomIntAcceptsWhitespaceSeparatedBounds) {
    const int value = std::stoi(random_int("10 11"));
    EXPECT_EQ(value, 10);
}

TEST(BuiltinFunctionsTest, RandomIntWithEmptyRangeReturnsMin) {
    EXPECT_EQ(random_int("5, 5"), "5");
    EXPECT_EQ(random_int("9, 2"), "9");
}

TEST(BuiltinFunctionsTest, RandomIntWithoutBoundsIsNonNegative) { EXPECT_GE(std::stoll(random_int("")), 0); }

TEST(BuiltinFunctionsTest, DatetimeFormats) {
    EXPECT_EQ(format_datetime(fixed_time(), ""), "2015-10-21T07:28:00.123Z");
    EXPECT_EQ(format_datetime(fixed_time(), "iso8601"), "2015-10-21T07:28:00.123Z");
    EXPECT_EQ(format_datetime(fixed_time(), "RFC1123"), "Wed, 21 Oct 2015 07:28:00 GMT");
    EXPECT_EQ(format_datetime(fixed_time(), "'%Y-%m-%d'"), "2015-10-21");
}

TEST(BuiltinFunctionsTest, TimestampIsUnixSeconds) { EXPECT_EQ(unix_timestamp(fixed_time()), "1445412480"); }

TEST(BuiltinFunctionsTest, ProcessEnvReadsVariable) {
    ::setenv("COURIER_TEST_VALUE", "from-env", 1);
    EXPECT_EQ(process_env("COURIER_TEST_VALUE"), "from-env");
    EXPECT_EQ(process_env("COURIER_TEST_SURELY_UNSET_VALUE"), "");
    EXPECT_EQ(process_env(""), "");
}

TEST(BuiltinFunctionsTest, EvaluateDispatchesByName) {
    ::setenv("COURIER_TEST_VALUE", "from-env", 1);

    EXPECT_EQ(evaluate("$processEnv COURIER_TEST_VALUE"), "from-env");
    EXPECT_EQ(evaluate("$randomInt 3 4"), "3");
    EXPECT_EQ(evaluate("$guid")->size(), 36U);
    EXPECT_EQ(evaluate("$dotenv SECRET"), "");
    EXPECT_FALSE(evaluate("$guidish").has_value());
    EXPECT_FALSE(evaluate("$unknown").has_value());
}
