#include "gtest/gtest.h"
#include "ojudge/common/defer.hpp"
#include "ojudge/common/io_utils.hpp"
#include "ojudge/common/status.hpp"
#include "ojudge/common/utils.hpp"

using namespace std;
using namespace ojudge;

TEST(UtilsTest, ExpandCommandTest) {
    auto command = expand_command({"g++", "-o", "{artifact}", "{source}", "-I{dir}/include"},
                                  {{"artifact", "/w/main"}, {"source", "/w/my main.cpp"}, {"dir", "/w"}});
    vector<string> expected{"g++", "-o", "/w/main", "/w/my main.cpp", "-I/w/include"};
    EXPECT_EQ(command, expected);
}

TEST(UtilsTest, ExpandCommandUnknownPlaceholderTest) {
    EXPECT_THROW(expand_command({"{compiler}"}, {{"source", "a"}}), invalid_argument);
}

TEST(UtilsTest, TruncateTextTest) {
    EXPECT_EQ(truncate_text("hello", 10), "hello");
    EXPECT_EQ(truncate_text("hello", 3), "hel");
    // "你" 占三个字节，不能从中间截断
    EXPECT_EQ(truncate_text("a你", 2), "a");
    EXPECT_EQ(truncate_text("a你", 4), "a你");
}

TEST(UtilsTest, RandomUuidTest) {
    string a = random_uuid(), b = random_uuid();
    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, b);
    EXPECT_EQ(a.find('-'), string::npos);
}

TEST(UtilsTest, AssertSafePathTest) {
    EXPECT_EQ(assert_safe_path("1001"), "1001");
    EXPECT_THROW(assert_safe_path(""), invalid_argument);
    EXPECT_THROW(assert_safe_path("."), invalid_argument);
    EXPECT_THROW(assert_safe_path(".."), invalid_argument);
    EXPECT_THROW(assert_safe_path("../etc"), invalid_argument);
    EXPECT_THROW(assert_safe_path(string("a\0b", 3)), invalid_argument);
}

TEST(UtilsTest, DeferTest) {
    int count = 0;
    {
        defer {
            ++count;
        };
        EXPECT_EQ(count, 0);
    }
    EXPECT_EQ(count, 1);

    try {
        defer {
            ++count;
        };
        throw runtime_error("failure");
    } catch (runtime_error &) {
    }
    EXPECT_EQ(count, 2);
}

TEST(UtilsTest, StatusNameTest) {
    EXPECT_STREQ(get_display_message(status::ACCEPTED), "Accepted");
    EXPECT_STREQ(get_display_message(status::OUTPUT_LIMIT_EXCEEDED), "Output Limit Exceeded");
    EXPECT_STREQ(get_display_message(status::SYSTEM_ERROR), "System Error");
}
