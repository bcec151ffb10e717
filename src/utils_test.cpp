#include <string>

#include <gtest/gtest.h>

#include "utils.hpp"
#include "test_utils.hpp"

TEST(Utils, CanStripStringFromLeft)
{
    EXPECT_EQ(lstrip(""), "");
    EXPECT_EQ(lstrip(" "), "");
    EXPECT_EQ(lstrip("  "), "");
    EXPECT_EQ(lstrip(" a "), "a ");
    EXPECT_EQ(lstrip("  a "), "a ");
    EXPECT_EQ(lstrip("a "), "a ");
}

TEST(Utils, CanStripStringFromRight)
{
    EXPECT_EQ(rstrip(""), "");
    EXPECT_EQ(rstrip(" "), "");
    EXPECT_EQ(rstrip("  "), "");
    EXPECT_EQ(rstrip(" a "), " a");
    EXPECT_EQ(rstrip(" a\n"), " a");
    EXPECT_EQ(rstrip(" a"), " a");
}

TEST(Utils, CanStripStringFromBothSides)
{
    EXPECT_EQ(strip(""), "");
    EXPECT_EQ(strip(" "), "");
    EXPECT_EQ(strip("  "), "");
    EXPECT_EQ(strip(" a "), "a");
    EXPECT_EQ(strip(" a  "), "a");
    EXPECT_EQ(strip("a"), "a");
}

TEST(Utils, CanSplitKeepingEmptyFields)
{
    auto parts = split("$s0$e0801$$x", '$');
    ASSERT_EQ(parts.size(), 5u);
    EXPECT_EQ(parts[0], "");
    EXPECT_EQ(parts[1], "s0");
    EXPECT_EQ(parts[2], "e0801");
    EXPECT_EQ(parts[3], "");
    EXPECT_EQ(parts[4], "x");

    EXPECT_EQ(split("abc", '$').size(), 1u);
}

TEST(Utils, CanConvertStringToNumber)
{
    ASSIGN_OR_FAIL(int x, strToNumber<int>("123"));
    EXPECT_EQ(x, 123);
    ASSIGN_OR_FAIL(uint64_t y, strToNumber<uint64_t>("e0801", 16));
    EXPECT_EQ(y, 0xe0801u);
    EXPECT_FALSE(isExpected(strToNumber<int>("12a")));
    EXPECT_FALSE(isExpected(strToNumber<int>("")));
    EXPECT_FALSE(isExpected(strToNumber<uint8_t>("256")));
    EXPECT_FALSE(isExpected(strToNumber<unsigned>("-1")));
}
