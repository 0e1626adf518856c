#include "core/StringUtils.h"

#include <gtest/gtest.h>

#include <chrono>

TEST(StringUtilsTest, SplitCallsign) {
  using V = std::vector<std::string>;
  EXPECT_EQ(StringUtils::splitCallsign("F/W1AW/P"), (V{"F", "W1AW", "P"}));
  EXPECT_EQ(StringUtils::splitCallsign("W1AW"), (V{"W1AW"}));
  EXPECT_EQ(StringUtils::splitCallsign("W1AW//P"), (V{"W1AW", "", "P"}));
  EXPECT_EQ(StringUtils::splitCallsign("/W1AW"), (V{"", "W1AW"}));
  EXPECT_EQ(StringUtils::splitCallsign(""), (V{""}));
}

TEST(StringUtilsTest, CharacterClasses) {
  EXPECT_TRUE(StringUtils::isUpperAlnum("W1AW"));
  EXPECT_FALSE(StringUtils::isUpperAlnum("w1aw"));
  EXPECT_FALSE(StringUtils::isUpperAlnum("W1-AW"));
  EXPECT_FALSE(StringUtils::isUpperAlnum(""));

  EXPECT_TRUE(StringUtils::isSingleDigit("7"));
  EXPECT_FALSE(StringUtils::isSingleDigit("77"));
  EXPECT_FALSE(StringUtils::isSingleDigit("A"));

  EXPECT_TRUE(StringUtils::isSingleLetter("A"));
  EXPECT_FALSE(StringUtils::isSingleLetter("a"));
  EXPECT_FALSE(StringUtils::isSingleLetter("AB"));
  EXPECT_FALSE(StringUtils::isSingleLetter("7"));
}

TEST(StringUtilsTest, ParseUtc) {
  std::chrono::system_clock::time_point t;
  ASSERT_TRUE(StringUtils::parseUtc("1970-01-02T00:00:00Z", t));
  EXPECT_EQ(std::chrono::system_clock::to_time_t(t), 86400);

  ASSERT_TRUE(StringUtils::parseUtc("1990-10-02T23:59:59Z", t));
  EXPECT_EQ(std::chrono::system_clock::to_time_t(t), 654911999);
}

TEST(StringUtilsTest, ParseUtcRejectsMalformed) {
  auto sentinel = std::chrono::system_clock::from_time_t(42);
  auto t = sentinel;
  for (const char *s : {"", "1990-10-02", "1990-10-02T23:59:59",
                        "1990-10-02 23:59:59Z", "1990-13-02T00:00:00Z",
                        "1990-10-02T24:00:00Z", "1990-10-02T23:59:59Zjunk"}) {
    EXPECT_FALSE(StringUtils::parseUtc(s, t)) << s;
  }
  EXPECT_EQ(t, sentinel);
}

TEST(StringUtilsTest, FormatUtc) {
  EXPECT_EQ(StringUtils::formatUtc(std::chrono::system_clock::from_time_t(0)),
            "1970-01-01T00:00:00Z");

  std::chrono::system_clock::time_point t;
  ASSERT_TRUE(StringUtils::parseUtc("2005-06-01T12:34:56Z", t));
  EXPECT_EQ(StringUtils::formatUtc(t), "2005-06-01T12:34:56Z");
}
