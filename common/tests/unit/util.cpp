#include <faasbox/common/util.hpp>

#include <regex>

#include <gtest/gtest.h>

using namespace faasbox::common::util;

TEST(Util, ParseDuration)
{
  EXPECT_EQ(parse_duration("120s"), std::chrono::seconds{120});
  EXPECT_EQ(parse_duration("2m"), std::chrono::minutes{2});
  EXPECT_EQ(parse_duration("500ms"), std::chrono::milliseconds{500});
  EXPECT_EQ(parse_duration("1h"), std::chrono::hours{1});
  // Bare numbers are seconds.
  EXPECT_EQ(parse_duration("30"), std::chrono::seconds{30});
}

TEST(Util, ParseInvalidDuration)
{
  EXPECT_FALSE(parse_duration("").has_value());
  EXPECT_FALSE(parse_duration("s").has_value());
  EXPECT_FALSE(parse_duration("-5s").has_value());
  EXPECT_FALSE(parse_duration("10 s").has_value());
  EXPECT_FALSE(parse_duration("10d").has_value());
  EXPECT_FALSE(parse_duration("1.5s").has_value());
}

TEST(Util, ParseDurationLimits)
{
  EXPECT_EQ(parse_duration("600h"), std::chrono::hours{600});
  EXPECT_EQ(parse_duration("87600h"), MAX_DURATION);
  EXPECT_FALSE(parse_duration("87601h").has_value());
  EXPECT_FALSE(parse_duration("9999999999999999h").has_value());
  EXPECT_FALSE(parse_duration("9999999999999999m").has_value());
  EXPECT_FALSE(parse_duration("99999999999999999999999s").has_value());
}

TEST(Util, FormatDuration)
{
  EXPECT_EQ(format_duration(std::chrono::seconds{30}), "30s");
  EXPECT_EQ(format_duration(std::chrono::milliseconds{1500}), "1500ms");
}

TEST(Util, Timestamps)
{
  long before = unix_timestamp();
  EXPECT_GT(before, 1600000000);

  std::regex rfc3339{R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)"};
  EXPECT_TRUE(std::regex_match(rfc3339_now(), rfc3339));
}
