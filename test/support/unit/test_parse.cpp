/***
 * Name: test_parse
 * Purpose: Settings text parsing: trimming, strict counts and truthy flags.
 */
#include <gtest/gtest.h>
#include "pyinfer/support/parse.h"

#include <cstddef>
#include <string>
#include <string_view>

using namespace pyinfer;

TEST(SupportParse, TrimSpaces) {
  std::string_view text = " \t 12 \n";
  support::TrimSpaces(text);
  EXPECT_EQ(text, "12");
  std::string_view blank = "   ";
  support::TrimSpaces(blank);
  EXPECT_TRUE(blank.empty());
}

TEST(SupportParse, CountAccepted) {
  std::size_t value = 99;
  EXPECT_TRUE(support::ParseCountStrict("0", value));
  EXPECT_EQ(value, 0u);
  EXPECT_TRUE(support::ParseCountStrict(" 4096 ", value));
  EXPECT_EQ(value, 4096u);
}

TEST(SupportParse, CountRejected) {
  std::size_t value = 7;
  std::string err;
  EXPECT_FALSE(support::ParseCountStrict("", value, &err));
  EXPECT_EQ(err, "empty count");
  EXPECT_FALSE(support::ParseCountStrict("+3", value, &err));
  EXPECT_EQ(err, "invalid character in count: '+'");
  EXPECT_FALSE(support::ParseCountStrict("1 2", value, &err));
  EXPECT_EQ(err, "invalid character in count: ' '");
  EXPECT_FALSE(support::ParseCountStrict("99999999999999999999999", value, &err));
  EXPECT_EQ(err, "count overflow");
  EXPECT_FALSE(support::ParseCountStrict("x", value));
  EXPECT_EQ(value, 7u);
}

TEST(SupportParse, Truthy) {
  EXPECT_TRUE(support::IsTruthy("1"));
  EXPECT_TRUE(support::IsTruthy("TRUE"));
  EXPECT_TRUE(support::IsTruthy(" Yes "));
  EXPECT_FALSE(support::IsTruthy(""));
  EXPECT_FALSE(support::IsTruthy("0"));
  EXPECT_FALSE(support::IsTruthy("y"));
  EXPECT_FALSE(support::IsTruthy("truthy"));
}
