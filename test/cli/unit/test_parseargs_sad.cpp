/***
 * Name: test_parseargs_sad
 * Purpose: Exercise sad-path CLI parsing for invalid/unknown cases.
 */
#include <gtest/gtest.h>
#include "cli/ParseArgs.h"

using namespace pyinfer::cli;

TEST(CLI_Sad, UnknownOption) {
  const char* argv[] = {"infer_dump", "--unknown"};
  Options o; EXPECT_FALSE(ParseArgs(2, const_cast<char**>(argv), o));
}

TEST(CLI_Sad, NameStartingWithDashWithoutEndOfOptions) {
  const char* argv[] = {"infer_dump", "-strange"};
  Options o; EXPECT_FALSE(ParseArgs(2, const_cast<char**>(argv), o));
}

TEST(CLI_Sad, NamesMustBeIdentifiers) {
  const char* argv1[] = {"infer_dump", "x", "a.b"};
  Options o1; EXPECT_FALSE(ParseArgs(3, const_cast<char**>(argv1), o1));

  const char* argv2[] = {"infer_dump", "9lives"};
  Options o2; EXPECT_FALSE(ParseArgs(2, const_cast<char**>(argv2), o2));

  const char* argv3[] = {"infer_dump", "-"};
  Options o3; EXPECT_FALSE(ParseArgs(2, const_cast<char**>(argv3), o3));
}

TEST(CLI_Sad, LimitMustBeACount) {
  const char* argv1[] = {"infer_dump", "--limit=abc"};
  Options o1; EXPECT_FALSE(ParseArgs(2, const_cast<char**>(argv1), o1));

  const char* argv2[] = {"infer_dump", "--limit=-1"};
  Options o2; EXPECT_FALSE(ParseArgs(2, const_cast<char**>(argv2), o2));

  const char* argv3[] = {"infer_dump", "--limit="};
  Options o3; EXPECT_FALSE(ParseArgs(2, const_cast<char**>(argv3), o3));
}

TEST(CLI_Sad, EmptyLogPathDisablesFileLogs) {
  const char* argv[] = {"infer_dump", "--log-path="};
  Options o; ASSERT_TRUE(ParseArgs(2, const_cast<char**>(argv), o));
  EXPECT_FALSE(o.analysis.logFiles);
  EXPECT_TRUE(o.analysis.logPath.empty());
}
