/***
 * Name: test_options
 * Purpose: Options loaded from PYINFER_* variables through an injected lookup.
 */
#include <gtest/gtest.h>
#include "config/Options.h"
#include "pyinfer/exceptions/config_error.h"

#include <map>
#include <string>

using namespace pyinfer;

namespace {

config::Options load(const std::map<std::string, std::string>& env) {
  return config::fromEnvironment([&env](const std::string& name) -> const char* {
    const auto iter = env.find(name);
    return iter == env.end() ? nullptr : iter->second.c_str();
  });
}

} // namespace

TEST(ConfigOptions, DefaultsWhenUnset) {
  const auto o = load({});
  EXPECT_FALSE(o.trace);
  EXPECT_FALSE(o.metrics);
  EXPECT_FALSE(o.metricsJson);
  EXPECT_FALSE(o.logFiles);
  EXPECT_TRUE(o.logPath.empty());
  EXPECT_EQ(o.resultLimit, 0u);
}

TEST(ConfigOptions, TruthyFlags) {
  const auto o = load({{"PYINFER_TRACE", "1"}, {"PYINFER_METRICS", "True"}, {"PYINFER_METRICS_JSON", " yes "}});
  EXPECT_TRUE(o.trace);
  EXPECT_TRUE(o.metrics);
  EXPECT_TRUE(o.metricsJson);
}

TEST(ConfigOptions, OtherValuesAreFalse) {
  const auto o = load({{"PYINFER_TRACE", "0"}, {"PYINFER_METRICS", "on"}, {"PYINFER_METRICS_JSON", ""}});
  EXPECT_FALSE(o.trace);
  EXPECT_FALSE(o.metrics);
  EXPECT_FALSE(o.metricsJson);
}

TEST(ConfigOptions, LogPathEnablesFileLogs) {
  const auto o = load({{"PYINFER_LOG_PATH", "/tmp/pyinfer-logs"}});
  EXPECT_TRUE(o.logFiles);
  EXPECT_EQ(o.logPath, "/tmp/pyinfer-logs");
  EXPECT_FALSE(load({{"PYINFER_LOG_PATH", ""}}).logFiles);
}

TEST(ConfigOptions, ResultLimit) {
  EXPECT_EQ(load({{"PYINFER_RESULT_LIMIT", "25"}}).resultLimit, 25u);
  EXPECT_EQ(load({{"PYINFER_RESULT_LIMIT", " 3 "}}).resultLimit, 3u);
}

TEST(ConfigOptions, BadResultLimitThrowsConfigError) {
  try {
    (void)load({{"PYINFER_RESULT_LIMIT", "-2"}});
    FAIL() << "expected ConfigError";
  } catch (const exceptions::ConfigError& e) {
    const std::string what = e.what();
    EXPECT_NE(what.find("PYINFER_RESULT_LIMIT"), std::string::npos);
    EXPECT_NE(what.find("invalid character in count: '-'"), std::string::npos);
    EXPECT_NE(what.find("'-2'"), std::string::npos);
  }
  EXPECT_THROW((void)load({{"PYINFER_RESULT_LIMIT", ""}}), exceptions::ConfigError);
}

TEST(ConfigOptions, ParseResultLimitNamesSource) {
  EXPECT_EQ(config::parseResultLimit("0", "--limit"), 0u);
  try {
    (void)config::parseResultLimit("many", "--limit");
    FAIL() << "expected ConfigError";
  } catch (const exceptions::ConfigError& e) {
    EXPECT_EQ(std::string(e.what()).rfind("--limit: ", 0), 0u);
  }
}
