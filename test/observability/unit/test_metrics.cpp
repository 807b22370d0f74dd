/***
 * Name: test_metrics
 * Purpose: Validate durations, tree geometry, counters and gauges in both summaries.
 */
#include <gtest/gtest.h>
#include "observability/Metrics.h"

using namespace pyinfer::obs;

TEST(Metrics, CountersAndGaugesInJson) {
  Metrics m;
  m.start("Infer"); m.stop("Infer");
  m.setCounter("infer.queries", 3);
  m.incCounter("infer.values", 2);
  m.setGauge("ast.arena_nodes", 1234);
  const auto js = m.summaryJson();
  ASSERT_NE(js.find("\"durations_ms\""), std::string::npos);
  ASSERT_NE(js.find("\"infer\": "), std::string::npos);
  ASSERT_NE(js.find("\"counters\""), std::string::npos);
  ASSERT_NE(js.find("\"infer.queries\": 3"), std::string::npos);
  ASSERT_NE(js.find("\"infer.values\": 2"), std::string::npos);
  ASSERT_NE(js.find("\"gauges\""), std::string::npos);
  ASSERT_NE(js.find("\"ast.arena_nodes\": 1234"), std::string::npos);
}

TEST(Metrics, EmptySectionsOmittedFromJson) {
  Metrics m;
  const auto js = m.summaryJson();
  EXPECT_NE(js.find("\"durations_ms\""), std::string::npos);
  EXPECT_EQ(js.find("\"counters\""), std::string::npos);
  EXPECT_EQ(js.find("\"gauges\""), std::string::npos);
  EXPECT_EQ(js.find("\"ast\""), std::string::npos);
}

TEST(Metrics, TreeGeometryInBothSummaries) {
  Metrics m;
  EXPECT_FALSE(m.treeGeometry().has_value());
  m.setTreeGeometry({42, 7});
  ASSERT_TRUE(m.treeGeometry().has_value());
  EXPECT_EQ(m.treeGeometry()->nodes, 42u);
  EXPECT_NE(m.summaryText().find("  AST: nodes=42, max_depth=7"), std::string::npos);
  EXPECT_NE(m.summaryJson().find("\"ast\": { \"nodes\": 42, \"max_depth\": 7 }"), std::string::npos);
}

TEST(Metrics, TextSummaryMarksCountersAndGauges) {
  Metrics m;
  m.incCounter("infer.cycles");
  m.incCounter("infer.cycles");
  m.setGauge("ast.arena_nodes", 9);
  const auto text = m.summaryText();
  EXPECT_EQ(text.rfind("== Metrics ==\n", 0), 0u);
  EXPECT_NE(text.find("  infer.cycles = 2\n"), std::string::npos);
  EXPECT_NE(text.find("  ast.arena_nodes ~ 9\n"), std::string::npos);
}

TEST(Metrics, CounterLookupDefaultsToZero) {
  Metrics m;
  EXPECT_EQ(m.counter("never.set"), 0u);
  m.setCounter("x", 5);
  m.incCounter("x", 3);
  EXPECT_EQ(m.counter("x"), 8u);
}

TEST(Metrics, StopWithoutStartIsIgnored) {
  Metrics m;
  m.stop("Infer");
  EXPECT_EQ(m.durationUs("Infer"), 0u);
  EXPECT_EQ(m.summaryText().find("Infer:"), std::string::npos);
  m.start("Infer"); m.stop("Infer");
  EXPECT_NE(m.summaryText().find("  Infer: "), std::string::npos);
}
