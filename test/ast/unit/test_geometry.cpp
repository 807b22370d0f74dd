/***
 * Name: test_geometry
 * Purpose: Cover tree geometry summary.
 */
#include <gtest/gtest.h>
#include "ast/Builder.h"
#include "ast/GeometrySummary.h"

using namespace pyinfer;

TEST(Geometry, CountsNodesAndDepth) {
  ast::NodeArena arena;
  ast::Builder b(arena);
  auto& mod = b.module("m");
  auto& body = b.block(mod, 1);
  auto& assign = b.assign(body, 1);
  b.assignName(assign, "x", 1);
  auto& call = b.call(assign, 1);
  b.name(call, "f", 1);

  const auto geom = ast::ComputeGeometry(mod);
  EXPECT_EQ(geom.nodes, 6u);
  EXPECT_EQ(geom.maxDepth, 5u);
}

TEST(Geometry, NestedDepthIncreases) {
  ast::NodeArena arena;
  ast::Builder b(arena);
  auto& shallow = b.module("shallow");
  auto& sBody = b.block(shallow, 1);
  auto& sStmt = b.exprStmt(sBody, 1);
  b.name(sStmt, "x", 1);

  auto& deep = b.module("deep");
  auto& dBody = b.block(deep, 1);
  auto& dStmt = b.exprStmt(dBody, 1);
  auto& outer = b.binary(dStmt, "+", 1);
  b.name(outer, "x", 1);
  auto& inner = b.binary(outer, "*", 1);
  b.name(inner, "y", 1);
  b.name(inner, "z", 1);

  const auto gS = ast::ComputeGeometry(shallow);
  const auto gD = ast::ComputeGeometry(deep);
  EXPECT_GT(gD.nodes, gS.nodes);
  EXPECT_GT(gD.maxDepth, gS.maxDepth);
}
