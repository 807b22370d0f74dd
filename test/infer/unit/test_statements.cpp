/***
 * Name: test_statements
 * Purpose: Multi-candidate resolution of names with several bindings.
 */
#include <gtest/gtest.h>
#include "ast/Builder.h"
#include "infer/Infer.h"

using namespace pyinfer;

namespace {

std::int64_t intOf(const infer::Value& value) {
  return std::get<std::int64_t>(*ast::constValueOf(*value.node));
}

} // namespace

// x = 1
// x = 2
// x = 3
// x
TEST(Statements, EveryBindingContributesInOrder) {
  ast::NodeArena arena;
  ast::Builder b(arena);
  auto& body = b.block(b.module("m"), 1);
  for (int line = 1; line <= 3; ++line) {
    auto& assign = b.assign(body, line);
    b.assignName(assign, "x", line);
    b.constant(assign, ast::ConstValue{std::int64_t{line}}, line);
  }
  auto& use = b.exprStmt(body, 4);
  auto& x = b.name(use, "x", 4);

  const auto values = infer::infer(x).collect();
  ASSERT_EQ(values.size(), 3u);
  EXPECT_EQ(intOf(values[0]), 1);
  EXPECT_EQ(intOf(values[1]), 2);
  EXPECT_EQ(intOf(values[2]), 3);
}

// x = 1
// x += 1       (cannot be inferred: Unknown)
// x
TEST(Statements, UninferableBindingsBecomeUnknown) {
  ast::NodeArena arena;
  ast::Builder b(arena);
  auto& body = b.block(b.module("m"), 1);
  auto& first = b.assign(body, 1);
  b.assignName(first, "x", 1);
  b.constant(first, ast::ConstValue{std::int64_t{1}}, 1);
  auto& aug = b.augAssign(body, "+=", 2);
  b.assignName(aug, "x", 2);
  b.constant(aug, ast::ConstValue{std::int64_t{1}}, 2);
  auto& use = b.exprStmt(body, 3);
  auto& x = b.name(use, "x", 3);

  auto stream = infer::infer(x);
  const auto values = stream.collect();
  ASSERT_EQ(values.size(), 2u);
  EXPECT_EQ(intOf(values[0]), 1);
  EXPECT_TRUE(values[1].isUnknown());
  EXPECT_EQ(stream.outcome(), infer::Outcome::Values);
}

TEST(Statements, UndefinedNameFailsAsUnresolvable) {
  ast::NodeArena arena;
  ast::Builder b(arena);
  auto& body = b.block(b.module("m"), 1);
  auto& use = b.exprStmt(body, 1);
  auto& missing = b.name(use, "nowhere", 1);

  auto stream = infer::infer(missing);
  EXPECT_FALSE(stream.next().has_value());
  EXPECT_EQ(stream.outcome(), infer::Outcome::Failed);
  EXPECT_EQ(stream.failure().kind, infer::FailureKind::Unresolvable);
}

TEST(Statements, StatementsAreNotExpressions) {
  ast::NodeArena arena;
  ast::Builder b(arena);
  auto& body = b.block(b.module("m"), 1);
  auto& stmt = b.pass(body, 1);

  auto stream = infer::infer(stmt);
  EXPECT_FALSE(stream.next().has_value());
  EXPECT_EQ(stream.failure().kind, infer::FailureKind::InferenceFailed);
}
