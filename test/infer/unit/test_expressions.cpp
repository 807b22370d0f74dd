/***
 * Name: test_expressions
 * Purpose: Destructuring, loops, subscripts, conditionals, operators and with targets.
 */
#include <gtest/gtest.h>
#include "ast/Builder.h"
#include "infer/Infer.h"

using namespace pyinfer;

namespace {

std::int64_t intOf(const infer::Value& value) {
  return std::get<std::int64_t>(*ast::constValueOf(*value.node));
}

std::vector<std::int64_t> intsOf(const std::vector<infer::Value>& values) {
  std::vector<std::int64_t> out;
  for (const auto& value : values) { out.push_back(intOf(value)); }
  return out;
}

class Expressions : public ::testing::Test {
 protected:
  ast::NodeArena arena;
  ast::Builder b{arena};
  ast::Block* body{nullptr};

  void SetUp() override { body = &b.block(b.module("m"), 1); }

  void ints(ast::Node& parent, const std::vector<std::int64_t>& values, int line) {
    for (const auto v : values) { b.constant(parent, ast::ConstValue{v}, line); }
  }

  ast::Name& use(const std::string& id, int line) { return b.name(b.exprStmt(*body, line), id, line); }

  ast::ExprStmt& expression(int line) { return b.exprStmt(*body, line); }

  std::vector<infer::Value> results(const ast::Node& node) { return infer::infer(node).collect(); }
};

} // namespace

// first, (second, third) = 1, [2, 3]
TEST_F(Expressions, NestedDestructuring) {
  auto& assign = b.assign(*body, 1);
  auto& targets = b.tuple(assign, 1);
  b.assignName(targets, "first", 1);
  auto& inner = b.tuple(targets, 1);
  b.assignName(inner, "second", 1);
  b.assignName(inner, "third", 1);
  auto& value = b.tuple(assign, 1);
  ints(value, {1}, 1);
  ints(b.list(value, 1), {2, 3}, 1);

  EXPECT_EQ(intsOf(results(use("first", 2))), (std::vector<std::int64_t>{1}));
  EXPECT_EQ(intsOf(results(use("third", 3))), (std::vector<std::int64_t>{3}));
}

// a, b = 5
// b
TEST_F(Expressions, DestructuringNonSequencesIsUnknown) {
  auto& assign = b.assign(*body, 1);
  auto& targets = b.tuple(assign, 1);
  b.assignName(targets, "a", 1);
  b.assignName(targets, "b", 1);
  ints(assign, {5}, 1);

  EXPECT_EQ(results(use("b", 2)), (std::vector<infer::Value>{infer::Value::unknown()}));
}

// for item in (1, 2):
//     pass
// item
TEST_F(Expressions, LoopTargetsTakeEveryElement) {
  auto& loop = b.forStmt(*body, 1);
  b.assignName(loop, "item", 1);
  ints(b.tuple(loop, 1), {1, 2}, 1);
  b.pass(b.block(loop, 2), 2);

  EXPECT_EQ(intsOf(results(use("item", 3))), (std::vector<std::int64_t>{1, 2}));
}

// (v for v in (4, 5))
TEST_F(Expressions, GeneratorExpressionTargets) {
  auto& gen = b.generator(expression(1), 1);
  auto& element = b.name(gen, "v", 1);
  b.assignName(gen, "v", 1);
  ints(b.tuple(gen, 1), {4, 5}, 1);

  EXPECT_EQ(intsOf(results(element)), (std::vector<std::int64_t>{4, 5}));
  EXPECT_EQ(results(gen), (std::vector<infer::Value>{infer::Value::of(gen)}));
}

// (10, 20, 30)[-1], (10, 20, 30)[7], {"k": 1, "k": 2}["k"]
TEST_F(Expressions, Subscripts) {
  auto& stmt = expression(1);
  auto& last = b.subscript(stmt, 1);
  ints(b.tuple(last, 1), {10, 20, 30}, 1);
  ints(last, {-1}, 1);
  auto& outOfRange = b.subscript(stmt, 1);
  ints(b.tuple(outOfRange, 1), {10, 20, 30}, 1);
  ints(outOfRange, {7}, 1);
  auto& keyed = b.subscript(stmt, 1);
  auto& dict = b.dict(keyed, 1);
  b.constant(dict, ast::ConstValue{std::string("k")}, 1);
  ints(dict, {1}, 1);
  b.constant(dict, ast::ConstValue{std::string("k")}, 1);
  ints(dict, {2}, 1);
  b.constant(keyed, ast::ConstValue{std::string("k")}, 1);

  EXPECT_EQ(intsOf(results(last)), (std::vector<std::int64_t>{30}));
  EXPECT_EQ(results(outOfRange), (std::vector<infer::Value>{infer::Value::unknown()}));
  EXPECT_EQ(intsOf(results(keyed)), (std::vector<std::int64_t>{2}));
}

// {1: 10, 'k': 20}[True], {1: 10}[1.0], {1: 10}['1'], (5, 6)[True]
TEST_F(Expressions, NumericKeysMatchAcrossBoolIntAndFloat) {
  auto& stmt = expression(1);
  const auto dictOf = [this](ast::Node& parent) -> ast::Node& {
    auto& dict = b.dict(parent, 1);
    ints(dict, {1, 10}, 1);
    return dict;
  };
  auto& byBool = b.subscript(stmt, 1);
  auto& mixed = b.dict(byBool, 1);
  ints(mixed, {1, 10}, 1);
  b.constant(mixed, ast::ConstValue{std::string("k")}, 1);
  ints(mixed, {20}, 1);
  b.constant(byBool, ast::ConstValue{true}, 1);
  auto& byFloat = b.subscript(stmt, 1);
  dictOf(byFloat);
  b.constant(byFloat, ast::ConstValue{1.0}, 1);
  auto& byString = b.subscript(stmt, 1);
  dictOf(byString);
  b.constant(byString, ast::ConstValue{std::string("1")}, 1);
  auto& tupleByBool = b.subscript(stmt, 1);
  ints(b.tuple(tupleByBool, 1), {5, 6}, 1);
  b.constant(tupleByBool, ast::ConstValue{true}, 1);

  EXPECT_EQ(intsOf(results(byBool)), (std::vector<std::int64_t>{10}));
  EXPECT_EQ(intsOf(results(byFloat)), (std::vector<std::int64_t>{10}));
  EXPECT_EQ(results(byString), (std::vector<infer::Value>{infer::Value::unknown()}));
  EXPECT_EQ(intsOf(results(tupleByBool)), (std::vector<std::int64_t>{6}));
}

// 1 if flag else 2
TEST_F(Expressions, ConditionalExpressionsYieldBothBranches) {
  auto& choice = b.ifExpr(expression(1), 1);
  ints(choice, {1}, 1);
  b.name(choice, "flag", 1);
  ints(choice, {2}, 1);

  EXPECT_EQ(intsOf(results(choice)), (std::vector<std::int64_t>{1, 2}));
}

TEST_F(Expressions, OperatorResults) {
  auto& stmt = expression(1);
  auto& compare = b.compare(stmt, {"<"}, 1);
  ints(compare, {1, 2}, 1);
  auto& negation = b.unary(stmt, "not", 1);
  ints(negation, {1}, 1);
  auto& minus = b.unary(stmt, "-", 1);
  ints(minus, {1}, 1);
  auto& sum = b.binary(stmt, "+", 1);
  ints(sum, {1, 2}, 1);

  const auto boolean = infer::Value::instance(*arena.builtinClass("bool"));
  EXPECT_EQ(results(compare), (std::vector<infer::Value>{boolean}));
  EXPECT_EQ(results(negation), (std::vector<infer::Value>{boolean}));
  EXPECT_EQ(results(minus), (std::vector<infer::Value>{infer::Value::unknown()}));
  EXPECT_EQ(results(sum), (std::vector<infer::Value>{infer::Value::unknown()}));
}

// class Session:
//     def __enter__(self):
//         return 8
// with Session() as s:
//     pass
// s
TEST_F(Expressions, WithTargetsTakeTheEnterResult) {
  auto& session = b.classDef(*body, "Session", 1);
  auto& enter = b.function(b.block(session, 2), "__enter__", {"self"}, 2);
  ints(b.returnStmt(b.block(enter, 3), 3), {8}, 3);
  auto& with = b.withStmt(*body, 4);
  b.name(b.call(with, 4), "Session", 4);
  b.assignName(with, "s", 4);
  b.pass(b.block(with, 5), 5);

  EXPECT_EQ(intsOf(results(use("s", 6))), (std::vector<std::int64_t>{8}));
}

TEST_F(Expressions, LiteralsAndConstantsInferToThemselves) {
  auto& stmt = expression(1);
  auto& none = b.load(stmt, "None", 1);
  auto& yes = b.load(stmt, "True", 1);
  auto& name = b.load(stmt, "Other", 1);

  EXPECT_EQ(none.kind, ast::NodeKind::NoneLiteral);
  EXPECT_EQ(yes.kind, ast::NodeKind::BoolLiteral);
  EXPECT_EQ(name.kind, ast::NodeKind::Name);
  EXPECT_EQ(results(none), (std::vector<infer::Value>{infer::Value::of(none)}));
  EXPECT_EQ(results(yes), (std::vector<infer::Value>{infer::Value::of(yes)}));
}
