/***
 * Name: test_calls
 * Purpose: Call results and parameter inference from call sites.
 */
#include <gtest/gtest.h>
#include "ast/Builder.h"
#include "infer/Infer.h"
#include "pyinfer/exceptions/inference_error.h"

using namespace pyinfer;

namespace {

std::int64_t intOf(const infer::Value& value) {
  return std::get<std::int64_t>(*ast::constValueOf(*value.node));
}

class Calls : public ::testing::Test {
 protected:
  ast::NodeArena arena;
  ast::Builder b{arena};
  ast::Block* body{nullptr};

  void SetUp() override { body = &b.block(b.module("calls"), 1); }

  // `<callee>(<ints>..., <keyword>=<value>)` as an expression statement.
  ast::Call& callOf(const std::string& callee, const std::vector<std::int64_t>& args, int line,
                    const std::string& keyword = "", std::int64_t keywordValue = 0) {
    auto& stmt = b.exprStmt(*body, line);
    auto& call = b.call(stmt, line);
    b.name(call, callee, line);
    for (const auto arg : args) { b.constant(call, ast::ConstValue{arg}, line); }
    if (!keyword.empty()) {
      b.keyword(call, keyword);
      b.constant(call, ast::ConstValue{keywordValue}, line);
    }
    return call;
  }

  std::vector<infer::Value> results(const ast::Node& node) { return infer::infer(node).collect(); }
};

} // namespace

// class Point:
//     def me(self):
//         return self
// Point().me()
TEST_F(Calls, ClassCallsGiveInstancesAndMethodsSeeTheirReceiver) {
  auto& point = b.classDef(*body, "Point", 1);
  auto& me = b.function(b.block(point, 2), "me", {"self"}, 2);
  auto& ret = b.returnStmt(b.block(me, 3), 3);
  b.name(ret, "self", 3);

  auto& stmt = b.exprStmt(*body, 4);
  auto& outer = b.call(stmt, 4);
  auto& attr = b.attribute(outer, "me", 4);
  auto& create = b.call(attr, 4);
  b.name(create, "Point", 4);

  EXPECT_EQ(results(create), (std::vector<infer::Value>{infer::Value::instance(point)}));
  EXPECT_EQ(results(attr), (std::vector<infer::Value>{infer::Value::method(me, point)}));
  EXPECT_EQ(results(outer), (std::vector<infer::Value>{infer::Value::instance(point)}));
}

// def f(a, b=2):
//     return b
TEST_F(Calls, PositionalKeywordAndDefaultArguments) {
  auto& f = b.function(*body, "f", {"a", "b"}, 1);
  b.constant(f, ast::ConstValue{std::int64_t{2}}, 1);
  b.markDefault(f);
  auto& ret = b.returnStmt(b.block(f, 2), 2);
  b.name(ret, "b", 2);

  EXPECT_EQ(intOf(results(callOf("f", {1}, 3)).front()), 2);
  EXPECT_EQ(intOf(results(callOf("f", {1, 3}, 4)).front()), 3);
  EXPECT_EQ(intOf(results(callOf("f", {1}, 5, "b", 4)).front()), 4);
}

// def f(a):
//     return a
// f()
TEST_F(Calls, MissingArgumentIsUnknown) {
  auto& f = b.function(*body, "f", {"a"}, 1);
  auto& ret = b.returnStmt(b.block(f, 2), 2);
  b.name(ret, "a", 2);

  const auto values = results(callOf("f", {}, 3));
  EXPECT_EQ(values, (std::vector<infer::Value>{infer::Value::unknown()}));
}

// def inner(y):
//     return y
// def outer(x):
//     return inner(x)
// outer(7)
TEST_F(Calls, ArgumentsResolveWhereTheCallWasWritten) {
  auto& inner = b.function(*body, "inner", {"y"}, 1);
  auto& innerRet = b.returnStmt(b.block(inner, 2), 2);
  b.name(innerRet, "y", 2);
  auto& outer = b.function(*body, "outer", {"x"}, 3);
  auto& outerRet = b.returnStmt(b.block(outer, 4), 4);
  auto& forward = b.call(outerRet, 4);
  b.name(forward, "inner", 4);
  b.name(forward, "x", 4);

  EXPECT_EQ(intOf(results(callOf("outer", {7}, 5)).front()), 7);
}

// def nothing():
//     pass
TEST_F(Calls, FunctionsWithoutReturnGiveNone) {
  auto& fn = b.function(*body, "nothing", {}, 1);
  b.pass(b.block(fn, 2), 2);

  const auto values = results(callOf("nothing", {}, 3));
  ASSERT_EQ(values.size(), 1u);
  EXPECT_TRUE(values.front().isNode(ast::NodeKind::NoneLiteral));
}

// def count():
//     yield 1
TEST_F(Calls, GeneratorFunctionsGiveGenerators) {
  auto& count = b.function(*body, "count", {}, 1);
  auto& stmt = b.exprStmt(b.block(count, 2), 2);
  auto& yield = b.yield(stmt, 2);
  b.constant(yield, ast::ConstValue{std::int64_t{1}}, 2);

  const auto values = results(callOf("count", {}, 3));
  ASSERT_EQ(values.size(), 1u);
  EXPECT_EQ(values.front(), infer::Value::generator(count));
  EXPECT_EQ(infer::describe(values.front()), "Generator of calls.count");
  EXPECT_TRUE(infer::isCallable(values.front()));

  const infer::InferenceContext ctx(&count);
  EXPECT_THROW(infer::inferCallResult(values.front(), nullptr, ctx), exceptions::InferenceError);
}

// square = lambda v: v
// square(5)
TEST_F(Calls, LambdasBindTheirParameters) {
  auto& assign = b.assign(*body, 1);
  b.assignName(assign, "square", 1);
  auto& lambda = b.lambda(assign, {"v"}, 1);
  b.name(lambda, "v", 1);

  EXPECT_EQ(intOf(results(callOf("square", {5}, 2)).front()), 5);
}

// class Tool:
//     @classmethod
//     def make(cls):
//         return cls
//     @staticmethod
//     def fixed(n):
//         return n
TEST_F(Calls, ClassAndStaticMethods) {
  auto& tool = b.classDef(*body, "Tool", 1);
  auto& toolBody = b.block(tool, 2);
  auto& make = b.function(toolBody, "make", {"cls"}, 3);
  b.decorator(make, "classmethod", 2);
  auto& makeRet = b.returnStmt(b.block(make, 4), 4);
  b.name(makeRet, "cls", 4);
  auto& fixed = b.function(toolBody, "fixed", {"n"}, 6);
  b.decorator(fixed, "staticmethod", 5);
  auto& fixedRet = b.returnStmt(b.block(fixed, 7), 7);
  b.name(fixedRet, "n", 7);
  EXPECT_EQ(make.type(), ast::FunctionType::ClassMethod);
  EXPECT_EQ(fixed.type(), ast::FunctionType::StaticMethod);

  auto& first = b.exprStmt(*body, 8);
  auto& makeCall = b.call(first, 8);
  auto& makeAttr = b.attribute(makeCall, "make", 8);
  b.name(makeAttr, "Tool", 8);
  EXPECT_EQ(results(makeCall), (std::vector<infer::Value>{infer::Value::of(tool)}));

  auto& second = b.exprStmt(*body, 9);
  auto& fixedCall = b.call(second, 9);
  auto& fixedAttr = b.attribute(fixedCall, "fixed", 9);
  b.name(fixedAttr, "Tool", 9);
  b.constant(fixedCall, ast::ConstValue{std::int64_t{6}}, 9);
  EXPECT_EQ(intOf(results(fixedCall).front()), 6);
}

TEST_F(Calls, NonCallablesAreInferenceErrors) {
  auto& stmt = b.exprStmt(*body, 1);
  auto& number = b.constant(stmt, ast::ConstValue{std::int64_t{1}}, 1);
  const infer::InferenceContext ctx(&number);
  EXPECT_FALSE(infer::isCallable(infer::Value::of(number)));
  EXPECT_THROW(infer::inferCallResult(infer::Value::of(number), nullptr, ctx), exceptions::InferenceError);
  EXPECT_TRUE(infer::isCallable(infer::Value::unknown()));
}
