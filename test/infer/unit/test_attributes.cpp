/***
 * Name: test_attributes
 * Purpose: Attribute access on modules, classes, instances and unknown owners.
 */
#include <gtest/gtest.h>
#include "ast/Builder.h"
#include "infer/Infer.h"
#include "pyinfer/exceptions/not_found_error.h"

using namespace pyinfer;

namespace {

std::int64_t intOf(const infer::Value& value) {
  return std::get<std::int64_t>(*ast::constValueOf(*value.node));
}

class Attributes : public ::testing::Test {
 protected:
  ast::NodeArena arena;
  ast::Builder b{arena};
  ast::Block* body{nullptr};

  // lib.py:
  //     limit = 5
  //     class Config:
  //         depth = 3
  void SetUp() override {
    auto& lib = b.block(b.module("lib"), 1);
    auto& limit = b.assign(lib, 1);
    b.assignName(limit, "limit", 1);
    b.constant(limit, ast::ConstValue{std::int64_t{5}}, 1);
    auto& config = b.classDef(lib, "Config", 2);
    auto& depth = b.assign(b.block(config, 3), 3);
    b.assignName(depth, "depth", 3);
    b.constant(depth, ast::ConstValue{std::int64_t{3}}, 3);

    body = &b.block(b.module("main"), 1);
    b.import(*body, {{"lib", ""}}, 1);
  }

  // `<owner>.<attr>` as an expression statement.
  ast::Attribute& access(const std::string& owner, const std::string& attr, int line) {
    auto& stmt = b.exprStmt(*body, line);
    auto& node = b.attribute(stmt, attr, line);
    b.name(node, owner, line);
    return node;
  }
};

} // namespace

TEST_F(Attributes, ModuleAttributes) {
  const auto values = infer::infer(access("lib", "limit", 2)).collect();
  ASSERT_EQ(values.size(), 1u);
  EXPECT_EQ(intOf(values.front()), 5);
}

// lib.Config.depth
TEST_F(Attributes, ChainedAttributesThroughClasses) {
  auto& stmt = b.exprStmt(*body, 2);
  auto& depth = b.attribute(stmt, "depth", 2);
  auto& config = b.attribute(depth, "Config", 2);
  b.name(config, "lib", 2);

  const auto values = infer::infer(depth).collect();
  ASSERT_EQ(values.size(), 1u);
  EXPECT_EQ(intOf(values.front()), 3);
}

TEST_F(Attributes, MissingModuleAttributeYieldsNothing) {
  auto stream = infer::infer(access("lib", "absent", 2));
  EXPECT_FALSE(stream.next().has_value());
  EXPECT_EQ(stream.outcome(), infer::Outcome::Empty);

  const auto& lib = *arena.findModule("lib");
  EXPECT_THROW(lib.getAttr("absent"), exceptions::NotFoundError);
}

// def f(x):
//     return x.anything
TEST_F(Attributes, UnknownOwnersGiveUnknown) {
  auto& f = b.function(*body, "f", {"x"}, 2);
  auto& ret = b.returnStmt(b.block(f, 3), 3);
  auto& attr = b.attribute(ret, "anything", 3);
  b.name(attr, "x", 3);

  const auto values = infer::infer(attr).collect();
  EXPECT_EQ(values, (std::vector<infer::Value>{infer::Value::unknown()}));
}

TEST_F(Attributes, BuiltinAttributesOfLiterals) {
  auto& stmt = b.exprStmt(*body, 2);
  auto& call = b.call(stmt, 2);
  auto& bits = b.attribute(call, "bit_length", 2);
  b.constant(bits, ast::ConstValue{std::int64_t{12}}, 2);

  const auto values = infer::infer(call).collect();
  ASSERT_EQ(values.size(), 1u);
  EXPECT_EQ(intOf(values.front()), 0);
}
