/***
 * Name: test_tree_printer
 * Purpose: Verify the indented tree dump and per-node labels.
 */
#include <gtest/gtest.h>
#include "ast/Builder.h"
#include "observability/TreePrinter.h"

using namespace pyinfer;

// def f(a, b):
//     return a + 1
TEST(TreePrinter, IndentsChildrenByDepth) {
  ast::NodeArena arena;
  ast::Builder b(arena);
  auto& mod = b.module("m");
  auto& body = b.block(mod, 1);
  auto& fn = b.function(body, "f", {"a", "b"}, 1);
  auto& fnBody = b.block(fn, 2);
  auto& ret = b.returnStmt(fnBody, 2);
  auto& sum = b.binary(ret, "+", 2);
  b.name(sum, "a", 2);
  b.constant(sum, ast::ConstValue{std::int64_t{1}}, 2);

  obs::TreePrinter printer;
  const std::string expected =
      "Module name=m\n"
      "  Block\n"
      "    FunctionDef name=f params=a,b\n"
      "      Block\n"
      "        ReturnStmt\n"
      "          BinaryExpr op=+\n"
      "            Name a\n"
      "            IntLiteral 1\n";
  EXPECT_EQ(printer.print(mod), expected);
  // Printing again starts from a clean buffer.
  EXPECT_EQ(printer.print(mod), expected);
}

TEST(TreePrinter, LabelsShowSalientFields) {
  ast::NodeArena arena;
  ast::Builder b(arena);
  auto& mod = b.module("m");
  auto& body = b.block(mod, 1);
  auto& from = b.importFrom(body, "lib", {{"p", "q"}, {"r", ""}}, 1);
  auto& tryStmt = b.tryExcept(body, 2);
  auto& handler = b.handler(tryStmt, "e", 3);
  auto& use = b.exprStmt(body, 4);
  auto& call = b.call(use, 4);
  auto& attr = b.attribute(call, "attr", 4);
  b.name(attr, "obj", 4);
  b.keyword(call, "k");
  auto& text = b.constant(call, ast::ConstValue{std::string("s")}, 4);
  auto& check = b.exprStmt(body, 5);
  auto& cmp = b.compare(check, {"<"}, 5);

  EXPECT_EQ(obs::nodeLabel(from), "ImportFrom from=lib p as q,r");
  EXPECT_EQ(obs::nodeLabel(handler), "ExceptHandler as=e");
  EXPECT_EQ(obs::nodeLabel(call), "Call keywords=k");
  EXPECT_EQ(obs::nodeLabel(attr), "Attribute .attr");
  EXPECT_EQ(obs::nodeLabel(text), "StringLiteral \"s\"");
  EXPECT_EQ(obs::nodeLabel(cmp), "Compare ops=<");
  EXPECT_EQ(obs::nodeLabel(arena.noneConstant()), "NoneLiteral None");
  EXPECT_EQ(obs::nodeLabel(arena.boolConstant(true)), "BoolLiteral True");
}
