/***
 * Name: pyinfer::obs::TreePrinter (impl)
 * Purpose: One indented line per node.
 */
#include "observability/TreePrinter.h"
#include "ast/ConstFactory.h"
#include "ast/Nodes.h"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace pyinfer::obs {

namespace {

std::string joined(const std::vector<std::string>& parts, const char* sep = ",") {
  std::string out;
  for (const auto& part : parts) {
    if (!out.empty()) { out += sep; }
    out += part;
  }
  return out;
}

std::string aliases(const std::vector<ast::Alias>& names) {
  std::vector<std::string> parts;
  for (const auto& alias : names) {
    parts.push_back(alias.asname.empty() ? alias.name : alias.name + " as " + alias.asname);
  }
  return joined(parts);
}

std::string literal(const ast::ConstValue& value) {
  if (std::holds_alternative<std::monostate>(value)) { return "None"; }
  if (const auto* b = std::get_if<bool>(&value)) { return *b ? "True" : "False"; }
  if (const auto* i = std::get_if<std::int64_t>(&value)) { return std::to_string(*i); }
  if (const auto* d = std::get_if<double>(&value)) { return std::to_string(*d); }
  return "\"" + std::get<std::string>(value) + "\"";
}

} // namespace

std::string nodeLabel(const ast::Node& node) {
  using ast::NodeKind;
  std::string out = ast::to_string(node.kind);
  switch (node.kind) {
    case NodeKind::Module: return out + " name=" + static_cast<const ast::Module&>(node).name;
    case NodeKind::FunctionDef: {
      const auto& fn = static_cast<const ast::FunctionDef&>(node);
      return out + " name=" + fn.name + " params=" + joined(fn.params);
    }
    case NodeKind::ClassDef: return out + " name=" + static_cast<const ast::ClassDef&>(node).name;
    case NodeKind::LambdaExpr: return out + " params=" + joined(static_cast<const ast::LambdaExpr&>(node).params);
    case NodeKind::AugAssignStmt: return out + " op=" + static_cast<const ast::AugAssignStmt&>(node).op;
    case NodeKind::GlobalStmt: return out + " " + joined(static_cast<const ast::GlobalStmt&>(node).names);
    case NodeKind::Import: return out + " " + aliases(static_cast<const ast::Import&>(node).names);
    case NodeKind::ImportFrom: {
      const auto& stmt = static_cast<const ast::ImportFrom&>(node);
      return out + " from=" + stmt.module + " " + aliases(stmt.names);
    }
    case NodeKind::ExceptHandler: {
      const auto& handler = static_cast<const ast::ExceptHandler&>(node);
      return handler.target.empty() ? out : out + " as=" + handler.target;
    }
    case NodeKind::Name: return out + " " + static_cast<const ast::Name&>(node).id;
    case NodeKind::AssignName: return out + " " + static_cast<const ast::AssignName&>(node).id;
    case NodeKind::Attribute: return out + " ." + static_cast<const ast::Attribute&>(node).attr;
    case NodeKind::AssignAttr: return out + " ." + static_cast<const ast::AssignAttr&>(node).attr;
    case NodeKind::Call: {
      const auto& call = static_cast<const ast::Call&>(node);
      return call.keywordNames.empty() ? out : out + " keywords=" + joined(call.keywordNames);
    }
    case NodeKind::BinaryExpr: return out + " op=" + static_cast<const ast::Binary&>(node).op;
    case NodeKind::UnaryExpr: return out + " op=" + static_cast<const ast::Unary&>(node).op;
    case NodeKind::Compare: return out + " ops=" + joined(static_cast<const ast::Compare&>(node).ops);
    default: break;
  }
  if (const auto value = ast::constValueOf(node)) { return out + " " + literal(*value); }
  return out;
}

std::string TreePrinter::print(const ast::Node& root) {
  ss_.str(""); ss_.clear(); depth_ = 0;
  visit(root);
  return ss_.str();
}

void TreePrinter::visit(const ast::Node& node) {
  line(nodeLabel(node));
  depth_++;
  for (std::size_t i = 0; i < node.childCount(); ++i) { visit(node.child(i)); }
  depth_--;
}

} // namespace pyinfer::obs
