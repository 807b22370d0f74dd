/***
 * Name: pyinfer::obs::TreePrinter
 * Purpose: Tree pretty-printer for diagnostics/logging.
 * Inputs:
 *   - Any node; usually a Module.
 * Outputs:
 *   - Formatted string with node kinds and salient fields.
 * Theory of Operation:
 *   Walks the children of each node in source order, one line per node,
 *   with indentation reflecting tree depth. Salient fields are the names,
 *   operators and literal values a reader needs to recognise the source.
 */
#pragma once

#include <sstream>
#include <string>
#include "ast/Node.h"

namespace pyinfer::obs {

class TreePrinter {
 public:
  std::string print(const ast::Node& root);

 private:
  void visit(const ast::Node& node);
  void indent() { for (int i = 0; i < depth_; ++i) ss_ << "  "; }
  void line(const std::string& s) { indent(); ss_ << s << "\n"; }
  std::ostringstream ss_{};
  int depth_{0};
};

// Salient fields of one node, e.g. `FunctionDef name=f params=a,b`.
std::string nodeLabel(const ast::Node& node);

} // namespace pyinfer::obs
