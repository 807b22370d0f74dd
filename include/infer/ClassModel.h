/***
 * Name: pyinfer::infer class model
 * Purpose: Class-level attribute resolution shared by classes and instances.
 * Inputs:
 *   - A ClassDef, an attribute name.
 * Outputs:
 *   - Binding values (plain lookup) or inferred values (inferred lookup).
 * Theory of Operation:
 *   ancestors() infers each base expression and linearizes depth-first,
 *   left to right, without repeats; every class but the builtin `object`
 *   implicitly derives from it. A class whose ancestors are already being
 *   computed further up the stack reports none, so self-referential bases
 *   terminate. Plain lookup answers the special attributes
 *   `__name__` and `__module__` with a str instance, then searches the class
 *   and its ancestors in order. Inferred lookup additionally maps instances
 *   of descriptor classes (defining `__get__`) to Unknown, and answers
 *   Unknown for missing non-dunder attributes of classes defining
 *   `__getattr__`.
 */
#pragma once

#include "ast/ClassDef.h"
#include "ast/Node.h"
#include "infer/InferStream.h"
#include "infer/InferenceContext.h"
#include "infer/Value.h"

#include <string>
#include <vector>

namespace pyinfer::infer {

    std::vector<const ast::ClassDef *> ancestors(const ast::ClassDef &cls);

    // Throws NotFoundError.
    std::vector<Value> classGetAttr(const ast::ClassDef &cls, const std::string &name);

    // Throws NotFoundError when the attribute is missing and no `__getattr__` applies.
    InferStream classInferredGetAttr(const ast::ClassDef &cls, const std::string &name, const InferenceContext &ctx);

    // `self.<name>` assignments of the class and its ancestors; throws NotFoundError.
    std::vector<Value> instanceAttr(const ast::ClassDef &cls, const std::string &name);

    // Builtin class proxied by a literal or container node, nullptr for other kinds.
    const ast::ClassDef *proxiedClass(const ast::Node &node);

    bool isDunder(const std::string &name);

} // namespace pyinfer::infer
