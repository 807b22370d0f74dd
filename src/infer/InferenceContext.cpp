/***
 * Name: pyinfer::infer::InferenceContext / InferencePath
 * Purpose: Shared visited-pair path and context cloning.
 */
#include "infer/InferenceContext.h"
#include "pyinfer/exceptions/precondition_error.h"

#include <algorithm>

namespace pyinfer::infer {

bool InferencePath::push(const ast::Node &node, const std::optional<std::string> &name) {
    if (contains(node, name)) {
        ++cycles_;
        return false;
    }
    entries_.emplace_back(&node, name);
    return true;
}

void InferencePath::pop() {
    if (entries_.empty()) { throw exceptions::PreconditionError("pop on an empty inference path"); }
    entries_.pop_back();
}

void InferencePath::remove(const ast::Node &node, const std::optional<std::string> &name) {
    const Entry entry{&node, name};
    const auto it = std::find(entries_.rbegin(), entries_.rend(), entry);
    if (it != entries_.rend()) { entries_.erase(std::next(it).base()); }
}

bool InferencePath::contains(const ast::Node &node, const std::optional<std::string> &name) const {
    const Entry entry{&node, name};
    return std::find(entries_.begin(), entries_.end(), entry) != entries_.end();
}

InferenceContext::InferenceContext(const ast::Node *start)
    : startingNode(start), path_(std::make_shared<InferencePath>()) {}

InferenceContext InferenceContext::clone() const {
    InferenceContext copy(*this);
    copy.lookupName.reset();
    return copy;
}

} // namespace pyinfer::infer
