/***
 * Name: pyinfer::infer display names and Failure::raise
 * Purpose: Stable names for value kinds, failure kinds and outcomes.
 */
#include "infer/Failure.h"
#include "infer/InferStream.h"
#include "infer/Value.h"
#include "pyinfer/exceptions/inference_error.h"
#include "pyinfer/exceptions/not_found_error.h"
#include "pyinfer/exceptions/unresolvable_name.h"

namespace pyinfer::infer {

const char *to_string(const ValueKind kind) {
    switch (kind) {
        case ValueKind::Node: return "Node";
        case ValueKind::Instance: return "Instance";
        case ValueKind::InstanceMethod: return "InstanceMethod";
        case ValueKind::Generator: return "Generator";
        case ValueKind::Unknown: return "Unknown";
    }
    return "Unknown";
}

const char *to_string(const FailureKind kind) {
    switch (kind) {
        case FailureKind::None: return "none";
        case FailureKind::NotFound: return "not-found";
        case FailureKind::Unresolvable: return "unresolvable";
        case FailureKind::InferenceFailed: return "inference-failed";
    }
    return "none";
}

const char *to_string(const Outcome outcome) {
    switch (outcome) {
        case Outcome::Values: return "values";
        case Outcome::Empty: return "empty";
        case Outcome::Failed: return "failed";
    }
    return "empty";
}

std::vector<Value> valuesOf(const ast::NodeArena &arena, const std::vector<ast::NodeId> &ids) {
    std::vector<Value> out;
    out.reserve(ids.size());
    for (const ast::NodeId id : ids) { out.push_back(Value::of(arena.at(id))); }
    return out;
}

void Failure::raise() const {
    switch (kind) {
        case FailureKind::None: return;
        case FailureKind::NotFound: throw exceptions::NotFoundError(message);
        case FailureKind::Unresolvable: throw exceptions::UnresolvableName(message);
        case FailureKind::InferenceFailed: throw exceptions::InferenceError(message);
    }
}

} // namespace pyinfer::infer
