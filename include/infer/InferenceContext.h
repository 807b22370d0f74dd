/***
 * Name: pyinfer::infer::InferenceContext
 * Purpose: State carried through one resolution chain.
 * Inputs:
 *   - Starting node; lookup name, call context and bound receiver set by
 *     the engine as it descends.
 * Outputs:
 *   - Cycle detection over (node, lookup name) pairs.
 * Theory of Operation:
 *   Copies and clones share one InferencePath, so a pair pushed anywhere in
 *   the chain is visible everywhere in it. clone() keeps the call context and
 *   bound receiver and clears the lookup name. A CallContext remembers the
 *   context of its call site so arguments are inferred where they were
 *   written.
 */
#pragma once

#include "ast/Call.h"
#include "ast/Node.h"
#include "infer/Value.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pyinfer::infer {

    struct CallContext {
        const ast::Call *call{nullptr};
        const ast::Node *callee{nullptr};
        std::shared_ptr<const CallContext> outer{};
        std::optional<Value> outerBound{};
    };

    class InferencePath {
    public:
        using Entry = std::pair<const ast::Node *, std::optional<std::string>>;

        // False (and a broken cycle recorded) when the pair is already present.
        bool push(const ast::Node &node, const std::optional<std::string> &name);
        void pop();
        // Removes the most recent occurrence of the pair.
        void remove(const ast::Node &node, const std::optional<std::string> &name);
        bool contains(const ast::Node &node, const std::optional<std::string> &name) const;

        std::size_t size() const { return entries_.size(); }
        std::size_t cyclesBroken() const { return cycles_; }

    private:
        std::vector<Entry> entries_{};
        std::size_t cycles_{0};
    };

    class InferenceContext {
    public:
        explicit InferenceContext(const ast::Node *start = nullptr);

        const ast::Node *startingNode{nullptr};
        std::optional<std::string> lookupName{};
        std::shared_ptr<const CallContext> callContext{};
        std::optional<Value> boundNode{};

        bool push(const ast::Node &node) { return path_->push(node, lookupName); }
        void pop() { path_->pop(); }

        InferenceContext clone() const;

        InferencePath &path() const { return *path_; }

    private:
        std::shared_ptr<InferencePath> path_;
    };

} // namespace pyinfer::infer
