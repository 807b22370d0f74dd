/***
 * Name: pyinfer::ast::NodeWalk
 * Purpose: Lazy depth-first pre-order walk used by Node::nodesOfClass.
 * Inputs:
 *   - Start node, match set, skip set.
 * Outputs:
 *   - Input range over matching nodes (the start node included when it matches).
 * Theory of Operation:
 *   The iterator keeps an explicit stack of pending node ids. A child whose
 *   kind is in the skip set is dropped before it is pushed, so neither it nor
 *   its subtree is visited. Each begin() starts an independent walk, and
 *   abandoning an iterator has no side effects.
 */
#pragma once

#include "ast/KindSet.h"
#include "ast/Node.h"
#include <cstddef>
#include <iterator>
#include <vector>

namespace pyinfer::ast {

    class NodeWalk {
    public:
        class iterator {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = const Node *;
            using difference_type = std::ptrdiff_t;
            using pointer = const Node *const *;
            using reference = const Node *const &;

            iterator() = default;
            iterator(const Node &start, KindSet match, KindSet skip);

            reference operator*() const { return current_; }
            iterator &operator++();
            bool operator==(const iterator &other) const { return current_ == other.current_; }

        private:
            void advance();

            const NodeArena *arena_{nullptr};
            KindSet match_{};
            KindSet skip_{};
            std::vector<NodeId> pending_{};
            const Node *current_{nullptr};
        };

        NodeWalk(const Node &start, KindSet match, KindSet skip)
            : start_(&start), match_(match), skip_(skip) {}

        iterator begin() const { return iterator(*start_, match_, skip_); }
        iterator end() const { return {}; }

        std::vector<const Node *> collect() const;

    private:
        const Node *start_;
        KindSet match_;
        KindSet skip_;
    };

} // namespace pyinfer::ast
