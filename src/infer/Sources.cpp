/***
 * Name: pyinfer::infer stream combinators (impl)
 * Purpose: ValueSource implementations behind deferred, flatMap, mapValues,
 *   guarded and inferStatements.
 * Theory of Operation:
 *   Each source owns the streams it pulls from, so releasing the outermost
 *   stream releases the whole chain and every guard in it pops its pair.
 */
#include "infer/Infer.h"
#include "infer/Sources.h"
#include "pyinfer/support/trace.h"

#include <algorithm>
#include <utility>

namespace pyinfer::infer {

namespace {

// Forwards every value of `stream`; returns std::nullopt with the stream's failure at its end.
std::optional<Value> forward(InferStream &stream, Failure &failure) {
    if (auto value = stream.next()) { return value; }
    failure = stream.failure();
    return std::nullopt;
}

class DeferredSource final : public ValueSource {
public:
    explicit DeferredSource(StreamFactory make) : make_(std::move(make)) {}

    std::optional<Value> next(Failure &failure) override {
        if (make_) {
            const StreamFactory make = std::move(make_);
            make_ = nullptr;
            inner_ = make();
        }
        return forward(inner_, failure);
    }

private:
    StreamFactory make_;
    InferStream inner_{};
};

class FlatMapSource final : public ValueSource {
public:
    FlatMapSource(InferStream outer, ValueExpander expand, const InnerFailure policy,
                  std::optional<std::string> emptyFailure)
        : outer_(std::move(outer)), expand_(std::move(expand)), policy_(policy),
          emptyFailure_(std::move(emptyFailure)) {}

    std::optional<Value> next(Failure &failure) override {
        for (;;) {
            if (auto value = inner_.next()) {
                produced_ = true;
                return value;
            }
            if (inner_.state() == StreamState::Failed) {
                if (policy_ == InnerFailure::Propagate) {
                    failure = inner_.failure();
                    return std::nullopt;
                }
                support::Trace("skipped: " + inner_.failure().message);
                inner_ = InferStream();
            }
            const auto outerValue = outer_.next();
            if (!outerValue) {
                if (outer_.state() == StreamState::Failed) {
                    failure = outer_.failure();
                } else if (!produced_ && emptyFailure_) {
                    failure = Failure::inferenceFailed(*emptyFailure_);
                }
                return std::nullopt;
            }
            inner_ = deferred([expand = expand_, v = *outerValue] { return expand(v); });
        }
    }

private:
    InferStream outer_;
    ValueExpander expand_;
    InnerFailure policy_;
    std::optional<std::string> emptyFailure_;
    InferStream inner_{};
    bool produced_{false};
};

class MapSource final : public ValueSource {
public:
    MapSource(InferStream outer, std::function<Value(const Value &)> map)
        : outer_(std::move(outer)), map_(std::move(map)) {}

    std::optional<Value> next(Failure &failure) override {
        if (auto value = forward(outer_, failure)) { return map_(*value); }
        return std::nullopt;
    }

private:
    InferStream outer_;
    std::function<Value(const Value &)> map_;
};

class GuardedSource final : public ValueSource {
public:
    GuardedSource(const ast::Node &node, InferenceContext ctx, std::function<InferStream(InferenceContext &)> body)
        : node_(node), ctx_(std::move(ctx)), name_(ctx_.lookupName), body_(std::move(body)) {}

    ~GuardedSource() override { release(); }

    GuardedSource(const GuardedSource &) = delete;
    GuardedSource &operator=(const GuardedSource &) = delete;

    std::optional<Value> next(Failure &failure) override {
        if (!started_) {
            started_ = true;
            if (!ctx_.push(node_)) {
                support::Trace(std::string("cycle broken at ") + ast::to_string(node_.kind) + " line " +
                               std::to_string(node_.sourceLine()));
                return std::nullopt;
            }
            pushed_ = true;
            inner_ = body_(ctx_);
        }
        while (auto value = forward(inner_, failure)) {
            if (std::find(seen_.begin(), seen_.end(), *value) != seen_.end()) { continue; }
            seen_.push_back(*value);
            return value;
        }
        release();
        return std::nullopt;
    }

private:
    void release() {
        if (!pushed_) { return; }
        pushed_ = false;
        ctx_.path().remove(node_, name_);
    }

    const ast::Node &node_;
    InferenceContext ctx_;
    std::optional<std::string> name_;
    std::function<InferStream(InferenceContext &)> body_;
    InferStream inner_{};
    std::vector<Value> seen_{};
    bool started_{false};
    bool pushed_{false};
};

class StatementsSource final : public ValueSource {
public:
    StatementsSource(std::vector<Value> candidates, const InferenceContext &ctx, const ast::Node *frame)
        : candidates_(std::move(candidates)), ctx_(ctx.clone()), name_(ctx.lookupName), frame_(frame) {}

    std::optional<Value> next(Failure &failure) override {
        for (;;) {
            if (auto value = current_.next()) {
                inferred_ = true;
                return value;
            }
            if (current_.state() == StreamState::Failed) {
                const Failure failed = current_.failure();
                current_ = InferStream();
                if (failed.kind == FailureKind::InferenceFailed) {
                    support::Trace("unknown: " + failed.message);
                    inferred_ = true;
                    return Value::unknown();
                }
                support::Trace("skipped: " + failed.message);
            }
            if (index_ >= candidates_.size()) {
                if (!inferred_) {
                    const std::string last = candidates_.empty() ? "no candidates" : describe(candidates_.back());
                    failure = Failure::inferenceFailed("nothing inferred from " + last);
                }
                return std::nullopt;
            }
            const Value candidate = candidates_[index_++];
            if (candidate.isUnknown()) {
                inferred_ = true;
                return candidate;
            }
            ctx_.lookupName = candidateLookupName(candidate, frame_, name_);
            current_ = infer(candidate, ctx_);
        }
    }

private:
    std::vector<Value> candidates_;
    InferenceContext ctx_;
    std::optional<std::string> name_;
    const ast::Node *frame_;
    std::size_t index_{0};
    InferStream current_{};
    bool inferred_{false};
};

} // namespace

InferStream deferred(StreamFactory make) { return InferStream(std::make_unique<DeferredSource>(std::move(make))); }

InferStream flatMap(InferStream outer, ValueExpander expand, const InnerFailure policy,
                    std::optional<std::string> emptyFailure) {
    return InferStream(
        std::make_unique<FlatMapSource>(std::move(outer), std::move(expand), policy, std::move(emptyFailure)));
}

InferStream mapValues(InferStream outer, std::function<Value(const Value &)> map) {
    return InferStream(std::make_unique<MapSource>(std::move(outer), std::move(map)));
}

InferStream guarded(const ast::Node &node, InferenceContext ctx, std::function<InferStream(InferenceContext &)> body) {
    return InferStream(std::make_unique<GuardedSource>(node, std::move(ctx), std::move(body)));
}

InferStream inferStatements(std::vector<Value> candidates, const InferenceContext &ctx, const ast::Node *frame) {
    return InferStream(std::make_unique<StatementsSource>(std::move(candidates), ctx, frame));
}

std::optional<std::string> candidateLookupName(const Value &candidate, const ast::Node *frame,
                                               const std::optional<std::string> &name) {
    if (!candidate.isNode()) { return std::nullopt; }
    switch (candidate.node->kind) {
        case ast::NodeKind::Import:
        case ast::NodeKind::ImportFrom:
        case ast::NodeKind::GlobalStmt:
        case ast::NodeKind::TryExcept:
            return name;
        case ast::NodeKind::FunctionDef:
        case ast::NodeKind::LambdaExpr:
            return candidate.node == frame ? name : std::nullopt;
        default:
            return std::nullopt;
    }
}

} // namespace pyinfer::infer
