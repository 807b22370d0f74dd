/***
 * Name: pyinfer::infer stream combinators
 * Purpose: Build lazy streams out of other streams.
 * Theory of Operation:
 *   Every combinator returns immediately; work happens when the resulting
 *   stream is pulled. Functions passed in are copied into the stream and
 *   called at most once per input value.
 */
#pragma once

#include "ast/Node.h"
#include "infer/InferStream.h"
#include "infer/InferenceContext.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace pyinfer::infer {

    using StreamFactory = std::function<InferStream()>;
    using ValueExpander = std::function<InferStream(const Value &)>;

    // What a flatMap does when the stream built for one input value fails.
    enum class InnerFailure { Skip, Propagate };

    // Calls `make` on first pull; exceptions it throws become the stream's failure.
    InferStream deferred(StreamFactory make);

    // Concatenates expand(v) for every v of `outer`. A failure of `outer`
    // always ends the stream with that failure. When nothing was produced and
    // `emptyFailure` is set, the stream fails with InferenceFailed.
    InferStream flatMap(InferStream outer, ValueExpander expand, InnerFailure policy,
                        std::optional<std::string> emptyFailure = std::nullopt);

    InferStream mapValues(InferStream outer, std::function<Value(const Value &)> map);

    // Cycle-guarded inference of `node`: pushes (node, ctx.lookupName) on
    // first pull, ends empty when the pair is already on the path, drops
    // duplicate values, and pops the pair when the stream ends or is dropped.
    InferStream guarded(const ast::Node &node, InferenceContext ctx, std::function<InferStream(InferenceContext &)> body);

    // Multi-candidate resolution over binding candidates found in `frame`.
    InferStream inferStatements(std::vector<Value> candidates, const InferenceContext &ctx, const ast::Node *frame);

    // Lookup name a candidate is inferred with inside inferStatements.
    std::optional<std::string> candidateLookupName(const Value &candidate, const ast::Node *frame,
                                                   const std::optional<std::string> &name);

} // namespace pyinfer::infer
