/***
 * Name: pyinfer::infer::InferStream
 * Purpose: Lazy, move-only sequence of inferred values with a typed outcome.
 * Inputs:
 *   - A ValueSource producing values on demand.
 * Outputs:
 *   - Values one at a time through next(); state(), failure() and outcome()
 *     describe how the run ended.
 * Theory of Operation:
 *   next() pulls from the source until it reports exhaustion or failure;
 *   after that the source is released immediately, which unwinds any
 *   cycle-detection entries it holds. NotFoundError, UnresolvableName and
 *   InferenceError thrown by collaborators while a value is produced are
 *   converted into the matching Failure, so no exception escapes next().
 *   Dropping a stream early only destroys its source.
 */
#pragma once

#include "infer/Failure.h"
#include "infer/Value.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace pyinfer::infer {

    class ValueSource {
    public:
        virtual ~ValueSource() = default;
        // Next value, or std::nullopt at the end (setting `failure` when the end is a failure).
        virtual std::optional<Value> next(Failure &failure) = 0;
    };

    enum class StreamState { Active, Exhausted, Failed };
    enum class Outcome { Values, Empty, Failed };

    const char *to_string(Outcome outcome);

    class InferStream {
    public:
        InferStream() = default;
        explicit InferStream(std::unique_ptr<ValueSource> source);
        InferStream(InferStream &&) noexcept = default;
        InferStream &operator=(InferStream &&) noexcept = default;
        InferStream(const InferStream &) = delete;
        InferStream &operator=(const InferStream &) = delete;

        static InferStream single(const Value &value);
        static InferStream values(std::vector<Value> values);
        static InferStream failed(Failure failure);

        std::optional<Value> next();

        StreamState state() const { return state_; }
        const Failure &failure() const { return failure_; }
        std::size_t produced() const { return produced_; }
        // Failed if the run failed, otherwise Values or Empty by what was produced.
        Outcome outcome() const;

        // Drains the stream; throws the exception matching the failure, if any.
        std::vector<Value> collect();

    private:
        void finish(Failure failure);

        std::unique_ptr<ValueSource> source_{};
        StreamState state_{StreamState::Exhausted};
        Failure failure_{};
        std::size_t produced_{0};
    };

} // namespace pyinfer::infer
