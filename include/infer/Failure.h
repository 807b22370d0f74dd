/***
 * Name: pyinfer::infer::Failure
 * Purpose: Typed reason a value stream ended without completing normally.
 */
#pragma once

#include <string>
#include <utility>

namespace pyinfer::infer {

    enum class FailureKind { None, NotFound, Unresolvable, InferenceFailed };

    const char *to_string(FailureKind kind);

    struct Failure {
        FailureKind kind{FailureKind::None};
        std::string message{};

        explicit operator bool() const { return kind != FailureKind::None; }

        static Failure notFound(std::string msg) { return {FailureKind::NotFound, std::move(msg)}; }
        static Failure unresolvable(std::string msg) { return {FailureKind::Unresolvable, std::move(msg)}; }
        static Failure inferenceFailed(std::string msg) { return {FailureKind::InferenceFailed, std::move(msg)}; }

        // Throws the exception type matching `kind`; no-op for None.
        void raise() const;
    };

} // namespace pyinfer::infer
