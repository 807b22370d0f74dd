/***
 * Name: pyinfer::infer::Instance / InstanceMethod / Generator
 * Purpose: Stand-ins for runtime objects the engine reasons about.
 * Inputs:
 *   - The proxied node: the class of an instance, the function of a bound
 *     method or generator.
 * Outputs:
 *   - Attribute lookups, call results and type names in terms of the
 *     proxied node.
 * Theory of Operation:
 *   Proxies are cheap views over a Value. Instance attribute lookup checks
 *   instance attributes first, then the special names, then the class; the
 *   `__name__` special case fails on instances even where the class defines
 *   it. Functions found on the class are returned as bound methods.
 */
#pragma once

#include "ast/Call.h"
#include "ast/ClassDef.h"
#include "ast/FunctionDef.h"
#include "infer/InferStream.h"
#include "infer/InferenceContext.h"
#include "infer/Value.h"

#include <optional>
#include <string>
#include <vector>

namespace pyinfer::infer {

    class Instance {
    public:
        explicit Instance(const ast::ClassDef &cls) : cls_(cls) {}

        const ast::ClassDef &proxied() const { return cls_; }
        Value value() const { return Value::instance(cls_); }

        // Throws NotFoundError.
        std::vector<Value> getAttr(const std::string &name, bool lookupClass = true) const;
        // Throws InferenceError when neither the instance nor the class has the attribute.
        InferStream inferredGetAttr(const std::string &name, const InferenceContext &ctx) const;
        InferStream inferCallResult(const ast::Call *caller, const InferenceContext &ctx) const;
        bool isCallable() const;

        std::string pytype() const;
        std::string describe() const;

    private:
        const ast::ClassDef &cls_;
    };

    class InstanceMethod {
    public:
        InstanceMethod(const ast::FunctionDef &fn, const ast::ClassDef &receiver) : fn_(fn), receiver_(receiver) {}

        const ast::FunctionDef &proxied() const { return fn_; }
        const ast::ClassDef &receiverClass() const { return receiver_; }
        bool isBound() const { return true; }

        InferStream inferCallResult(const ast::Call *caller, const InferenceContext &ctx) const;

        std::string pytype() const { return "__builtin__.instancemethod"; }
        std::string describe() const;

    private:
        const ast::FunctionDef &fn_;
        const ast::ClassDef &receiver_;
    };

    class Generator {
    public:
        explicit Generator(const ast::FunctionDef &fn) : fn_(fn) {}

        const ast::FunctionDef &proxied() const { return fn_; }
        bool isCallable() const { return true; }

        std::string pytype() const { return "__builtin__.generator"; }
        std::string describe() const;

    private:
        const ast::FunctionDef &fn_;
    };

    // Call result of a plain function; `receiver` binds the first parameter of a method.
    InferStream functionCallResult(const ast::FunctionDef &fn, const ast::Call *caller, const InferenceContext &ctx,
                                   const std::optional<Value> &receiver);

} // namespace pyinfer::infer
