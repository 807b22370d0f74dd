/***
 * Name: pyinfer::infer::InferStream
 * Purpose: Pull loop, failure conversion and draining.
 */
#include "infer/InferStream.h"
#include "pyinfer/exceptions/inference_error.h"
#include "pyinfer/exceptions/not_found_error.h"
#include "pyinfer/exceptions/unresolvable_name.h"

#include <utility>

namespace pyinfer::infer {

namespace {

class VectorSource final : public ValueSource {
public:
    VectorSource(std::vector<Value> values, Failure end) : values_(std::move(values)), end_(std::move(end)) {}

    std::optional<Value> next(Failure &failure) override {
        if (index_ < values_.size()) { return values_[index_++]; }
        failure = end_;
        return std::nullopt;
    }

private:
    std::vector<Value> values_;
    Failure end_;
    std::size_t index_{0};
};

} // namespace

InferStream::InferStream(std::unique_ptr<ValueSource> source)
    : source_(std::move(source)), state_(source_ ? StreamState::Active : StreamState::Exhausted) {}

InferStream InferStream::single(const Value &value) { return values({value}); }

InferStream InferStream::values(std::vector<Value> values) {
    return InferStream(std::make_unique<VectorSource>(std::move(values), Failure{}));
}

InferStream InferStream::failed(Failure failure) {
    return InferStream(std::make_unique<VectorSource>(std::vector<Value>{}, std::move(failure)));
}

std::optional<Value> InferStream::next() {
    if (state_ != StreamState::Active) { return std::nullopt; }
    Failure failure;
    try {
        if (auto value = source_->next(failure)) {
            ++produced_;
            return value;
        }
    } catch (const exceptions::NotFoundError &e) {
        failure = Failure::notFound(e.what());
    } catch (const exceptions::UnresolvableName &e) {
        failure = Failure::unresolvable(e.what());
    } catch (const exceptions::InferenceError &e) {
        failure = Failure::inferenceFailed(e.what());
    }
    finish(std::move(failure));
    return std::nullopt;
}

void InferStream::finish(Failure failure) {
    state_ = failure ? StreamState::Failed : StreamState::Exhausted;
    failure_ = std::move(failure);
    source_.reset();
}

Outcome InferStream::outcome() const {
    if (state_ == StreamState::Failed) { return Outcome::Failed; }
    return produced_ > 0 ? Outcome::Values : Outcome::Empty;
}

std::vector<Value> InferStream::collect() {
    std::vector<Value> out;
    while (auto value = next()) { out.push_back(*value); }
    failure_.raise();
    return out;
}

} // namespace pyinfer::infer
