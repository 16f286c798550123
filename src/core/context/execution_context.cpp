#include "core/context/execution_context.h"
#include <algorithm>
#include <thread>

namespace agentgraph {

ExecutionContext::ExecutionContext() : state_(std::make_shared<State>()) {}

ExecutionContext::ExecutionContext(std::shared_ptr<State> state) : state_(std::move(state)) {}

ExecutionContext ExecutionContext::background() {
    return ExecutionContext();
}

ExecutionContext ExecutionContext::with_cancel(const ExecutionContext& parent) {
    auto state = std::make_shared<State>();
    state->parent = parent.state_;
    return ExecutionContext(std::move(state));
}

ExecutionContext ExecutionContext::with_deadline(const ExecutionContext& parent,
                                                 SteadyClock::time_point deadline) {
    auto state = std::make_shared<State>();
    state->parent = parent.state_;
    state->deadline = deadline;
    return ExecutionContext(std::move(state));
}

ExecutionContext ExecutionContext::with_timeout(const ExecutionContext& parent,
                                                std::chrono::milliseconds timeout) {
    return with_deadline(parent, SteadyClock::now() + timeout);
}

void ExecutionContext::cancel() const {
    state_->cancelled.store(true, std::memory_order_release);
}

bool ExecutionContext::done() const {
    return !error().empty();
}

std::string ExecutionContext::error() const {
    // Explicit cancellation anywhere up the chain takes precedence over deadlines.
    for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->cancelled.load(std::memory_order_acquire)) {
            return kCanceled;
        }
    }
    auto dl = deadline();
    if (dl && SteadyClock::now() >= *dl) {
        return kDeadlineExceeded;
    }
    return "";
}

std::optional<ExecutionContext::SteadyClock::time_point> ExecutionContext::deadline() const {
    std::optional<SteadyClock::time_point> earliest;
    for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->deadline && (!earliest || *s->deadline < *earliest)) {
            earliest = s->deadline;
        }
    }
    return earliest;
}

bool ExecutionContext::sleep_for(std::chrono::milliseconds duration) const {
    constexpr auto kSlice = std::chrono::milliseconds(5);
    const auto until = SteadyClock::now() + duration;
    while (SteadyClock::now() < until) {
        if (done()) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(until - SteadyClock::now());
        std::this_thread::sleep_for(std::min(kSlice, std::max(remaining, std::chrono::milliseconds(0))));
    }
    return !done();
}

} // namespace agentgraph
