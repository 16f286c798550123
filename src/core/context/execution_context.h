#ifndef AGENTGRAPH_CORE_CONTEXT_EXECUTION_CONTEXT_H
#define AGENTGRAPH_CORE_CONTEXT_EXECUTION_CONTEXT_H

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace agentgraph {

// Cooperative cancellation handle passed to every node and condition.
// Copies share the same underlying state; derived contexts observe their
// parent's cancellation and deadline but not the other way round.
class ExecutionContext {
public:
    using SteadyClock = std::chrono::steady_clock;

    static constexpr const char* kCanceled = "context canceled";
    static constexpr const char* kDeadlineExceeded = "context deadline exceeded";

    ExecutionContext(); // same as background()

    static ExecutionContext background();
    static ExecutionContext with_cancel(const ExecutionContext& parent);
    static ExecutionContext with_deadline(const ExecutionContext& parent, SteadyClock::time_point deadline);
    static ExecutionContext with_timeout(const ExecutionContext& parent, std::chrono::milliseconds timeout);

    void cancel() const;
    bool done() const;

    // Empty while not done, otherwise kCanceled or kDeadlineExceeded.
    std::string error() const;

    // Earliest deadline along the parent chain.
    std::optional<SteadyClock::time_point> deadline() const;

    // Sleeps up to `duration`, waking early on cancellation. Returns false if
    // the context finished before the full duration elapsed.
    bool sleep_for(std::chrono::milliseconds duration) const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::optional<SteadyClock::time_point> deadline;
        std::shared_ptr<const State> parent;
    };

    explicit ExecutionContext(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_CONTEXT_EXECUTION_CONTEXT_H
