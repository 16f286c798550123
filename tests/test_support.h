#ifndef AGENTGRAPH_TESTS_TEST_SUPPORT_H
#define AGENTGRAPH_TESTS_TEST_SUPPORT_H

#include "common/llm/llm_provider.h"
#include "core/types/node.h"
#include "modules/executor/executor.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentgraph::testing {

// A node that merges fixed data, optionally sleeps, fails or overrides routing,
// and counts how often it ran.
class ScriptedNode : public Node {
public:
    explicit ScriptedNode(std::string id, Value data = Value::object());

    ScriptedNode& fail_with(std::string message);
    ScriptedNode& sleep(std::chrono::milliseconds delay);
    ScriptedNode& route_to(std::string next);
    ScriptedNode& reject_validation();

    const std::string& id() const override { return id_; }
    const std::string& type() const override { return type_; }
    void validate() const override;
    NodeOutput execute(const ExecutionContext& ctx, const WorkflowState& state) const override;

    int calls() const { return calls_.load(); }

private:
    std::string id_;
    std::string type_ = "scripted";
    Value data_;
    std::optional<std::string> failure_;
    std::chrono::milliseconds delay_{0};
    std::optional<std::string> next_;
    bool invalid_ = false;
    mutable std::atomic<int> calls_{0};
};

std::shared_ptr<ScriptedNode> scripted(const std::string& id, Value data = Value::object());

// Replies with queued responses in order, then repeats the last one.
class FakeLlmProvider : public LlmProvider {
public:
    explicit FakeLlmProvider(std::vector<LlmResponse> responses);

    std::string name() const override { return "fake"; }
    LlmResponse generate(const LlmRequest& request) override;

    std::vector<LlmRequest> requests() const;

private:
    mutable std::mutex mutex_;
    std::vector<LlmResponse> responses_;
    std::vector<LlmRequest> requests_;
};

std::vector<std::string> history_ids(const WorkflowState& state);

// Polls until the predicate holds or the timeout expires; returns the last state seen.
WorkflowState wait_until(const Executor& executor, const std::string& execution_id,
                         const std::function<bool(const WorkflowState&)>& predicate,
                         std::chrono::milliseconds timeout = std::chrono::seconds(5));

std::string data_file(const std::string& name);

} // namespace agentgraph::testing

#endif // AGENTGRAPH_TESTS_TEST_SUPPORT_H
