#ifndef AGENTGRAPH_COMMON_TOOLS_REGISTRY_H
#define AGENTGRAPH_COMMON_TOOLS_REGISTRY_H

#include "core/types/value.h"
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentgraph {

// Named callables available to tool nodes. One instance per engine, injected
// where needed; lookups are safe from concurrent executions.
class ToolRegistry {
public:
    using Tool = std::function<Value(const Value& args)>;

    explicit ToolRegistry(bool with_builtin_tools = false);

    template<typename Func>
    void register_tool(std::string name, Func&& func) {
        std::unique_lock lock(mutex_);
        tools_[std::move(name)] = Tool(std::forward<Func>(func));
    }

    bool unregister_tool(const std::string& name);
    bool has_tool(const std::string& name) const;

    // Throws std::runtime_error for unknown tools; tool exceptions propagate.
    Value call_tool(const std::string& name, const Value& args) const;

    std::vector<std::string> list_tools() const; // sorted

private:
    void register_builtin_tools();

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Tool> tools_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_TOOLS_REGISTRY_H
