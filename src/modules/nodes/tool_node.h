#ifndef AGENTGRAPH_MODULES_NODES_TOOL_NODE_H
#define AGENTGRAPH_MODULES_NODES_TOOL_NODE_H

#include "common/tools/registry.h"
#include "modules/nodes/basic_nodes.h"
#include <memory>
#include <string>

namespace agentgraph {

// Calls a registered tool. String leaves of the argument template are
// rendered with inja against the data bag; without a template the whole
// data bag is passed. With no output key an object result is merged as is.
class ToolNode : public BaseNode {
public:
    ToolNode(std::string id, std::shared_ptr<const ToolRegistry> tools, std::string tool_name,
             Value arguments = Value(), std::string output_key = "");

    void validate() const override;
    [[nodiscard]] NodeOutput execute(const ExecutionContext& ctx, const WorkflowState& state) const override;

    const std::string& tool_name() const { return tool_name_; }

private:
    std::shared_ptr<const ToolRegistry> tools_;
    std::string tool_name_;
    Value arguments_;
    std::string output_key_;
};

// Renders every string leaf of a JSON template against context.
Value render_arguments(const Value& arguments, const Value& context);

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_NODES_TOOL_NODE_H
