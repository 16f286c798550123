#include "modules/nodes/tool_node.h"
#include "common/logger.h"
#include "common/utils/template_renderer.h"
#include "core/types/errors.h"
#include <stdexcept>

namespace agentgraph {

Value render_arguments(const Value& arguments, const Value& context) {
    if (arguments.is_string()) {
        return InjaTemplateRenderer::render_value(arguments.get<std::string>(), context);
    }
    if (arguments.is_object()) {
        Value rendered = Value::object();
        for (auto it = arguments.begin(); it != arguments.end(); ++it) {
            rendered[it.key()] = render_arguments(it.value(), context);
        }
        return rendered;
    }
    if (arguments.is_array()) {
        Value rendered = Value::array();
        for (const auto& item : arguments) {
            rendered.push_back(render_arguments(item, context));
        }
        return rendered;
    }
    return arguments;
}

ToolNode::ToolNode(std::string id, std::shared_ptr<const ToolRegistry> tools, std::string tool_name,
                   Value arguments, std::string output_key)
    : BaseNode(std::move(id), node_types::TOOL),
      tools_(std::move(tools)),
      tool_name_(std::move(tool_name)),
      arguments_(std::move(arguments)),
      output_key_(std::move(output_key)) {}

void ToolNode::validate() const {
    BaseNode::validate();
    if (!tools_) {
        throw ValidationError("tool node has no tool registry: " + id());
    }
    if (tool_name_.empty()) {
        throw ValidationError("tool node has no tool name: " + id());
    }
    if (!tools_->has_tool(tool_name_)) {
        throw ValidationError("tool node " + id() + " references unknown tool: " + tool_name_);
    }
}

NodeOutput ToolNode::execute(const ExecutionContext&, const WorkflowState& state) const {
    Value args = arguments_.is_null() ? state.data : render_arguments(arguments_, state.data);

    Value result;
    try {
        result = tools_->call_tool(tool_name_, args);
    } catch (const std::exception& e) {
        throw std::runtime_error("tool execution failed: " + std::string(e.what()));
    }
    AGENTGRAPH_LOG_DEBUG("tool {} returned {}", tool_name_, result.dump());

    NodeOutput output;
    if (!output_key_.empty()) {
        output.data[output_key_] = result;
    } else if (result.is_object()) {
        output.data = result;
    } else {
        output.data["tool_result"] = result;
    }
    output.metadata = Value{{"tool_name", tool_name_}, {"tool_result", result}};
    return output;
}

} // namespace agentgraph
