#include "modules/loader/workflow_loader.h"
#include "common/logger.h"
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include "modules/conditions/conditions.h"
#include "modules/nodes/basic_nodes.h"
#include "modules/nodes/llm_node.h"
#include "modules/nodes/tool_node.h"
#include <filesystem>
#include <stdexcept>

namespace agentgraph {

namespace {

std::string require_string(const Value& spec, const char* key, const std::string& where) {
    auto it = spec.find(key);
    if (it == spec.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw ValidationError(where + ": missing or invalid '" + key + "'");
    }
    return it->get<std::string>();
}

std::string optional_string(const Value& spec, const char* key, const std::string& where) {
    auto it = spec.find(key);
    if (it == spec.end() || it->is_null()) {
        return "";
    }
    if (!it->is_string()) {
        throw ValidationError(where + ": '" + key + "' must be a string");
    }
    return it->get<std::string>();
}

} // namespace

WorkflowLoader::WorkflowLoader(std::shared_ptr<const ToolRegistry> tools, std::shared_ptr<LlmProvider> provider)
    : tools_(std::move(tools)), provider_(std::move(provider)) {}

std::shared_ptr<Graph> WorkflowLoader::load_file(const std::string& path) const {
    if (!std::filesystem::exists(path)) {
        throw ValidationError("workflow file not found: " + path);
    }
    Value doc;
    try {
        doc = load_yaml_file(path);
    } catch (const std::runtime_error& e) {
        throw ValidationError(path + ": " + e.what());
    }
    AGENTGRAPH_LOG_DEBUG("loaded workflow document {}", path);
    return load_document(doc);
}

std::shared_ptr<Graph> WorkflowLoader::load_string(const std::string& yaml) const {
    Value doc;
    try {
        doc = parse_yaml(yaml);
    } catch (const std::runtime_error& e) {
        throw ValidationError(e.what());
    }
    return load_document(doc);
}

std::shared_ptr<Graph> WorkflowLoader::load_document(const Value& doc) const {
    if (!doc.is_object()) {
        throw ValidationError("workflow document must be a mapping");
    }
    const std::string id = require_string(doc, "id", "workflow");
    std::string name = optional_string(doc, "name", "workflow " + id);
    auto graph = std::make_shared<Graph>(id, name.empty() ? id : name, optional_string(doc, "description", "workflow " + id));

    if (doc.contains("metadata")) {
        if (!doc["metadata"].is_object()) {
            throw ValidationError("workflow " + id + ": 'metadata' must be a mapping");
        }
        graph->set_metadata(doc["metadata"]);
    }

    auto nodes = doc.find("nodes");
    if (nodes == doc.end() || !nodes->is_array() || nodes->empty()) {
        throw ValidationError("workflow " + id + ": 'nodes' must be a non-empty list");
    }
    std::string implicit_start;
    for (const auto& spec : *nodes) {
        NodePtr node = build_node(spec);
        if (node->type() == node_types::START && implicit_start.empty()) {
            implicit_start = node->id();
        }
        graph->add_node(std::move(node));
    }

    if (auto edges = doc.find("edges"); edges != doc.end() && !edges->is_null()) {
        if (!edges->is_array()) {
            throw ValidationError("workflow " + id + ": 'edges' must be a list");
        }
        for (const auto& spec : *edges) {
            Edge edge = build_edge(spec);
            const std::string label = "edge " + edge.from_node + "->" + edge.to_node;
            try {
                graph->add_edge(std::move(edge));
            } catch (const ValidationError& e) {
                throw ValidationError(label + ": " + e.what());
            }
        }
    }

    std::string start = optional_string(doc, "start", "workflow " + id);
    if (start.empty()) {
        start = implicit_start;
    }
    if (start.empty()) {
        throw ValidationError("workflow " + id + ": no 'start' given and no start node declared");
    }
    graph->set_start_node(start);
    graph->validate();
    return graph;
}

NodePtr WorkflowLoader::build_node(const Value& spec) const {
    if (!spec.is_object()) {
        throw ValidationError("node definition must be a mapping");
    }
    const std::string id = require_string(spec, "id", "node");
    const std::string where = "node " + id;
    const std::string type = require_string(spec, "type", where);

    std::shared_ptr<BaseNode> node;
    try {
        if (type == node_types::START) {
            node = std::make_shared<StartNode>(id, spec.value("data", Value::object()));
        } else if (type == node_types::END) {
            std::optional<std::string> result;
            if (spec.contains("result")) {
                result = require_string(spec, "result", where);
            }
            node = std::make_shared<EndNode>(id, result);
        } else if (type == node_types::ASSIGN) {
            auto assign = spec.find("assign");
            if (assign == spec.end() || !assign->is_object()) {
                throw ValidationError(where + ": 'assign' must be a mapping");
            }
            AssignNode::Assignments assignments;
            for (auto it = assign->begin(); it != assign->end(); ++it) {
                if (!it.value().is_string()) {
                    throw ValidationError(where + ": assignment '" + it.key() + "' is not a string");
                }
                assignments.emplace_back(it.key(), it.value().get<std::string>());
            }
            node = std::make_shared<AssignNode>(id, std::move(assignments));
        } else if (type == node_types::TOOL) {
            if (!tools_) {
                throw ValidationError(where + ": no tool registry available");
            }
            node = std::make_shared<ToolNode>(id, tools_, require_string(spec, "tool", where),
                                              spec.value("arguments", Value()), optional_string(spec, "output_key", where));
        } else if (type == node_types::LLM) {
            if (!provider_) {
                throw ValidationError(where + ": no LLM provider available");
            }
            LlmNodeOptions options;
            options.system_prompt = optional_string(spec, "system_prompt", where);
            if (auto key = optional_string(spec, "output_key", where); !key.empty()) {
                options.output_key = key;
            }
            if (spec.contains("temperature")) {
                options.temperature = spec["temperature"].get<float>();
            }
            if (spec.contains("max_tokens")) {
                options.max_tokens = spec["max_tokens"].get<int>();
            }
            node = std::make_shared<LlmNode>(id, provider_, require_string(spec, "prompt", where), options);
        } else if (type == node_types::DECISION) {
            auto decision = std::make_shared<DecisionNode>(id);
            if (auto branches = spec.find("branches"); branches != spec.end()) {
                if (!branches->is_array()) {
                    throw ValidationError(where + ": 'branches' must be a list");
                }
                for (const auto& branch : *branches) {
                    if (!branch.is_object()) {
                        throw ValidationError(where + ": branch must be a mapping");
                    }
                    ConditionPtr cond;
                    if (branch.contains("when")) {
                        cond = std::make_shared<TemplateCondition>(require_string(branch, "when", where));
                    } else if (branch.contains("condition")) {
                        cond = parse_condition(branch["condition"]);
                    } else {
                        throw ValidationError(where + ": branch needs 'when' or 'condition'");
                    }
                    decision->add_branch(require_string(branch, "to", where), std::move(cond));
                }
            }
            if (auto def = optional_string(spec, "default", where); !def.empty()) {
                decision->set_default(def);
            }
            node = decision;
        } else {
            throw ValidationError(where + ": unknown node type '" + type + "'");
        }
    } catch (const ValidationError&) {
        throw;
    } catch (const std::exception& e) {
        throw ValidationError(where + ": " + e.what());
    }

    if (auto desc = optional_string(spec, "description", where); !desc.empty()) {
        node->set_description(desc);
    }
    if (spec.contains("metadata")) {
        node->set_metadata(spec["metadata"]);
    }
    return node;
}

Edge WorkflowLoader::build_edge(const Value& spec) {
    if (!spec.is_object()) {
        throw ValidationError("edge definition must be a mapping");
    }
    const std::string from = require_string(spec, "from", "edge");
    const std::string to = require_string(spec, "to", "edge " + from + "->?");
    const std::string where = "edge " + from + "->" + to;

    Edge edge(from, to);
    edge.id = optional_string(spec, "id", where);
    if (spec.contains("when") && spec.contains("condition")) {
        throw ValidationError(where + ": use either 'when' or 'condition', not both");
    }
    try {
        if (spec.contains("when")) {
            edge.condition = std::make_shared<TemplateCondition>(require_string(spec, "when", where));
        } else if (spec.contains("condition")) {
            edge.condition = parse_condition(spec["condition"]);
        }
    } catch (const std::exception& e) {
        throw ValidationError(where + ": " + e.what());
    }
    if (spec.contains("weight")) {
        if (!spec["weight"].is_number()) {
            throw ValidationError(where + ": 'weight' must be a number");
        }
        edge.weight = spec["weight"].get<double>();
    }
    if (spec.contains("metadata")) {
        edge.metadata = spec["metadata"];
    }
    return edge;
}

ConditionPtr WorkflowLoader::parse_condition(const Value& spec) {
    if (!spec.is_object()) {
        throw ValidationError("condition must be a mapping");
    }
    auto parse_list = [](const Value& list) {
        if (!list.is_array()) {
            throw ValidationError("condition group must be a list");
        }
        std::vector<ConditionPtr> conditions;
        for (const auto& item : list) {
            conditions.push_back(parse_condition(item));
        }
        return conditions;
    };

    if (spec.contains("all")) {
        return std::make_shared<AndCondition>(parse_list(spec["all"]));
    }
    if (spec.contains("any")) {
        return std::make_shared<OrCondition>(parse_list(spec["any"]));
    }
    if (spec.contains("not")) {
        return std::make_shared<NotCondition>(parse_condition(spec["not"]));
    }
    const std::string field = require_string(spec, "field", "condition");
    const std::string op = spec.contains("op") ? require_string(spec, "op", "condition") : "eq";
    return std::make_shared<SimpleCondition>(field, SimpleCondition::parse_op(op), spec.value("value", Value()));
}

} // namespace agentgraph
