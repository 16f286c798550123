#include "modules/registry/template_registry.h"
#include "common/logger.h"
#include "core/types/errors.h"
#include <mutex>
#include <stdexcept>

namespace agentgraph {

namespace {

bool matches(ParameterType type, const Value& value) {
    switch (type) {
        case ParameterType::STRING: return value.is_string();
        case ParameterType::INT: return value.is_number_integer();
        case ParameterType::FLOAT: return value.is_number();
        case ParameterType::BOOL: return value.is_boolean();
        case ParameterType::OBJECT: return value.is_object();
        case ParameterType::ARRAY: return value.is_array();
        case ParameterType::ANY: return true;
    }
    return false;
}

} // namespace

std::string to_string(ParameterType type) {
    switch (type) {
        case ParameterType::STRING: return "string";
        case ParameterType::INT: return "int";
        case ParameterType::FLOAT: return "float";
        case ParameterType::BOOL: return "bool";
        case ParameterType::OBJECT: return "object";
        case ParameterType::ARRAY: return "array";
        case ParameterType::ANY: return "any";
    }
    return "unknown";
}

ParameterType parameter_type_from_string(const std::string& text) {
    for (auto type : {ParameterType::STRING, ParameterType::INT, ParameterType::FLOAT, ParameterType::BOOL,
                      ParameterType::OBJECT, ParameterType::ARRAY, ParameterType::ANY}) {
        if (to_string(type) == text) {
            return type;
        }
    }
    throw ValidationError("unknown parameter type: " + text);
}

void TemplateRegistry::register_template(WorkflowTemplate tmpl) {
    if (tmpl.id.empty()) {
        throw ValidationError("template ID cannot be empty");
    }
    if (!tmpl.factory) {
        throw ValidationError("template has no factory: " + tmpl.id);
    }
    std::unique_lock lock(mutex_);
    if (templates_.count(tmpl.id)) {
        throw ValidationError("template already registered: " + tmpl.id);
    }
    std::string id = tmpl.id;
    templates_.emplace(std::move(id), std::move(tmpl));
}

const WorkflowTemplate& TemplateRegistry::get(const std::string& template_id) const {
    std::shared_lock lock(mutex_);
    auto it = templates_.find(template_id);
    if (it == templates_.end()) {
        throw std::out_of_range("template not found: " + template_id);
    }
    return it->second;
}

std::vector<std::string> TemplateRegistry::list() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, _] : templates_) {
        ids.push_back(id);
    }
    return ids;
}

std::shared_ptr<Graph> TemplateRegistry::instantiate(const std::string& template_id, const Value& params) const {
    const WorkflowTemplate& tmpl = get(template_id);
    if (!params.is_null() && !params.is_object()) {
        throw ValidationError("template parameters must be an object");
    }

    Value enriched = params.is_object() ? params : Value::object();
    for (const auto& param : tmpl.parameters) {
        auto it = enriched.find(param.name);
        if (it == enriched.end()) {
            if (param.required) {
                throw ValidationError("invalid parameters: required parameter missing: " + param.name);
            }
            if (!param.default_value.is_null()) {
                enriched[param.name] = param.default_value;
            }
            continue;
        }
        if (!matches(param.type, *it)) {
            throw ValidationError("invalid parameters: parameter " + param.name + " expected " +
                                  to_string(param.type) + ", got " + it->type_name());
        }
    }

    auto graph = tmpl.factory(enriched);
    if (!graph) {
        throw ValidationError("template " + template_id + " produced no graph");
    }
    graph->validate();
    AGENTGRAPH_LOG_DEBUG("instantiated template {} as workflow {}", template_id, graph->id());
    return graph;
}

} // namespace agentgraph
