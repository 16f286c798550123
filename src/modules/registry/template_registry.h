#ifndef AGENTGRAPH_MODULES_REGISTRY_TEMPLATE_REGISTRY_H
#define AGENTGRAPH_MODULES_REGISTRY_TEMPLATE_REGISTRY_H

#include "modules/graph/graph.h"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace agentgraph {

enum class ParameterType : uint8_t { STRING, INT, FLOAT, BOOL, OBJECT, ARRAY, ANY };

std::string to_string(ParameterType type);
ParameterType parameter_type_from_string(const std::string& text); // throws ValidationError

struct TemplateParameter {
    std::string name;
    ParameterType type = ParameterType::ANY;
    std::string description;
    bool required = false;
    Value default_value; // null: no default
};

struct WorkflowTemplate {
    using Factory = std::function<std::shared_ptr<Graph>(const Value& params)>;

    std::string id;
    std::string name;
    std::string description;
    std::vector<TemplateParameter> parameters;
    Factory factory;
};

// Parameterised graph factories.
class TemplateRegistry {
public:
    void register_template(WorkflowTemplate tmpl);
    const WorkflowTemplate& get(const std::string& template_id) const; // throws std::out_of_range
    std::vector<std::string> list() const;                              // sorted

    // Checks required parameters and types, fills defaults, runs the factory
    // and validates the result. Throws ValidationError.
    std::shared_ptr<Graph> instantiate(const std::string& template_id, const Value& params) const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, WorkflowTemplate> templates_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_REGISTRY_TEMPLATE_REGISTRY_H
