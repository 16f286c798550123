#ifndef AGENTGRAPH_COMMON_UTILS_YAML_JSON_H
#define AGENTGRAPH_COMMON_UTILS_YAML_JSON_H

#include "core/types/value.h"
#include <string>

namespace YAML {
class Node;
}

namespace agentgraph {

// Converts a YAML node to JSON. Plain scalars become bool, null, integer or
// double when they look like one; quoted scalars always stay strings.
Value yaml_to_json(const YAML::Node& node);

// Parses a YAML document from text. Throws std::runtime_error with the parser position.
Value parse_yaml(const std::string& text);

Value load_yaml_file(const std::string& path);

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_UTILS_YAML_JSON_H
