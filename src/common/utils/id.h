#ifndef AGENTGRAPH_COMMON_UTILS_ID_H
#define AGENTGRAPH_COMMON_UTILS_ID_H

#include <string>

namespace agentgraph {

// Random RFC 4122 version 4 UUID in canonical 8-4-4-4-12 form.
std::string generate_uuid();

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_UTILS_ID_H
