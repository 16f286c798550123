#ifndef AGENTGRAPH_COMMON_UTILS_TEMPLATE_RENDERER_H
#define AGENTGRAPH_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "core/types/value.h"
#include <inja/inja.hpp>
#include <filesystem> // Required by Inja for set_include_callback
#include <string>
#include <string_view>

namespace agentgraph {

class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // Renders with a per-thread default environment. Throws std::runtime_error.
    static std::string render(std::string_view template_str, const Value& context);

    // Like render(), but a template that is a single "{{ expr }}" keeps the
    // expression's JSON type (number, bool, array, object) instead of text.
    static Value render_value(std::string_view template_str, const Value& context);

    // Evaluates a boolean expression ("score > 3" or "{{ score > 3 }}").
    // "true"/"false" and numbers (non-zero is true) are accepted results.
    static bool evaluate(std::string_view expression, const Value& context);

    std::string render_with_env(std::string_view template_str, const Value& context);

private:
    inja::Environment env_;
    void configure_security();

    static InjaTemplateRenderer& thread_instance();
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_UTILS_TEMPLATE_RENDERER_H
