#include "common/utils/template_renderer.h"
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace agentgraph {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool is_single_expression(std::string_view s) {
    s = trim(s);
    if (s.size() < 4 || s.substr(0, 2) != "{{" || s.substr(s.size() - 2) != "}}") {
        return false;
    }
    // "{{ a }} and {{ b }}" is text, not one expression
    return s.find("{{", 2) == std::string_view::npos && s.find("}}") == s.size() - 2;
}

} // namespace

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");

    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    // Templates come from workflow files; never let them read the filesystem.
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

InjaTemplateRenderer& InjaTemplateRenderer::thread_instance() {
    thread_local InjaTemplateRenderer renderer;
    return renderer;
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const Value& context) {
    return thread_instance().render_with_env(template_str, context);
}

Value InjaTemplateRenderer::render_value(std::string_view template_str, const Value& context) {
    std::string rendered = render(template_str, context);
    if (!is_single_expression(template_str)) {
        return rendered;
    }
    Value parsed = Value::parse(rendered, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return rendered;
    }
    return parsed;
}

bool InjaTemplateRenderer::evaluate(std::string_view expression, const Value& context) {
    std::string tmpl(expression);
    if (tmpl.find("{{") == std::string::npos) {
        tmpl = "{{ " + tmpl + " }}";
    }
    std::string result(trim(render(tmpl, context)));

    if (result == "true") return true;
    if (result == "false") return false;
    try {
        size_t consumed = 0;
        double num = std::stod(result, &consumed);
        if (consumed == result.size()) {
            return num != 0.0;
        }
    } catch (const std::logic_error&) {
        // not numeric, reported below
    }
    throw std::runtime_error("Condition did not evaluate to a boolean value ('true'/'false' or number): " + result);
}

std::string InjaTemplateRenderer::render_with_env(std::string_view template_str, const Value& context) {
    try {
        return env_.render(template_str, context);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template render error: " + std::string(e.message));
    }
}

} // namespace agentgraph
