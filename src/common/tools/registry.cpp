#include "common/tools/registry.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace agentgraph {

namespace {

double number_arg(const Value& args, const std::string& key) {
    if (!args.contains(key)) {
        throw std::invalid_argument("Missing argument: " + key);
    }
    const auto& v = args.at(key);
    if (v.is_number()) {
        return v.get<double>();
    }
    if (v.is_string()) {
        try {
            return std::stod(v.get<std::string>());
        } catch (const std::logic_error&) {
            throw std::invalid_argument("Invalid number format for argument: " + key);
        }
    }
    throw std::invalid_argument("Argument '" + key + "' must be a number");
}

} // namespace

ToolRegistry::ToolRegistry(bool with_builtin_tools) {
    if (with_builtin_tools) {
        register_builtin_tools();
    }
}

void ToolRegistry::register_builtin_tools() {
    register_tool("echo", [](const Value& args) -> Value {
        return args;
    });

    register_tool("calculate", [](const Value& args) -> Value {
        double a = number_arg(args, "a");
        double b = number_arg(args, "b");
        std::string op = args.value("op", "");

        if (op == "+") return Value{{"result", a + b}};
        if (op == "-") return Value{{"result", a - b}};
        if (op == "*") return Value{{"result", a * b}};
        if (op == "/") {
            if (b == 0.0) {
                throw std::invalid_argument("Division by zero");
            }
            return Value{{"result", a / b}};
        }
        throw std::invalid_argument("Unsupported operator: " + op);
    });

    register_tool("word_count", [](const Value& args) -> Value {
        std::string text = args.value("text", "");
        size_t count = 0;
        bool in_word = false;
        for (char c : text) {
            bool space = std::isspace(static_cast<unsigned char>(c)) != 0;
            if (!space && !in_word) ++count;
            in_word = !space;
        }
        return Value{{"count", count}};
    });
}

bool ToolRegistry::unregister_tool(const std::string& name) {
    std::unique_lock lock(mutex_);
    return tools_.erase(name) > 0;
}

bool ToolRegistry::has_tool(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return tools_.count(name) > 0;
}

Value ToolRegistry::call_tool(const std::string& name, const Value& args) const {
    Tool tool;
    {
        std::shared_lock lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            throw std::runtime_error("Tool not found: " + name);
        }
        tool = it->second;
    }
    return tool(args);
}

std::vector<std::string> ToolRegistry::list_tools() const {
    std::vector<std::string> names;
    {
        std::shared_lock lock(mutex_);
        names.reserve(tools_.size());
        for (const auto& [name, _] : tools_) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace agentgraph
