#include "common/utils/yaml_json.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <array>
#include <optional>
#include <cctype>
#include <stdexcept>

namespace agentgraph {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// YAML 1.1 booleans, without the single-letter forms so ids like "y" stay text.
std::optional<bool> as_bool(const std::string& text) {
    static const std::array<const char*, 3> truthy = {"true", "yes", "on"};
    static const std::array<const char*, 3> falsy = {"false", "no", "off"};
    const std::string s = lowercase(text);
    for (const char* t : truthy) {
        if (s == t) return true;
    }
    for (const char* f : falsy) {
        if (s == f) return false;
    }
    return std::nullopt;
}

Value plain_scalar(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    if (auto b = as_bool(text)) {
        return *b;
    }
    long long i = 0;
    if (YAML::convert<long long>::decode(node, i)) {
        return i;
    }
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d)) {
        return d;
    }
    return text;
}

} // namespace

Value yaml_to_json(const YAML::Node& node) {
    if (!node.IsDefined() || node.IsNull()) {
        return nullptr;
    }
    if (node.IsScalar()) {
        // Quoted scalars are tagged "!" and never reinterpreted.
        return node.Tag() == "!" ? Value(node.Scalar()) : plain_scalar(node);
    }
    if (node.IsSequence()) {
        Value list = Value::array();
        for (const auto& item : node) {
            list.push_back(yaml_to_json(item));
        }
        return list;
    }
    Value map = Value::object();
    for (const auto& entry : node) {
        map[entry.first.Scalar()] = yaml_to_json(entry.second);
    }
    return map;
}

Value parse_yaml(const std::string& text) {
    try {
        return yaml_to_json(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML parse error at line " + std::to_string(e.mark.line + 1) + ": " + e.msg);
    }
}

Value load_yaml_file(const std::string& path) {
    try {
        return yaml_to_json(YAML::LoadFile(path));
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Cannot open file: " + path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(path + ": YAML parse error at line " + std::to_string(e.mark.line + 1) + ": " +
                                 e.msg);
    }
}

} // namespace agentgraph
