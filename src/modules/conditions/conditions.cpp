#include "modules/conditions/conditions.h"
#include "common/utils/template_renderer.h"
#include "core/types/errors.h"
#include <stdexcept>

namespace agentgraph {

namespace {

std::optional<double> as_number(const Value& v) {
    if (v.is_number()) {
        return v.get<double>();
    }
    if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        try {
            size_t consumed = 0;
            double d = std::stod(s, &consumed);
            if (consumed == s.size()) {
                return d;
            }
        } catch (const std::logic_error&) {
            // not numeric
        }
    }
    return std::nullopt;
}

// -1, 0, 1. Numbers (or numeric strings) compare numerically, strings lexically.
int compare(const Value& lhs, const Value& rhs, const std::string& field) {
    auto a = as_number(lhs);
    auto b = as_number(rhs);
    if (a && b) {
        return *a < *b ? -1 : (*a > *b ? 1 : 0);
    }
    if (lhs.is_string() && rhs.is_string()) {
        int c = lhs.get_ref<const std::string&>().compare(rhs.get_ref<const std::string&>());
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    throw std::runtime_error("cannot compare field " + field + " (" + lhs.type_name() +
                             ") with " + rhs.type_name());
}

bool contains(const Value& haystack, const Value& needle, const std::string& field) {
    if (haystack.is_string()) {
        if (!needle.is_string()) {
            throw std::runtime_error("contains on string field " + field + " requires a string value");
        }
        return haystack.get_ref<const std::string&>().find(needle.get_ref<const std::string&>()) != std::string::npos;
    }
    if (haystack.is_array()) {
        for (const auto& item : haystack) {
            if (item == needle) return true;
        }
        return false;
    }
    if (haystack.is_object()) {
        if (!needle.is_string()) {
            throw std::runtime_error("contains on object field " + field + " requires a string key");
        }
        return haystack.contains(needle.get<std::string>());
    }
    throw std::runtime_error(std::string("contains is not supported for field ") + field +
                             " of type " + haystack.type_name());
}

std::string join_descriptions(const std::vector<ConditionPtr>& conditions, const char* sep) {
    std::string out = "(";
    for (size_t i = 0; i < conditions.size(); ++i) {
        if (i > 0) out += sep;
        out += conditions[i]->description();
    }
    return out + ")";
}

void require_non_null(const std::vector<ConditionPtr>& conditions, const char* kind) {
    for (const auto& c : conditions) {
        if (!c) {
            throw ValidationError(std::string(kind) + " condition must not contain null entries");
        }
    }
}

} // namespace

const Value* find_field(const Value& data, const std::string& path) {
    const Value* current = &data;
    size_t start = 0;
    while (true) {
        size_t dot = path.find('.', start);
        std::string key = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(key);
        if (it == current->end()) {
            return nullptr;
        }
        current = &*it;
        if (dot == std::string::npos) {
            return current;
        }
        start = dot + 1;
    }
}

// ————————————————————————
// SimpleCondition
// ————————————————————————

SimpleCondition::SimpleCondition(std::string field, Op op, Value value)
    : field_(std::move(field)), op_(op), value_(std::move(value)) {
    if (field_.empty()) {
        throw ValidationError("condition field must not be empty");
    }
}

SimpleCondition::Op SimpleCondition::parse_op(const std::string& name) {
    if (name == "exists") return Op::EXISTS;
    if (name == "not_exists") return Op::NOT_EXISTS;
    if (name == "eq" || name == "==" || name == "equals") return Op::EQ;
    if (name == "ne" || name == "!=" || name == "not_equals") return Op::NE;
    if (name == "gt" || name == ">" || name == "greater") return Op::GT;
    if (name == "lt" || name == "<" || name == "less") return Op::LT;
    if (name == "gte" || name == ">=") return Op::GTE;
    if (name == "lte" || name == "<=") return Op::LTE;
    if (name == "contains") return Op::CONTAINS;
    throw ValidationError("unknown condition operator: " + name);
}

std::string SimpleCondition::op_name(Op op) {
    switch (op) {
        case Op::EXISTS: return "exists";
        case Op::NOT_EXISTS: return "not_exists";
        case Op::EQ: return "eq";
        case Op::NE: return "ne";
        case Op::GT: return "gt";
        case Op::LT: return "lt";
        case Op::GTE: return "gte";
        case Op::LTE: return "lte";
        case Op::CONTAINS: return "contains";
    }
    return "unknown";
}

bool SimpleCondition::evaluate(const ExecutionContext&, const WorkflowState& state) const {
    const Value* field = find_field(state.data, field_);
    if (field == nullptr) {
        if (op_ == Op::EXISTS) return false;
        if (op_ == Op::NOT_EXISTS) return true;
        throw std::runtime_error("field not found: " + field_);
    }

    switch (op_) {
        case Op::EXISTS: return true;
        case Op::NOT_EXISTS: return false;
        case Op::EQ: return *field == value_;
        case Op::NE: return *field != value_;
        case Op::GT: return compare(*field, value_, field_) > 0;
        case Op::LT: return compare(*field, value_, field_) < 0;
        case Op::GTE: return compare(*field, value_, field_) >= 0;
        case Op::LTE: return compare(*field, value_, field_) <= 0;
        case Op::CONTAINS: return contains(*field, value_, field_);
    }
    return false;
}

std::string SimpleCondition::description() const {
    if (op_ == Op::EXISTS || op_ == Op::NOT_EXISTS) {
        return field_ + " " + op_name(op_);
    }
    return field_ + " " + op_name(op_) + " " + value_.dump();
}

// ————————————————————————
// FunctionCondition
// ————————————————————————

FunctionCondition::FunctionCondition(std::string description, Predicate predicate)
    : description_(std::move(description)), predicate_(std::move(predicate)) {
    if (!predicate_) {
        throw ValidationError("function condition requires a predicate");
    }
}

bool FunctionCondition::evaluate(const ExecutionContext& ctx, const WorkflowState& state) const {
    return predicate_(ctx, state);
}

// ————————————————————————
// Composites
// ————————————————————————

AndCondition::AndCondition(std::vector<ConditionPtr> conditions) : conditions_(std::move(conditions)) {
    require_non_null(conditions_, "and");
}

bool AndCondition::evaluate(const ExecutionContext& ctx, const WorkflowState& state) const {
    for (size_t i = 0; i < conditions_.size(); ++i) {
        try {
            if (!conditions_[i]->evaluate(ctx, state)) {
                return false;
            }
        } catch (const std::exception& e) {
            throw std::runtime_error("and condition " + std::to_string(i) + " failed: " + e.what());
        }
    }
    return true;
}

std::string AndCondition::description() const {
    return join_descriptions(conditions_, " and ");
}

OrCondition::OrCondition(std::vector<ConditionPtr> conditions) : conditions_(std::move(conditions)) {
    require_non_null(conditions_, "or");
}

bool OrCondition::evaluate(const ExecutionContext& ctx, const WorkflowState& state) const {
    for (size_t i = 0; i < conditions_.size(); ++i) {
        try {
            if (conditions_[i]->evaluate(ctx, state)) {
                return true;
            }
        } catch (const std::exception& e) {
            throw std::runtime_error("or condition " + std::to_string(i) + " failed: " + e.what());
        }
    }
    return false;
}

std::string OrCondition::description() const {
    return join_descriptions(conditions_, " or ");
}

NotCondition::NotCondition(ConditionPtr condition) : condition_(std::move(condition)) {
    if (!condition_) {
        throw ValidationError("not condition requires an inner condition");
    }
}

bool NotCondition::evaluate(const ExecutionContext& ctx, const WorkflowState& state) const {
    return !condition_->evaluate(ctx, state);
}

std::string NotCondition::description() const {
    return "not " + condition_->description();
}

// ————————————————————————
// TemplateCondition
// ————————————————————————

TemplateCondition::TemplateCondition(std::string expression) : expression_(std::move(expression)) {
    if (expression_.empty()) {
        throw ValidationError("template condition expression must not be empty");
    }
}

bool TemplateCondition::evaluate(const ExecutionContext&, const WorkflowState& state) const {
    Value context = state.data;
    if (!context.contains("metadata")) {
        context["metadata"] = state.metadata;
    }
    return InjaTemplateRenderer::evaluate(expression_, context);
}

} // namespace agentgraph
