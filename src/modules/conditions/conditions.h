#ifndef AGENTGRAPH_MODULES_CONDITIONS_CONDITIONS_H
#define AGENTGRAPH_MODULES_CONDITIONS_CONDITIONS_H

#include "core/types/node.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace agentgraph {

// Compares one field of the state data against a constant.
// `field` may be a dotted path into nested objects ("user.tier").
class SimpleCondition : public Condition {
public:
    enum class Op : uint8_t { EXISTS, NOT_EXISTS, EQ, NE, GT, LT, GTE, LTE, CONTAINS };

    // Throws ValidationError for an empty field.
    SimpleCondition(std::string field, Op op, Value value = nullptr);

    // Accepts eq/ne/gt/lt/gte/lte/contains/exists/not_exists and the aliases
    // ==, !=, >, <, >=, <=, equals, not_equals. Throws ValidationError otherwise.
    static Op parse_op(const std::string& name);
    static std::string op_name(Op op);

    bool evaluate(const ExecutionContext& ctx, const WorkflowState& state) const override;
    std::string description() const override;

    const std::string& field() const { return field_; }
    Op op() const { return op_; }
    const Value& value() const { return value_; }

private:
    std::string field_;
    Op op_;
    Value value_;
};

class FunctionCondition : public Condition {
public:
    using Predicate = std::function<bool(const ExecutionContext&, const WorkflowState&)>;

    FunctionCondition(std::string description, Predicate predicate);

    bool evaluate(const ExecutionContext& ctx, const WorkflowState& state) const override;
    std::string description() const override { return description_; }

private:
    std::string description_;
    Predicate predicate_;
};

// Short-circuit conjunction; an empty list is true.
class AndCondition : public Condition {
public:
    explicit AndCondition(std::vector<ConditionPtr> conditions);

    bool evaluate(const ExecutionContext& ctx, const WorkflowState& state) const override;
    std::string description() const override;

private:
    std::vector<ConditionPtr> conditions_;
};

// Short-circuit disjunction; an empty list is false.
class OrCondition : public Condition {
public:
    explicit OrCondition(std::vector<ConditionPtr> conditions);

    bool evaluate(const ExecutionContext& ctx, const WorkflowState& state) const override;
    std::string description() const override;

private:
    std::vector<ConditionPtr> conditions_;
};

class NotCondition : public Condition {
public:
    explicit NotCondition(ConditionPtr condition);

    bool evaluate(const ExecutionContext& ctx, const WorkflowState& state) const override;
    std::string description() const override;

private:
    ConditionPtr condition_;
};

class AlwaysTrueCondition : public Condition {
public:
    bool evaluate(const ExecutionContext&, const WorkflowState&) const override { return true; }
    std::string description() const override { return "always true"; }
};

class AlwaysFalseCondition : public Condition {
public:
    bool evaluate(const ExecutionContext&, const WorkflowState&) const override { return false; }
    std::string description() const override { return "always false"; }
};

// Inja boolean expression over {data..., "metadata": ...}, e.g. "score >= 3".
class TemplateCondition : public Condition {
public:
    explicit TemplateCondition(std::string expression);

    bool evaluate(const ExecutionContext& ctx, const WorkflowState& state) const override;
    std::string description() const override { return "when: " + expression_; }

private:
    std::string expression_;
};

// Resolves a dotted path ("a.b.c") inside a JSON object. Returns nullptr when absent.
const Value* find_field(const Value& data, const std::string& path);

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_CONDITIONS_CONDITIONS_H
