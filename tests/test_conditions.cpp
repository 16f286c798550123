#include <catch2/catch_test_macros.hpp>
#include "core/types/errors.h"
#include "modules/conditions/conditions.h"

using namespace agentgraph;
using Op = SimpleCondition::Op;

namespace {

WorkflowState with_data(Value data) {
    WorkflowState state;
    state.data = std::move(data);
    return state;
}

bool eval(const Condition& condition, const WorkflowState& state) {
    return condition.evaluate(ExecutionContext::background(), state);
}

} // namespace

TEST_CASE("SimpleCondition comparisons", "[conditions]") {
    auto state = with_data({{"score", 7}, {"name", "bob"}, {"tags", {"a", "b"}}, {"user", {{"tier", "gold"}}},
                            {"count", "12"}});

    REQUIRE(eval(SimpleCondition("score", Op::EQ, 7), state));
    REQUIRE(eval(SimpleCondition("score", Op::EQ, 7.0), state));
    REQUIRE(eval(SimpleCondition("score", Op::NE, 8), state));
    REQUIRE(eval(SimpleCondition("score", Op::GT, 5), state));
    REQUIRE_FALSE(eval(SimpleCondition("score", Op::LT, 5), state));
    REQUIRE(eval(SimpleCondition("score", Op::GTE, 7), state));
    REQUIRE(eval(SimpleCondition("score", Op::LTE, 7), state));
    REQUIRE(eval(SimpleCondition("count", Op::GT, 10), state));
    REQUIRE(eval(SimpleCondition("name", Op::LT, "carl"), state));
    REQUIRE(eval(SimpleCondition("name", Op::CONTAINS, "o"), state));
    REQUIRE(eval(SimpleCondition("tags", Op::CONTAINS, "b"), state));
    REQUIRE_FALSE(eval(SimpleCondition("tags", Op::CONTAINS, "z"), state));
    REQUIRE(eval(SimpleCondition("user", Op::CONTAINS, "tier"), state));
    REQUIRE(eval(SimpleCondition("user.tier", Op::EQ, "gold"), state));
}

TEST_CASE("SimpleCondition on missing fields", "[conditions]") {
    auto state = with_data({{"present", nullptr}});

    REQUIRE(eval(SimpleCondition("present", Op::EXISTS), state));
    REQUIRE_FALSE(eval(SimpleCondition("absent", Op::EXISTS), state));
    REQUIRE(eval(SimpleCondition("absent", Op::NOT_EXISTS), state));
    REQUIRE(eval(SimpleCondition("user.tier", Op::NOT_EXISTS), state));
    REQUIRE_THROWS_AS(eval(SimpleCondition("absent", Op::EQ, 1), state), std::runtime_error);
}

TEST_CASE("SimpleCondition rejects incomparable values", "[conditions]") {
    auto state = with_data({{"flag", true}, {"n", 3}});
    REQUIRE_THROWS_AS(eval(SimpleCondition("flag", Op::GT, 1), state), std::runtime_error);
    REQUIRE_THROWS_AS(eval(SimpleCondition("n", Op::CONTAINS, "x"), state), std::runtime_error);
    REQUIRE_THROWS_AS(SimpleCondition("", Op::EQ, 1), ValidationError);
}

TEST_CASE("SimpleCondition operator names", "[conditions]") {
    REQUIRE(SimpleCondition::parse_op("==") == Op::EQ);
    REQUIRE(SimpleCondition::parse_op("not_equals") == Op::NE);
    REQUIRE(SimpleCondition::parse_op(">=") == Op::GTE);
    REQUIRE(SimpleCondition::parse_op("contains") == Op::CONTAINS);
    REQUIRE_THROWS_AS(SimpleCondition::parse_op("~="), ValidationError);
    REQUIRE(SimpleCondition("score", Op::GT, 3).description() == "score gt 3");
    REQUIRE(SimpleCondition("score", Op::EXISTS).description() == "score exists");
}

TEST_CASE("Composite conditions", "[conditions]") {
    auto state = with_data({{"a", 1}, {"b", 2}});
    auto a_is_1 = std::make_shared<SimpleCondition>("a", Op::EQ, 1);
    auto b_is_3 = std::make_shared<SimpleCondition>("b", Op::EQ, 3);
    auto missing = std::make_shared<SimpleCondition>("zzz", Op::EQ, 1);

    REQUIRE_FALSE(eval(AndCondition({a_is_1, b_is_3}), state));
    REQUIRE(eval(OrCondition({b_is_3, a_is_1}), state));
    REQUIRE(eval(NotCondition(b_is_3), state));
    REQUIRE(eval(AndCondition(std::vector<ConditionPtr>{}), state));
    REQUIRE_FALSE(eval(OrCondition(std::vector<ConditionPtr>{}), state));

    // Short-circuiting never reaches the failing operand.
    REQUIRE_FALSE(eval(AndCondition({b_is_3, missing}), state));
    REQUIRE(eval(OrCondition({a_is_1, missing}), state));
    REQUIRE_THROWS_AS(eval(AndCondition({a_is_1, missing}), state), std::runtime_error);

    REQUIRE(AndCondition({a_is_1, b_is_3}).description() == "a eq 1 and b eq 3");
    REQUIRE_THROWS_AS(NotCondition(nullptr), ValidationError);
    REQUIRE_THROWS_AS(AndCondition({a_is_1, nullptr}), ValidationError);
}

TEST_CASE("Function and constant conditions", "[conditions]") {
    auto state = with_data({{"n", 4}});
    FunctionCondition even("n is even", [](const ExecutionContext&, const WorkflowState& s) {
        return s.data.at("n").get<int>() % 2 == 0;
    });
    REQUIRE(eval(even, state));
    REQUIRE(even.description() == "n is even");
    REQUIRE(eval(AlwaysTrueCondition(), state));
    REQUIRE_FALSE(eval(AlwaysFalseCondition(), state));
    REQUIRE_THROWS_AS(FunctionCondition("empty", nullptr), ValidationError);
}

TEST_CASE("Template conditions evaluate inja expressions", "[conditions]") {
    auto state = with_data({{"score", 5}, {"tier", "gold"}});
    state.metadata = {{"source", "api"}};

    REQUIRE(eval(TemplateCondition("score >= 3"), state));
    REQUIRE(eval(TemplateCondition("{{ tier == \"gold\" and score < 10 }}"), state));
    REQUIRE_FALSE(eval(TemplateCondition("score > 9"), state));
    REQUIRE(eval(TemplateCondition("metadata.source == \"api\""), state));
    REQUIRE(TemplateCondition("score >= 3").description() == "when: score >= 3");
    REQUIRE_THROWS_AS(TemplateCondition(""), ValidationError);
}

TEST_CASE("find_field resolves dotted paths", "[conditions]") {
    Value data = {{"a", {{"b", {{"c", 1}}}}}};
    REQUIRE(find_field(data, "a.b.c") != nullptr);
    REQUIRE(*find_field(data, "a.b.c") == 1);
    REQUIRE(find_field(data, "a.x") == nullptr);
    REQUIRE(find_field(data, "a.b.c.d") == nullptr);
}
