#include <gtest/gtest.h>
#include "../validation/rule.h"
#include <qb/json.h>

#include <stdexcept>

using namespace qb::swagger::validation;

// --- Data type names ---

TEST(SchemaRuleTest, DataTypeNamesRoundTrip) {
    EXPECT_EQ(parse_data_type("string"), DataType::STRING);
    EXPECT_EQ(parse_data_type("integer"), DataType::INTEGER);
    EXPECT_EQ(parse_data_type("number"), DataType::NUMBER);
    EXPECT_EQ(parse_data_type("boolean"), DataType::BOOLEAN);
    EXPECT_EQ(parse_data_type("object"), DataType::OBJECT);
    EXPECT_EQ(parse_data_type("array"), DataType::ARRAY);
    EXPECT_EQ(parse_data_type("null"), DataType::NUL);
    EXPECT_EQ(data_type_to_string(DataType::NUL), "null");
    EXPECT_THROW((void) parse_data_type("uuid"), std::invalid_argument);
}

// --- TypeRule ---

TEST(SchemaRuleTest, TypeRuleChecksJsonKinds) {
    auto int_rule = TypeRule::from_schema("integer");
    EXPECT_TRUE(int_rule.validate(qb::json(42)));
    EXPECT_FALSE(int_rule.validate(qb::json(4.2)));
    EXPECT_FALSE(int_rule.validate(qb::json("42")));
    EXPECT_EQ(int_rule.predicate(), "integer");

    auto num_rule = TypeRule::from_schema("number");
    EXPECT_TRUE(num_rule.validate(qb::json(42)));
    EXPECT_TRUE(num_rule.validate(qb::json(4.2)));
    EXPECT_FALSE(num_rule.validate(qb::json(true)));

    auto obj_rule = TypeRule::from_schema("object");
    EXPECT_TRUE(obj_rule.validate(qb::json::object()));
    EXPECT_FALSE(obj_rule.validate(qb::json::array()));
}

TEST(SchemaRuleTest, TypeRuleAcceptsUnionOfTypes) {
    auto rule = TypeRule::from_schema(qb::json::parse(R"(["string", "null"])"));
    EXPECT_TRUE(rule.validate(qb::json("x")));
    EXPECT_TRUE(rule.validate(qb::json(nullptr)));
    EXPECT_FALSE(rule.validate(qb::json(1)));
    EXPECT_TRUE(rule.accepts(DataType::STRING));
    EXPECT_FALSE(rule.accepts(DataType::INTEGER));
    EXPECT_EQ(rule.predicate(), "string or null");
}

TEST(SchemaRuleTest, TypeRuleRejectsMalformedKeyword) {
    EXPECT_THROW((void) TypeRule::from_schema(qb::json(3)), std::invalid_argument);
    EXPECT_THROW((void) TypeRule::from_schema(qb::json::parse(R"(["string", 3])")), std::invalid_argument);
    EXPECT_THROW(TypeRule(std::vector<DataType>{}), std::invalid_argument);
}

// --- Primitive rules ---

TEST(SchemaRuleTest, LengthRules) {
    MinLengthRule min_rule(3);
    EXPECT_TRUE(min_rule.validate(qb::json("abc")));
    EXPECT_FALSE(min_rule.validate(qb::json("ab")));
    EXPECT_TRUE(min_rule.validate(qb::json(1))); // only applies to strings
    EXPECT_EQ(min_rule.predicate(), "minLength 3");

    MaxLengthRule max_rule(2);
    EXPECT_TRUE(max_rule.validate(qb::json("ab")));
    EXPECT_FALSE(max_rule.validate(qb::json("abc")));
    EXPECT_EQ(max_rule.predicate(), "maxLength 2");
}

TEST(SchemaRuleTest, PatternRuleIsUnanchored) {
    PatternRule rule("[0-9]+");
    EXPECT_TRUE(rule.validate(qb::json("abc123")));
    EXPECT_FALSE(rule.validate(qb::json("abc")));
    EXPECT_EQ(rule.predicate(), "pattern [0-9]+");

    PatternRule anchored("^[a-z]+$");
    EXPECT_FALSE(anchored.validate(qb::json("abc1")));

    EXPECT_THROW(PatternRule("[unclosed"), std::invalid_argument);
}

TEST(SchemaRuleTest, NumericBounds) {
    MinimumRule min_rule(qb::json(1));
    EXPECT_TRUE(min_rule.validate(qb::json(1)));
    EXPECT_FALSE(min_rule.validate(qb::json(0.5)));
    EXPECT_EQ(min_rule.predicate(), "minimum 1");

    MinimumRule exclusive_min(qb::json(1), true);
    EXPECT_FALSE(exclusive_min.validate(qb::json(1)));
    EXPECT_TRUE(exclusive_min.validate(qb::json(2)));
    EXPECT_EQ(exclusive_min.predicate(), "exclusiveMinimum 1");

    MaximumRule max_rule(qb::json(10));
    EXPECT_TRUE(max_rule.validate(qb::json(10)));
    EXPECT_FALSE(max_rule.validate(qb::json(11)));
    EXPECT_TRUE(max_rule.validate(qb::json("11"))); // only applies to numbers

    EXPECT_THROW(MinimumRule(qb::json("1")), std::invalid_argument);
}

TEST(SchemaRuleTest, EnumRule) {
    EnumRule rule(qb::json::parse(R"(["red", "green", 3])"));
    EXPECT_TRUE(rule.validate(qb::json("red")));
    EXPECT_TRUE(rule.validate(qb::json(3)));
    EXPECT_FALSE(rule.validate(qb::json("blue")));
    EXPECT_EQ(rule.predicate(), "enum [\"red\",\"green\",3]");

    EXPECT_THROW(EnumRule(qb::json("red")), std::invalid_argument);
}

TEST(SchemaRuleTest, ArrayRules) {
    const auto two = qb::json::parse("[1, 2]");
    const auto dup = qb::json::parse("[1, 1]");

    EXPECT_TRUE(MinItemsRule(2).validate(two));
    EXPECT_FALSE(MinItemsRule(3).validate(two));
    EXPECT_TRUE(MaxItemsRule(2).validate(two));
    EXPECT_FALSE(MaxItemsRule(1).validate(two));
    EXPECT_TRUE(UniqueItemsRule().validate(two));
    EXPECT_FALSE(UniqueItemsRule().validate(dup));
}

// --- build_rules ---

TEST(SchemaRuleTest, BuildRulesCollectsKeywordsButNotType) {
    auto rules = build_rules(qb::json::parse(R"({
        "type": "string", "minLength": 1, "maxLength": 5, "pattern": "^a", "enum": ["ab", "abc"]
    })"));
    ASSERT_EQ(rules.size(), 4u);
    EXPECT_EQ(rules[0]->rule_name(), "minLength");
    EXPECT_EQ(rules[1]->rule_name(), "maxLength");
    EXPECT_EQ(rules[2]->rule_name(), "pattern");
    EXPECT_EQ(rules[3]->rule_name(), "enum");
}

TEST(SchemaRuleTest, BuildRulesHandlesBothExclusiveForms) {
    auto draft4 = build_rules(qb::json::parse(R"({"minimum": 0, "exclusiveMinimum": true})"));
    ASSERT_EQ(draft4.size(), 1u);
    EXPECT_EQ(draft4[0]->rule_name(), "exclusiveMinimum");
    EXPECT_FALSE(draft4[0]->validate(qb::json(0)));

    auto draft6 = build_rules(qb::json::parse(R"({"exclusiveMaximum": 10})"));
    ASSERT_EQ(draft6.size(), 1u);
    EXPECT_EQ(draft6[0]->rule_name(), "exclusiveMaximum");
    EXPECT_FALSE(draft6[0]->validate(qb::json(10)));
    EXPECT_TRUE(draft6[0]->validate(qb::json(9)));
}

TEST(SchemaRuleTest, BuildRulesRejectsMalformedKeywords) {
    EXPECT_THROW((void) build_rules(qb::json::parse(R"({"minLength": -1})")), std::invalid_argument);
    EXPECT_THROW((void) build_rules(qb::json::parse(R"({"pattern": 3})")), std::invalid_argument);
    EXPECT_TRUE(build_rules(qb::json(true)).empty());
}
