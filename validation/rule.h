/**
 * @file qbm/swagger/validation/rule.h
 * @brief Primitive schema rules checked by the coercer on leaf values.
 *
 * Each rule maps one JSON Schema keyword (type, minLength, pattern, enum, ...)
 * to a predicate. A violated rule is reported by the coercer as a leaf
 * mismatch whose text is the rule's `predicate()`, e.g. `not minLength 3: "ab"`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <memory>
#include <regex>
#include <string>
#include <vector>
#include <qb/json.h>

namespace qb::swagger::validation {

enum class DataType {
    STRING,
    INTEGER,
    NUMBER,
    BOOLEAN,
    OBJECT,
    ARRAY,
    NUL
};

/**
 * @brief Parses a JSON Schema type name.
 * @throws std::invalid_argument for an unknown type name.
 */
[[nodiscard]] DataType parse_data_type(const std::string &name);

[[nodiscard]] std::string data_type_to_string(DataType dt) noexcept;

/**
 * @brief Interface of a primitive validation rule.
 */
class IRule {
public:
    virtual ~IRule() = default;

    /**
     * @brief Checks a value against the rule.
     * @return True if the rule holds or does not apply to the value's type.
     */
    virtual bool validate(const qb::json &value) const = 0;

    /// Predicate text reported when the rule is violated.
    virtual std::string predicate() const = 0;

    /// JSON Schema keyword implemented by the rule.
    virtual std::string rule_name() const = 0;
};

using RuleList = std::vector<std::unique_ptr<IRule>>;

/**
 * @brief `type` keyword; accepts any of one or more data types.
 */
class TypeRule : public IRule {
private:
    std::vector<DataType> _accepted;
public:
    explicit TypeRule(std::vector<DataType> accepted);

    /**
     * @brief Builds the rule from the value of a `type` keyword.
     * @param type_keyword A type name or an array of type names.
     * @throws std::invalid_argument if the keyword is malformed.
     */
    static TypeRule from_schema(const qb::json &type_keyword);

    bool validate(const qb::json &value) const override;
    std::string predicate() const override;
    std::string rule_name() const override { return "type"; }

    [[nodiscard]] bool accepts(DataType dt) const;
};

class MinLengthRule : public IRule {
private:
    std::size_t _min_length;
public:
    explicit MinLengthRule(std::size_t min_len) : _min_length(min_len) {}
    bool validate(const qb::json &value) const override;
    std::string predicate() const override { return "minLength " + std::to_string(_min_length); }
    std::string rule_name() const override { return "minLength"; }
};

class MaxLengthRule : public IRule {
private:
    std::size_t _max_length;
public:
    explicit MaxLengthRule(std::size_t max_len) : _max_length(max_len) {}
    bool validate(const qb::json &value) const override;
    std::string predicate() const override { return "maxLength " + std::to_string(_max_length); }
    std::string rule_name() const override { return "maxLength"; }
};

class PatternRule : public IRule {
private:
    std::string _pattern_str;
    std::regex _regex;
public:
    explicit PatternRule(std::string pattern_str);
    bool validate(const qb::json &value) const override;
    std::string predicate() const override { return "pattern " + _pattern_str; }
    std::string rule_name() const override { return "pattern"; }
};

class MinimumRule : public IRule {
private:
    qb::json _minimum;
    bool _exclusive;
public:
    MinimumRule(qb::json min_val, bool exclusive = false);
    bool validate(const qb::json &value) const override;
    std::string predicate() const override { return rule_name() + " " + _minimum.dump(); }
    std::string rule_name() const override { return _exclusive ? "exclusiveMinimum" : "minimum"; }
};

class MaximumRule : public IRule {
private:
    qb::json _maximum;
    bool _exclusive;
public:
    MaximumRule(qb::json max_val, bool exclusive = false);
    bool validate(const qb::json &value) const override;
    std::string predicate() const override { return rule_name() + " " + _maximum.dump(); }
    std::string rule_name() const override { return _exclusive ? "exclusiveMaximum" : "maximum"; }
};

class EnumRule : public IRule {
private:
    qb::json _allowed_values;
public:
    explicit EnumRule(qb::json allowed_values);
    bool validate(const qb::json &value) const override;
    std::string predicate() const override { return "enum " + _allowed_values.dump(); }
    std::string rule_name() const override { return "enum"; }
};

class MinItemsRule : public IRule {
private:
    std::size_t _min_items;
public:
    explicit MinItemsRule(std::size_t min_val) : _min_items(min_val) {}
    bool validate(const qb::json &value) const override;
    std::string predicate() const override { return "minItems " + std::to_string(_min_items); }
    std::string rule_name() const override { return "minItems"; }
};

class MaxItemsRule : public IRule {
private:
    std::size_t _max_items;
public:
    explicit MaxItemsRule(std::size_t max_val) : _max_items(max_val) {}
    bool validate(const qb::json &value) const override;
    std::string predicate() const override { return "maxItems " + std::to_string(_max_items); }
    std::string rule_name() const override { return "maxItems"; }
};

class UniqueItemsRule : public IRule {
public:
    bool validate(const qb::json &value) const override;
    std::string predicate() const override { return "uniqueItems"; }
    std::string rule_name() const override { return "uniqueItems"; }
};

/**
 * @brief Builds the primitive rules declared by a schema node, `type` excluded.
 *
 * Both the numeric (draft 6) and the boolean (draft 4) forms of
 * `exclusiveMinimum` / `exclusiveMaximum` are understood.
 *
 * @throws std::invalid_argument if a keyword carries a malformed value.
 */
[[nodiscard]] RuleList build_rules(const qb::json &schema);

} // namespace qb::swagger::validation
