/**
 * @file qbm/swagger/validation/rule.cpp
 * @brief Implementation of the primitive schema rules.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#include "./rule.h"
#include "../utility.h"
#include <qb/system/container/unordered_map.h>
#include <algorithm>
#include <stdexcept>

namespace qb::swagger::validation {

    DataType parse_data_type(const std::string &name) {
        if (name == "string") return DataType::STRING;
        if (name == "integer") return DataType::INTEGER;
        if (name == "number") return DataType::NUMBER;
        if (name == "boolean") return DataType::BOOLEAN;
        if (name == "object") return DataType::OBJECT;
        if (name == "array") return DataType::ARRAY;
        if (name == "null") return DataType::NUL;
        throw std::invalid_argument("Unknown schema type: '" + name + "'");
    }

    std::string data_type_to_string(DataType dt) noexcept {
        switch (dt) {
            case DataType::STRING: return "string";
            case DataType::INTEGER: return "integer";
            case DataType::NUMBER: return "number";
            case DataType::BOOLEAN: return "boolean";
            case DataType::OBJECT: return "object";
            case DataType::ARRAY: return "array";
            case DataType::NUL: return "null";
            default: return "unknown";
        }
    }

    TypeRule::TypeRule(std::vector<DataType> accepted) : _accepted(std::move(accepted)) {
        if (_accepted.empty())
            throw std::invalid_argument("TypeRule requires at least one accepted type.");
    }

    TypeRule TypeRule::from_schema(const qb::json &type_keyword) {
        std::vector<DataType> accepted;
        if (type_keyword.is_string()) {
            accepted.push_back(parse_data_type(type_keyword.get<std::string>()));
        } else if (type_keyword.is_array()) {
            for (const auto &item : type_keyword) {
                if (!item.is_string())
                    throw std::invalid_argument("Schema 'type' array must contain type names.");
                accepted.push_back(parse_data_type(item.get<std::string>()));
            }
        } else {
            throw std::invalid_argument("Schema 'type' must be a string or an array of strings.");
        }
        return TypeRule(std::move(accepted));
    }

    bool TypeRule::accepts(DataType dt) const {
        return std::find(_accepted.begin(), _accepted.end(), dt) != _accepted.end();
    }

    bool TypeRule::validate(const qb::json &value) const {
        for (auto dt : _accepted) {
            bool valid = false;
            switch (dt) {
                case DataType::STRING: valid = value.is_string();
                    break;
                case DataType::INTEGER: valid = value.is_number_integer();
                    break;
                case DataType::NUMBER: valid = value.is_number();
                    break;
                case DataType::BOOLEAN: valid = value.is_boolean();
                    break;
                case DataType::OBJECT: valid = value.is_object();
                    break;
                case DataType::ARRAY: valid = value.is_array();
                    break;
                case DataType::NUL: valid = value.is_null();
                    break;
            }
            if (valid)
                return true;
        }
        return false;
    }

    std::string TypeRule::predicate() const {
        std::string out;
        for (auto dt : _accepted) {
            if (!out.empty())
                out += " or ";
            out += data_type_to_string(dt);
        }
        return out;
    }

    bool MinLengthRule::validate(const qb::json &value) const {
        if (!value.is_string())
            return true;
        return value.get<std::string>().length() >= _min_length;
    }

    bool MaxLengthRule::validate(const qb::json &value) const {
        if (!value.is_string())
            return true;
        return value.get<std::string>().length() <= _max_length;
    }

    PatternRule::PatternRule(std::string pattern_str) : _pattern_str(std::move(pattern_str)) {
        try {
            _regex = std::regex(_pattern_str, std::regex_constants::ECMAScript | std::regex_constants::optimize);
        } catch (const std::regex_error &e) {
            throw std::invalid_argument("Invalid regex pattern in schema: '" + _pattern_str + "'. Error: " + e.what());
        }
    }

    bool PatternRule::validate(const qb::json &value) const {
        if (!value.is_string())
            return true;
        // JSON Schema patterns are not anchored
        return std::regex_search(value.get<std::string>(), _regex);
    }

    MinimumRule::MinimumRule(qb::json min_val, bool exclusive)
        : _minimum(std::move(min_val)), _exclusive(exclusive) {
        if (!_minimum.is_number())
            throw std::invalid_argument("MinimumRule requires a numeric bound.");
    }

    bool MinimumRule::validate(const qb::json &value) const {
        if (!value.is_number())
            return true;
        const double num_val = value.get<double>();
        const double bound = _minimum.get<double>();
        return _exclusive ? num_val > bound : num_val >= bound;
    }

    MaximumRule::MaximumRule(qb::json max_val, bool exclusive)
        : _maximum(std::move(max_val)), _exclusive(exclusive) {
        if (!_maximum.is_number())
            throw std::invalid_argument("MaximumRule requires a numeric bound.");
    }

    bool MaximumRule::validate(const qb::json &value) const {
        if (!value.is_number())
            return true;
        const double num_val = value.get<double>();
        const double bound = _maximum.get<double>();
        return _exclusive ? num_val < bound : num_val <= bound;
    }

    EnumRule::EnumRule(qb::json allowed_values) : _allowed_values(std::move(allowed_values)) {
        if (!_allowed_values.is_array()) {
            throw std::invalid_argument("EnumRule requires an array of allowed values.");
        }
    }

    bool EnumRule::validate(const qb::json &value) const {
        for (const auto &allowed_val : _allowed_values) {
            if (value == allowed_val)
                return true;
        }
        return false;
    }

    bool MinItemsRule::validate(const qb::json &value) const {
        if (!value.is_array())
            return true;
        return value.size() >= _min_items;
    }

    bool MaxItemsRule::validate(const qb::json &value) const {
        if (!value.is_array())
            return true;
        return value.size() <= _max_items;
    }

    bool UniqueItemsRule::validate(const qb::json &value) const {
        if (!value.is_array())
            return true;
        // Invalid UTF-8 renders lossily, so equal text only marks candidates.
        qb::unordered_map<std::string, std::vector<const qb::json *>> seen;
        for (const auto &item : value) {
            auto &candidates = seen[utility::dump(item)];
            for (const auto *other : candidates) {
                if (*other == item)
                    return false;
            }
            candidates.push_back(&item);
        }
        return true;
    }

    namespace {
        std::size_t size_keyword(const qb::json &schema, const char *keyword) {
            const auto &v = schema.at(keyword);
            if (!v.is_number_integer() || v.get<long long>() < 0)
                throw std::invalid_argument(std::string("Schema '") + keyword + "' must be a non-negative integer.");
            return static_cast<std::size_t>(v.get<long long>());
        }

        bool flag_keyword(const qb::json &schema, const char *keyword) {
            auto it = schema.find(keyword);
            return it != schema.end() && it->is_boolean() && it->get<bool>();
        }
    } // namespace

    RuleList build_rules(const qb::json &schema) {
        RuleList rules;
        if (!schema.is_object())
            return rules;

        if (schema.contains("minLength"))
            rules.push_back(std::make_unique<MinLengthRule>(size_keyword(schema, "minLength")));
        if (schema.contains("maxLength"))
            rules.push_back(std::make_unique<MaxLengthRule>(size_keyword(schema, "maxLength")));
        if (schema.contains("pattern")) {
            const auto &p = schema.at("pattern");
            if (!p.is_string())
                throw std::invalid_argument("Schema 'pattern' must be a string.");
            rules.push_back(std::make_unique<PatternRule>(p.get<std::string>()));
        }

        if (schema.contains("minimum"))
            rules.push_back(std::make_unique<MinimumRule>(schema.at("minimum"),
                                                          flag_keyword(schema, "exclusiveMinimum")));
        if (schema.contains("exclusiveMinimum") && schema.at("exclusiveMinimum").is_number())
            rules.push_back(std::make_unique<MinimumRule>(schema.at("exclusiveMinimum"), true));
        if (schema.contains("maximum"))
            rules.push_back(std::make_unique<MaximumRule>(schema.at("maximum"),
                                                          flag_keyword(schema, "exclusiveMaximum")));
        if (schema.contains("exclusiveMaximum") && schema.at("exclusiveMaximum").is_number())
            rules.push_back(std::make_unique<MaximumRule>(schema.at("exclusiveMaximum"), true));

        if (schema.contains("enum"))
            rules.push_back(std::make_unique<EnumRule>(schema.at("enum")));

        if (schema.contains("minItems"))
            rules.push_back(std::make_unique<MinItemsRule>(size_keyword(schema, "minItems")));
        if (schema.contains("maxItems"))
            rules.push_back(std::make_unique<MaxItemsRule>(size_keyword(schema, "maxItems")));
        if (flag_keyword(schema, "uniqueItems"))
            rules.push_back(std::make_unique<UniqueItemsRule>());

        return rules;
    }

} // namespace qb::swagger::validation
