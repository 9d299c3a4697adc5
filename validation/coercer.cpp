/**
 * @file qbm/swagger/validation/coercer.cpp
 * @brief Implementation of the schema coercer and the built-in coercion matchers.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#include "./coercer.h"
#include "./rule.h"
#include "../logger.h"
#include "../utility.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <stdexcept>
#include <string>
#include <qb/system/container/unordered_set.h>

namespace qb::swagger::validation {

namespace {

    // Accepted types of a schema node, or nullopt when the node has no `type`.
    std::optional<TypeRule> type_rule_of(const qb::json &schema) {
        auto it = schema.find("type");
        if (it == schema.end())
            return std::nullopt;
        return TypeRule::from_schema(*it);
    }

    std::optional<qb::json> parse_integer(const std::string &input_value) {
        long long val;
        auto res = std::from_chars(input_value.data(), input_value.data() + input_value.size(), val);
        if (res.ec == std::errc() && res.ptr == input_value.data() + input_value.size())
            return qb::json(val);
        return std::nullopt;
    }

    // Doubles in [-2^63, 2^63) convert to long long without overflow.
    bool fits_long_long(double d) {
        return std::isfinite(d) && d >= -9223372036854775808.0 && d < 9223372036854775808.0;
    }

    // Plain decimal text: sign, digits, fraction and exponent only. Rules out
    // the hex, "nan" and "inf" forms std::stod would otherwise accept.
    bool is_decimal_text(const std::string &input_value) {
        if (input_value.empty())
            return false;
        return std::all_of(input_value.begin(), input_value.end(), [](unsigned char c) {
            return std::isdigit(c) || c == '+' || c == '-' || c == '.' || c == 'e' || c == 'E';
        });
    }

    std::optional<qb::json> parse_number(const std::string &input_value) {
        if (!is_decimal_text(input_value))
            return std::nullopt;
        try {
            std::size_t parsed_chars_count;
            double val_double = std::stod(input_value, &parsed_chars_count);
            if (parsed_chars_count == input_value.length() && std::isfinite(val_double)) {
                if (fits_long_long(val_double)) {
                    long long val_ll = static_cast<long long>(val_double);
                    if (static_cast<double>(val_ll) == val_double)
                        return qb::json(val_ll);
                }
                return qb::json(val_double);
            }
        } catch (const std::invalid_argument &) {
            // not a number, left to the type check
        } catch (const std::out_of_range &) {
            // idem
        }
        return std::nullopt;
    }

    std::optional<qb::json> parse_boolean(const std::string &input_value) {
        const std::string lower_val = utility::to_lower(input_value);
        if (lower_val == "true") return qb::json(true);
        if (lower_val == "false") return qb::json(false);
        return std::nullopt;
    }

    class Walker {
    public:
        explicit Walker(const CoercionMatcher &matcher) : _matcher(matcher) {}

        SchemaError walk(const qb::json &schema, const qb::json &value, qb::json &out) const {
            if (schema.is_boolean()) {
                if (schema.get<bool>()) {
                    out = value;
                    return {};
                }
                return SchemaError::mismatch("nothing", value);
            }
            if (!schema.is_object())
                throw std::invalid_argument("Schema node must be an object or a boolean, got: " + schema.dump());

            qb::json current = value;
            if (_matcher) {
                if (auto converted = _matcher(schema, current))
                    current = std::move(*converted);
            }

            SchemaError error = check(schema, current, out);
            if (!error.ok()) {
                auto title = schema.find("title");
                if (title != schema.end() && title->is_string())
                    return SchemaError::named(title->get<std::string>(), std::move(error));
            }
            return error;
        }

    private:
        const CoercionMatcher &_matcher;

        SchemaError check(const qb::json &schema, const qb::json &value, qb::json &out) const {
            if (auto type_rule = type_rule_of(schema)) {
                if (!type_rule->validate(value))
                    return SchemaError::mismatch(type_rule->predicate(), value);
            }

            const bool object_keywords = schema.contains("properties")
                                         || schema.contains("required")
                                         || schema.contains("additionalProperties");
            if (object_keywords) {
                if (!value.is_object()) {
                    if (!schema.contains("type"))
                        return SchemaError::mismatch("object", value);
                } else {
                    SchemaError error = check_object(schema, value, out);
                    if (!error.ok())
                        return error;
                    return check_rules(schema, out);
                }
            }

            if (schema.contains("items")) {
                if (!value.is_array()) {
                    if (!schema.contains("type"))
                        return SchemaError::mismatch("array", value);
                } else {
                    SchemaError error = check_items(schema.at("items"), value, out);
                    if (!error.ok())
                        return error;
                    return check_rules(schema, out);
                }
            }

            out = value;
            return check_rules(schema, out);
        }

        static SchemaError check_rules(const qb::json &schema, const qb::json &value) {
            for (const auto &rule : build_rules(schema)) {
                if (!rule->validate(value))
                    return SchemaError::mismatch(rule->predicate(), value);
            }
            return {};
        }

        SchemaError check_object(const qb::json &schema, const qb::json &value, qb::json &out) const {
            static const qb::json no_properties = qb::json::object();

            const qb::json *properties = &no_properties;
            if (auto it = schema.find("properties"); it != schema.end()) {
                if (!it->is_object())
                    throw std::invalid_argument("Schema 'properties' must be an object.");
                properties = &*it;
            }

            qb::unordered_set<std::string> required;
            if (auto it = schema.find("required"); it != schema.end()) {
                if (!it->is_array())
                    throw std::invalid_argument("Schema 'required' must be an array of property names.");
                for (const auto &name : *it) {
                    if (!name.is_string())
                        throw std::invalid_argument("Schema 'required' must be an array of property names.");
                    required.insert(name.get<std::string>());
                }
            }

            // Declared properties close the object unless additionalProperties says otherwise.
            qb::json additional = schema.contains("properties") ? qb::json(false) : qb::json(true);
            if (auto it = schema.find("additionalProperties"); it != schema.end()) {
                if (!it->is_boolean() && !it->is_object())
                    throw std::invalid_argument("Schema 'additionalProperties' must be a boolean or a schema.");
                additional = *it;
            }

            SchemaError error = SchemaError::map();
            out = qb::json::object();

            for (const auto &[key, sub_schema] : properties->items()) {
                auto present = value.find(key);
                if (present == value.end()) {
                    if (required.count(key))
                        error.add(key, SchemaError::missing_key());
                    continue;
                }
                qb::json coerced;
                SchemaError child = walk(sub_schema, *present, coerced);
                if (!child.ok())
                    error.add(key, std::move(child));
                else
                    out[key] = std::move(coerced);
            }

            for (const auto &name : required) {
                if (!properties->contains(name) && !value.contains(name))
                    error.add(name, SchemaError::missing_key());
            }

            for (const auto &[key, item] : value.items()) {
                if (properties->contains(key))
                    continue;
                if (additional.is_boolean()) {
                    // a required key is declared even without a property schema
                    if (additional.get<bool>() || required.count(key))
                        out[key] = item;
                    else
                        error.add(key, SchemaError::disallowed_key());
                    continue;
                }
                qb::json coerced;
                SchemaError child = walk(additional, item, coerced);
                if (!child.ok())
                    error.add(key, std::move(child));
                else
                    out[key] = std::move(coerced);
            }

            if (error.empty())
                return {};
            return error;
        }

        SchemaError check_items(const qb::json &items, const qb::json &value, qb::json &out) const {
            SchemaError error = SchemaError::sequence();
            out = qb::json::array();
            for (const auto &item : value) {
                qb::json coerced;
                SchemaError child = walk(items, item, coerced);
                if (child.ok())
                    out.push_back(std::move(coerced));
                else
                    out.push_back(item);
                error.push_back(std::move(child));
            }
            if (!error.has_failures())
                return {};
            return error;
        }
    };

} // namespace

CoercionMatcher string_coercion_matcher() {
    return [](const qb::json &schema, const qb::json &value) -> std::optional<qb::json> {
        if (!value.is_string())
            return std::nullopt;
        auto type_rule = type_rule_of(schema);
        if (!type_rule || type_rule->accepts(DataType::STRING))
            return std::nullopt;

        const auto &input_value = value.get_ref<const std::string &>();
        if (type_rule->accepts(DataType::INTEGER)) {
            if (auto parsed = parse_integer(input_value))
                return parsed;
        }
        if (type_rule->accepts(DataType::NUMBER)) {
            if (auto parsed = parse_number(input_value))
                return parsed;
        }
        if (type_rule->accepts(DataType::BOOLEAN)) {
            if (auto parsed = parse_boolean(input_value))
                return parsed;
        }
        return std::nullopt;
    };
}

CoercionMatcher json_coercion_matcher() {
    return [](const qb::json &schema, const qb::json &value) -> std::optional<qb::json> {
        if (!value.is_number_float())
            return std::nullopt;
        auto type_rule = type_rule_of(schema);
        if (!type_rule || !type_rule->accepts(DataType::INTEGER) || type_rule->accepts(DataType::NUMBER))
            return std::nullopt;
        const double d = value.get<double>();
        if (!fits_long_long(d) || std::trunc(d) != d)
            return std::nullopt;
        return qb::json(static_cast<long long>(d));
    };
}

CoercionMatcher no_coercion() {
    return [](const qb::json &, const qb::json &) -> std::optional<qb::json> {
        return std::nullopt;
    };
}

qb::json CoercionResult::value_or_throw(Direction direction) const {
    if (!success())
        throw SchemaMismatchError(direction, mismatch());
    return value();
}

CoercionResult coerce(const qb::json &schema, const qb::json &value, const CoercionMatcher &matcher) {
    Walker walker(matcher);
    qb::json out;
    SchemaError error = walker.walk(schema, value, out);
    if (error.ok())
        return CoercionResult(std::move(out));

    LOG_SWAGGER_DEBUG("Schema mismatch: " << error.to_string());
    return CoercionResult(SchemaMismatch{schema, value, std::move(error)});
}

} // namespace qb::swagger::validation
