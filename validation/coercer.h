/**
 * @file qbm/swagger/validation/coercer.h
 * @brief Schema-driven coercion and validation of structured values.
 *
 * `coerce()` walks a schema and a value together. At every node a pluggable
 * coercion matcher may first convert the value (e.g. the string "42" into the
 * integer 42 where the schema expects an integer); the converted value is
 * then checked against the node's type, object structure, items and primitive
 * rules. The result is either the coerced value, with the original shape and
 * converted leaves, or a `SchemaMismatch` carrying the failure tree.
 *
 * Object schemas that declare `properties` are closed: keys not declared are
 * rejected unless `additionalProperties` is `true` or a schema.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <functional>
#include <optional>
#include <variant>
#include <qb/json.h>
#include "./error.h"

namespace qb::swagger::validation {

/**
 * @brief Converts a value before it is checked against a schema node.
 *
 * Receives the schema node and the raw value; returns the converted value, or
 * `std::nullopt` to leave the value unchanged.
 */
using CoercionMatcher = std::function<std::optional<qb::json>(const qb::json &schema, const qb::json &value)>;

/**
 * @brief Matcher for untyped string sources (path, query, headers, forms).
 *
 * Converts numeric strings where an integer or number is expected and
 * "true"/"false" where a boolean is expected. Strings that do not parse are
 * left unchanged and fail the type check.
 */
[[nodiscard]] CoercionMatcher string_coercion_matcher();

/**
 * @brief Matcher for JSON sources: integral floating point values become
 * integers where an integer (and not a number) is expected.
 */
[[nodiscard]] CoercionMatcher json_coercion_matcher();

/// Matcher that never converts; pure validation.
[[nodiscard]] CoercionMatcher no_coercion();

/**
 * @brief Outcome of a coercion: the coerced value or the mismatch.
 */
class CoercionResult {
public:
    explicit CoercionResult(qb::json value) : _data(std::move(value)) {}
    explicit CoercionResult(SchemaMismatch mismatch) : _data(std::move(mismatch)) {}

    [[nodiscard]] bool success() const { return std::holds_alternative<qb::json>(_data); }
    explicit operator bool() const { return success(); }

    /// Coerced value; throws std::bad_variant_access on a failed result.
    [[nodiscard]] const qb::json &value() const { return std::get<qb::json>(_data); }
    /// Mismatch; throws std::bad_variant_access on a successful result.
    [[nodiscard]] const SchemaMismatch &mismatch() const { return std::get<SchemaMismatch>(_data); }

    /**
     * @brief Returns the coerced value or raises the mismatch.
     * @throws SchemaMismatchError tagged with `direction` on a failed result.
     */
    [[nodiscard]] qb::json value_or_throw(Direction direction) const;

private:
    std::variant<qb::json, SchemaMismatch> _data;
};

/**
 * @brief Coerces and validates a value against a schema.
 *
 * @param schema JSON Schema subset node (`{}` or `true` accept anything).
 * @param value The raw value.
 * @param matcher Coercion matcher applied at each node; may be empty.
 * @return The coerced value or a `SchemaMismatch`.
 * @throws std::invalid_argument if the schema is malformed.
 */
[[nodiscard]] CoercionResult coerce(const qb::json &schema, const qb::json &value,
                                    const CoercionMatcher &matcher = {});

} // namespace qb::swagger::validation
