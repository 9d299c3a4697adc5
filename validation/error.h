/**
 * @file qbm/swagger/validation/error.h
 * @brief Defines the structured schema failure tree and the mismatch exception.
 *
 * A failed coercion produces a `SchemaError` whose shape mirrors the rejected
 * value: a map of per-key failures for objects, a sequence for arrays and a
 * leaf (type or rule mismatch, missing key, disallowed key) elsewhere. A node
 * may additionally carry the name of the schema that rejected it.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <qb/json.h>

namespace qb::swagger::validation {

/**
 * @brief One node of a schema failure tree.
 */
class SchemaError {
public:
    enum class Kind {
        NONE,           ///< No failure (placeholder for valid sequence elements).
        MISMATCH,       ///< Value failed a type check or a primitive rule.
        MISSING_KEY,    ///< A required key is absent.
        DISALLOWED_KEY, ///< A key is present that the schema does not allow.
        NAMED,          ///< Failure of a named schema; wraps exactly one child.
        MAP,            ///< Per-key failures of an object.
        SEQUENCE        ///< Per-element failures of an array.
    };

    SchemaError() = default;

    [[nodiscard]] static SchemaError mismatch(std::string expected, qb::json value);
    [[nodiscard]] static SchemaError missing_key();
    [[nodiscard]] static SchemaError disallowed_key();
    [[nodiscard]] static SchemaError named(std::string name, SchemaError inner);
    [[nodiscard]] static SchemaError map();
    [[nodiscard]] static SchemaError sequence();

    [[nodiscard]] Kind kind() const { return _kind; }
    [[nodiscard]] bool ok() const { return _kind == Kind::NONE; }

    /// Predicate text of a MISMATCH (e.g. "integer", "minLength 3").
    [[nodiscard]] const std::string &expected() const { return _text; }
    /// Schema name of a NAMED node.
    [[nodiscard]] const std::string &name() const { return _text; }
    /// Rejected value of a MISMATCH.
    [[nodiscard]] const qb::json &value() const { return _value; }

    /// Wrapped failure of a NAMED node.
    [[nodiscard]] const SchemaError &inner() const;

    /// Adds a keyed child to a MAP node.
    void add(std::string key, SchemaError child);
    /// Appends an element to a SEQUENCE node; pass a NONE error for valid elements.
    void push_back(SchemaError child);

    [[nodiscard]] std::size_t size() const { return _children.size(); }
    [[nodiscard]] bool empty() const { return _children.empty(); }
    [[nodiscard]] const std::string &key_at(std::size_t i) const { return _keys.at(i); }
    [[nodiscard]] const SchemaError &child_at(std::size_t i) const { return _children.at(i); }

    /**
     * @brief Finds the child of a MAP node by key.
     * @return Pointer to the child, or nullptr when the key carries no failure.
     */
    [[nodiscard]] const SchemaError *find(const std::string &key) const;

    /// SEQUENCE only: true when at least one element failed.
    [[nodiscard]] bool has_failures() const;

    /**
     * @brief Printable rendering of the failure.
     *
     * Leaves render as `missing-required-key`, `disallowed-key` or
     * `not <expected>: <value>`; composite nodes render as their explanation.
     */
    [[nodiscard]] std::string to_string() const;

private:
    Kind _kind = Kind::NONE;
    std::string _text;
    qb::json _value;
    std::vector<std::string> _keys;
    std::vector<SchemaError> _children;
};

/**
 * @brief Side of the exchange a mismatch was detected on.
 */
enum class Direction {
    REQUEST,
    RESPONSE
};

/**
 * @brief Failed coercion: the schema, the rejected value and the failure tree.
 */
struct SchemaMismatch {
    qb::json schema;
    qb::json value;
    SchemaError error;
};

/**
 * @brief Exception raised by code inside an exchange that detected a schema mismatch.
 *
 * The request-coercion and response-validation interceptors recover it in
 * their error stage according to its direction.
 */
class SchemaMismatchError : public std::runtime_error {
public:
    SchemaMismatchError(Direction direction, SchemaMismatch mismatch);

    [[nodiscard]] Direction direction() const noexcept { return _direction; }
    [[nodiscard]] const SchemaMismatch &mismatch() const noexcept { return _mismatch; }

private:
    Direction _direction;
    SchemaMismatch _mismatch;
};

} // namespace qb::swagger::validation
