/**
 * @file qbm/swagger/validation/error.cpp
 * @brief Implementation of the schema failure tree.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#include "./error.h"
#include "./explain.h"
#include "../utility.h"

namespace qb::swagger::validation {

SchemaError SchemaError::mismatch(std::string expected, qb::json value) {
    SchemaError e;
    e._kind = Kind::MISMATCH;
    e._text = std::move(expected);
    e._value = std::move(value);
    return e;
}

SchemaError SchemaError::missing_key() {
    SchemaError e;
    e._kind = Kind::MISSING_KEY;
    return e;
}

SchemaError SchemaError::disallowed_key() {
    SchemaError e;
    e._kind = Kind::DISALLOWED_KEY;
    return e;
}

SchemaError SchemaError::named(std::string name, SchemaError inner) {
    SchemaError e;
    e._kind = Kind::NAMED;
    e._text = std::move(name);
    e._children.push_back(std::move(inner));
    return e;
}

SchemaError SchemaError::map() {
    SchemaError e;
    e._kind = Kind::MAP;
    return e;
}

SchemaError SchemaError::sequence() {
    SchemaError e;
    e._kind = Kind::SEQUENCE;
    return e;
}

const SchemaError &SchemaError::inner() const {
    if (_kind != Kind::NAMED || _children.empty())
        throw std::logic_error("SchemaError::inner() called on a node that is not a named failure");
    return _children.front();
}

void SchemaError::add(std::string key, SchemaError child) {
    if (_kind != Kind::MAP)
        throw std::logic_error("SchemaError::add() called on a node that is not a map failure");
    _keys.push_back(std::move(key));
    _children.push_back(std::move(child));
}

void SchemaError::push_back(SchemaError child) {
    if (_kind != Kind::SEQUENCE)
        throw std::logic_error("SchemaError::push_back() called on a node that is not a sequence failure");
    _children.push_back(std::move(child));
}

const SchemaError *SchemaError::find(const std::string &key) const {
    for (std::size_t i = 0; i < _keys.size(); ++i) {
        if (_keys[i] == key)
            return &_children[i];
    }
    return nullptr;
}

bool SchemaError::has_failures() const {
    for (const auto &child : _children) {
        if (!child.ok())
            return true;
    }
    return false;
}

std::string SchemaError::to_string() const {
    switch (_kind) {
        case Kind::NONE:
            return "ok";
        case Kind::MISMATCH:
            return "not " + _text + ": " + utility::dump(_value);
        case Kind::MISSING_KEY:
            return "missing-required-key";
        case Kind::DISALLOWED_KEY:
            return "disallowed-key";
        default:
            return utility::dump(explain(*this));
    }
}

SchemaMismatchError::SchemaMismatchError(Direction direction, SchemaMismatch mismatch)
    : std::runtime_error(std::string(direction == Direction::REQUEST ? "Request" : "Response")
                         + " does not match its schema: " + mismatch.error.to_string())
    , _direction(direction)
    , _mismatch(std::move(mismatch)) {
}

} // namespace qb::swagger::validation
