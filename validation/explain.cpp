/**
 * @file qbm/swagger/validation/explain.cpp
 * @brief Implementation of the failure tree explainer.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#include "./explain.h"

namespace qb::swagger::validation {

qb::json explain(const SchemaError &error) {
    switch (error.kind()) {
        case SchemaError::Kind::NAMED:
            if (error.inner().kind() == SchemaError::Kind::MAP)
                return explain(error.inner());
            return error.name();
        case SchemaError::Kind::MAP: {
            qb::json out = qb::json::object();
            for (std::size_t i = 0; i < error.size(); ++i)
                out[error.key_at(i)] = explain(error.child_at(i));
            return out;
        }
        case SchemaError::Kind::SEQUENCE: {
            qb::json out = qb::json::array();
            for (std::size_t i = 0; i < error.size(); ++i) {
                const auto &child = error.child_at(i);
                out.push_back(child.ok() ? qb::json(nullptr) : explain(child));
            }
            return out;
        }
        case SchemaError::Kind::NONE:
            return nullptr;
        default:
            return error.to_string();
    }
}

} // namespace qb::swagger::validation
