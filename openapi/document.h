/**
 * @file qbm/swagger/openapi/document.h
 * @brief The aggregate API document: API info plus one merged contract per path and method.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup OpenAPI
 */
#pragma once

#include <map>
#include <string>

#include "./contract.h"
#include "../types.h"

namespace qb::swagger::openapi {

/**
 * @brief Basic API information shown at the top of the document.
 */
struct ApiInfo {
    std::string title = "API Documentation";
    std::string version = "1.0.0";
    std::string description;

    ApiInfo &setTitle(std::string value) {
        title = std::move(value);
        return *this;
    }

    ApiInfo &setVersion(std::string value) {
        version = std::move(value);
        return *this;
    }

    ApiInfo &setDescription(std::string value) {
        description = std::move(value);
        return *this;
    }

    bool operator==(const ApiInfo &other) const {
        return title == other.title && version == other.version && description == other.description;
    }
};

/// Operations of one path, keyed by lower-case method name ("get", "put", ...).
using PathItem = std::map<std::string, Contract>;

/**
 * @brief Immutable description of a whole route table.
 *
 * Paths are keyed by their route template ("/x/:id"); serializers convert
 * the template to their own syntax.
 */
struct AggregateDocument {
    ApiInfo info;
    std::map<std::string, PathItem> paths;

    /// Contract documented for a path template and method, or nullptr.
    [[nodiscard]] const Contract *find(const std::string &path, Method method) const {
        auto item = paths.find(path);
        if (item == paths.end())
            return nullptr;
        auto op = item->second.find(method.lower());
        return op == item->second.end() ? nullptr : &op->second;
    }

    bool operator==(const AggregateDocument &other) const {
        return info == other.info && paths == other.paths;
    }
};

} // namespace qb::swagger::openapi
