/**
 * @file qbm/swagger/openapi/swagger.h
 * @brief Swagger 2.0 serializer of the aggregate API document.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup OpenAPI
 */
#pragma once

#include <functional>
#include <string>
#include <qb/json.h>

#include "./document.h"

namespace qb::swagger::openapi {

/// Turns the aggregate document into the payload served by the documentation endpoint.
using DocumentSerializer = std::function<qb::json(const AggregateDocument &)>;

/**
 * @brief Converts a route template to Swagger path syntax: "/x/:id" gives "/x/{id}".
 */
[[nodiscard]] std::string to_swagger_path(const std::string &path_template);

/**
 * @brief Swagger 2.0 parameter objects of one contract.
 *
 * A body schema becomes a single `in: body` parameter; every property of the
 * other locations becomes its own parameter, path parameters being always
 * required.
 */
[[nodiscard]] qb::json to_swagger_parameters(const Parameters &parameters);

/**
 * @brief Swagger 2.0 responses object of one contract.
 *
 * Entries without a description get the status reason phrase; the default
 * entry gets an empty description.
 */
[[nodiscard]] qb::json to_swagger_responses(const Responses &responses);

/// Swagger 2.0 document (`swagger`, `info`, `paths`).
[[nodiscard]] qb::json to_swagger_json(const AggregateDocument &document);

} // namespace qb::swagger::openapi
