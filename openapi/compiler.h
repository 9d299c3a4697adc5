/**
 * @file qbm/swagger/openapi/compiler.h
 * @brief Compiles a route table into the aggregate API document.
 *
 * The contract of a route is the fold, outer to inner, of the contract
 * fragments carried by its interceptors: the ambient interceptors of the
 * enclosing groups first, the terminal handler last. The module's own
 * interceptors carry fragments too, so a route using `body_params()` gains
 * the 400 response and the parser content types, `coerce_request()` gains
 * 422 and `validate_response()` gains 500.
 *
 * Only routes whose terminal handler is annotated are documented, but
 * `inject_docs()` attaches the merged contract to every route so that the
 * runtime interceptors can enforce it.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup OpenAPI
 */
#pragma once

#include <map>
#include <string>

#include "./document.h"
#include "../routing/route.h"

namespace qb::swagger::openapi {

/// Folds the contract fragments of a route's interceptors, outer to inner.
[[nodiscard]] Contract route_contract(const Route &route);

/**
 * @brief Documented operations of a route table.
 *
 * When two routes share a path and a method, the first one is documented.
 */
[[nodiscard]] std::map<std::string, PathItem> gen_paths(const RouteTable &routes);

/// Builds the aggregate document of a route table. Pure and deterministic.
[[nodiscard]] AggregateDocument compile(const RouteTable &routes, const ApiInfo &info);

/**
 * @brief Compiles the document and attaches it, with each route's merged contract, to a copy of the routes.
 *
 * The input table is left untouched; the document is shared read-only by
 * every returned route.
 */
[[nodiscard]] RouteTable inject_docs(const ApiInfo &info, const RouteTable &routes);

} // namespace qb::swagger::openapi
