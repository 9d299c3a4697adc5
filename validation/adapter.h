/**
 * @file qbm/swagger/validation/adapter.h
 * @brief Translates route contracts into the composite schemas the coercer checks.
 *
 * The request side maps each parameter location onto its request record
 * field (`body` to `body-params`, `formData` to `form-params`, `path` to
 * `path-params`, `query` to `query-params`, `header` to `headers`). Query
 * strings and headers routinely carry keys a route does not care about, so
 * their schemas are loosened; path, body and form schemas stay strict.
 *
 * The response side validates `{body, headers}` of a response against the
 * entry selected for its status code.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <functional>
#include <string>
#include <qb/json.h>
#include "./coercer.h"
#include "../openapi/contract.h"

namespace qb::swagger::validation {

using openapi::ParameterLocation;

/// Request record field a parameter location is read from.
[[nodiscard]] std::string request_field(ParameterLocation location);

/**
 * @brief Allows any extra key on an object schema.
 * @return A copy of `schema` with `additionalProperties: true`; non-object schemas are returned as is.
 */
[[nodiscard]] qb::json loosen(qb::json schema);

/**
 * @brief Composite request schema for the declared parameter locations.
 *
 * Every declared location becomes a required field of a loosened object
 * schema; query and header sub-schemas are loosened.
 */
[[nodiscard]] qb::json to_request_schema(const openapi::Parameters &parameters);

/**
 * @brief Fills the absent parameter fields of a request record.
 *
 * `body-params` defaults to null, the four other fields to `{}`.
 */
[[nodiscard]] qb::json with_request_defaults(qb::json record);

/**
 * @brief Composite response schema `{body, headers}` for a response entry.
 *
 * Undeclared fields are omitted; the headers schema is loosened.
 */
[[nodiscard]] qb::json to_response_schema(const openapi::ResponseSpec &entry);

/// Fills absent `headers` with `{}` and absent `body` with null.
[[nodiscard]] qb::json with_response_defaults(qb::json record);

/**
 * @brief Selects the response entry enforced for a status code.
 * @return The exact entry, else the default entry, else nullptr (no enforcement).
 */
[[nodiscard]] const openapi::ResponseSpec *select_response(const openapi::Responses &responses, int status);

/// Coerces a request record against a route's parameters.
using RequestCoercionFn = std::function<CoercionResult(const openapi::Parameters &, const qb::json &record)>;
/// Validates a response record against the selected response entry.
using ResponseValidationFn = std::function<CoercionResult(const openapi::ResponseSpec &, const qb::json &record)>;

/**
 * @brief Builds the request coercion function from a matcher.
 *
 * The function builds the request schema, applies the request defaults and
 * coerces the record with `matcher`.
 */
[[nodiscard]] RequestCoercionFn make_coerce_request(CoercionMatcher matcher);

/// Builds the response validation function from a matcher.
[[nodiscard]] ResponseValidationFn make_validate_response(CoercionMatcher matcher);

} // namespace qb::swagger::validation
