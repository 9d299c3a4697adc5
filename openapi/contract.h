/**
 * @file qbm/swagger/openapi/contract.h
 * @brief Declarative per-route contract: parameters, responses and documentation.
 *
 * A `Contract` describes what a route accepts (one schema per parameter
 * location) and what it may answer (one entry per status code plus an
 * optional default entry), together with the documentation fields shown in
 * the generated API description. Contracts attached at several levels of a
 * route (ambient interceptors, then the terminal handler) are folded with
 * `merge()`, the inner level winning.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup OpenAPI
 */
#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <qb/json.h>

namespace qb::swagger::openapi {

/**
 * @brief Location of a request parameter group.
 */
enum class ParameterLocation {
    PATH,
    QUERY,
    HEADER,
    BODY,
    FORM_DATA
};

/// Documentation name of a location ("path", "query", "header", "body", "formData").
[[nodiscard]] std::string to_string(ParameterLocation location);

/**
 * @brief Parses a documentation location name.
 * @throws std::invalid_argument if the name is not one of the five locations.
 */
[[nodiscard]] ParameterLocation parse_location(std::string_view name);

/// Key of the default response entry in `Responses`.
constexpr int DEFAULT_RESPONSE = 0;

/**
 * @brief One declared response: body schema and headers schema.
 *
 * A null `schema` or `headers` means the field is not declared and is not
 * enforced.
 */
struct ResponseSpec {
    std::string description;
    qb::json schema;
    qb::json headers;

    bool operator==(const ResponseSpec &other) const {
        return description == other.description && schema == other.schema && headers == other.headers;
    }
    bool operator!=(const ResponseSpec &other) const { return !(*this == other); }
};

using Parameters = std::map<ParameterLocation, qb::json>;
using Responses = std::map<int, ResponseSpec>;

/**
 * @brief Contract attached to an interceptor or compiled onto a route.
 */
struct Contract {
    std::string description;
    std::string summary;
    std::vector<std::string> consumes;
    Parameters parameters;
    Responses responses;

    /**
     * @brief Builds a contract from its JSON declaration.
     *
     * @code
     * auto c = Contract::from_json({
     *     {"summary", "Fetch an item"},
     *     {"parameters", {{"path", {{"type", "object"},
     *                               {"properties", {{"id", {{"type", "integer"}}}}},
     *                               {"required", {"id"}}}}}},
     *     {"responses", {{"200", {{"schema", {{"type", "object"}}}}}}}
     * });
     * @endcode
     *
     * Response keys are status codes or "default".
     * @throws std::invalid_argument on an unknown parameter location or a malformed entry.
     */
    [[nodiscard]] static Contract from_json(const qb::json &declaration);

    /// JSON form accepted by `from_json`; empty fields are omitted.
    [[nodiscard]] qb::json to_json() const;

    [[nodiscard]] bool empty() const {
        return description.empty() && summary.empty() && consumes.empty()
               && parameters.empty() && responses.empty();
    }

    bool operator==(const Contract &other) const {
        return description == other.description && summary == other.summary
               && consumes == other.consumes && parameters == other.parameters
               && responses == other.responses;
    }
    bool operator!=(const Contract &other) const { return !(*this == other); }
};

/**
 * @brief Merges two object schemas declared for the same parameter location.
 *
 * Union of `properties` (the inner schema wins on a shared property) and
 * union of `required`; any other keyword of the inner schema overrides the
 * outer one. Non-object schemas are not merged: the inner one is returned.
 */
[[nodiscard]] qb::json merge_parameter_schema(const qb::json &outer, const qb::json &inner);

/**
 * @brief Folds a leaf contract onto an ambient one.
 *
 * Non-empty scalar fields of the leaf win; `consumes` is an ordered union;
 * `parameters` and `responses` are unions of their keys, a key present on
 * both sides being merged field by field with the leaf winning.
 */
[[nodiscard]] Contract merge(const Contract &ambient, const Contract &leaf);

} // namespace qb::swagger::openapi
