/**
 * @file qbm/swagger/request.h
 * @brief Defines the structured HTTP request record consumed by the contract layer.
 *
 * The transport layer is expected to materialize an inbound request into a
 * `Request`: method, path, raw body and the already split parameter maps.
 * The request-coercion interceptor works on the record view of this struct
 * (`to_record()` / `assign_record()`), a single JSON object keyed by the
 * parameter field names.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Swagger
 */
#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <qb/json.h>
#include "./types.h"

namespace qb::swagger {

/** @brief Record field names of the request parameter maps. */
namespace field {
    constexpr const char *BODY_PARAMS = "body-params";
    constexpr const char *FORM_PARAMS = "form-params";
    constexpr const char *PATH_PARAMS = "path-params";
    constexpr const char *QUERY_PARAMS = "query-params";
    constexpr const char *HEADERS = "headers";
    constexpr const char *BODY = "body";
    constexpr const char *STATUS = "status";
} // namespace field

/**
 * @brief Parses an `application/x-www-form-urlencoded` payload into a JSON object.
 *
 * Keys and values are percent-decoded. A key without '=' maps to an empty
 * string. A key seen more than once collects its values in an array.
 *
 * @param input The encoded payload (a form body or a query string without '?').
 * @return A JSON object of string values.
 */
[[nodiscard]] qb::json parse_urlencoded(std::string_view input);

/**
 * @brief Represents an inbound HTTP request as seen by the contract layer.
 *
 * `body_params` stays null until a body parser fills it; the other parameter
 * maps are JSON objects. Header names are stored lower-cased.
 */
struct Request {
    Method method;
    std::string path;
    std::string body;

    qb::json body_params;
    qb::json form_params = qb::json::object();
    qb::json path_params = qb::json::object();
    qb::json query_params = qb::json::object();
    qb::json headers = qb::json::object();

    Request() = default;

    Request(Method m, std::string p, std::string b = {})
        : method(m)
        , path(std::move(p))
        , body(std::move(b)) {
    }

    /**
     * @brief Sets a header value, lower-casing its name.
     * @param name Header name in any case.
     * @param value Header value.
     * @return Reference to this request for chaining.
     */
    Request &set_header(std::string_view name, std::string value);

    /**
     * @brief Looks up a header by name (case-insensitive).
     * @return The header value, or an empty string when absent or not a string.
     */
    [[nodiscard]] std::string header(std::string_view name) const;

    /**
     * @brief Media type of the `content-type` header without parameters, lower-cased.
     *
     * `"Application/JSON; charset=utf-8"` yields `"application/json"`.
     */
    [[nodiscard]] std::string content_type() const;

    /**
     * @brief Splits `?query` off the path and parses it into `query_params`.
     *
     * Keys already present in `query_params` are kept.
     * @return Reference to this request for chaining.
     */
    Request &extract_query();

    /**
     * @brief Record view of the five parameter fields.
     * @return `{"body-params", "form-params", "path-params", "query-params", "headers"}`
     */
    [[nodiscard]] qb::json to_record() const;

    /**
     * @brief Writes the parameter fields back from a (coerced) record.
     *
     * Fields absent from `record` are left untouched.
     */
    void assign_record(const qb::json &record);
};

} // namespace qb::swagger
