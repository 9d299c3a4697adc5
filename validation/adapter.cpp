/**
 * @file qbm/swagger/validation/adapter.cpp
 * @brief Implementation of the request/response schema adapter.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#include "./adapter.h"
#include "../request.h"

namespace qb::swagger::validation {

std::string request_field(ParameterLocation location) {
    switch (location) {
        case ParameterLocation::BODY: return field::BODY_PARAMS;
        case ParameterLocation::FORM_DATA: return field::FORM_PARAMS;
        case ParameterLocation::PATH: return field::PATH_PARAMS;
        case ParameterLocation::QUERY: return field::QUERY_PARAMS;
        case ParameterLocation::HEADER: return field::HEADERS;
    }
    return {};
}

qb::json loosen(qb::json schema) {
    if (schema.is_object())
        schema["additionalProperties"] = true;
    return schema;
}

qb::json to_request_schema(const openapi::Parameters &parameters) {
    qb::json properties = qb::json::object();
    qb::json required = qb::json::array();

    for (const auto &[location, schema] : parameters) {
        const bool lenient = location == ParameterLocation::QUERY || location == ParameterLocation::HEADER;
        const std::string name = request_field(location);
        properties[name] = lenient ? loosen(schema) : schema;
        required.push_back(name);
    }

    qb::json schema = qb::json::object();
    schema["type"] = "object";
    schema["properties"] = std::move(properties);
    schema["required"] = std::move(required);
    return loosen(std::move(schema));
}

qb::json with_request_defaults(qb::json record) {
    if (!record.is_object())
        record = qb::json::object();
    if (!record.contains(field::BODY_PARAMS))
        record[field::BODY_PARAMS] = nullptr;
    for (const char *name : {field::FORM_PARAMS, field::PATH_PARAMS, field::QUERY_PARAMS, field::HEADERS}) {
        if (!record.contains(name) || record[name].is_null())
            record[name] = qb::json::object();
    }
    return record;
}

qb::json to_response_schema(const openapi::ResponseSpec &entry) {
    qb::json properties = qb::json::object();
    qb::json required = qb::json::array();

    if (!entry.schema.is_null()) {
        properties[field::BODY] = entry.schema;
        required.push_back(field::BODY);
    }
    if (!entry.headers.is_null()) {
        properties[field::HEADERS] = loosen(entry.headers);
        required.push_back(field::HEADERS);
    }

    qb::json schema = qb::json::object();
    schema["type"] = "object";
    schema["properties"] = std::move(properties);
    schema["required"] = std::move(required);
    return loosen(std::move(schema));
}

qb::json with_response_defaults(qb::json record) {
    if (!record.is_object())
        record = qb::json::object();
    if (!record.contains(field::HEADERS) || record[field::HEADERS].is_null())
        record[field::HEADERS] = qb::json::object();
    if (!record.contains(field::BODY))
        record[field::BODY] = nullptr;
    return record;
}

const openapi::ResponseSpec *select_response(const openapi::Responses &responses, int status) {
    auto it = responses.find(status);
    if (it != responses.end())
        return &it->second;
    it = responses.find(openapi::DEFAULT_RESPONSE);
    if (it != responses.end())
        return &it->second;
    return nullptr;
}

RequestCoercionFn make_coerce_request(CoercionMatcher matcher) {
    return [matcher = std::move(matcher)](const openapi::Parameters &parameters, const qb::json &record) {
        return coerce(to_request_schema(parameters), with_request_defaults(record), matcher);
    };
}

ResponseValidationFn make_validate_response(CoercionMatcher matcher) {
    return [matcher = std::move(matcher)](const openapi::ResponseSpec &entry, const qb::json &record) {
        return coerce(to_response_schema(entry), with_response_defaults(record), matcher);
    };
}

} // namespace qb::swagger::validation
