/**
 * @file qbm/swagger/openapi/contract.cpp
 * @brief Implementation of contract parsing and merging.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup OpenAPI
 */
#include "./contract.h"

#include <algorithm>
#include <charconv>
#include <stdexcept>

namespace qb::swagger::openapi {

std::string to_string(ParameterLocation location) {
    switch (location) {
        case ParameterLocation::PATH: return "path";
        case ParameterLocation::QUERY: return "query";
        case ParameterLocation::HEADER: return "header";
        case ParameterLocation::BODY: return "body";
        case ParameterLocation::FORM_DATA: return "formData";
    }
    return "unknown";
}

ParameterLocation parse_location(std::string_view name) {
    if (name == "path") return ParameterLocation::PATH;
    if (name == "query") return ParameterLocation::QUERY;
    if (name == "header") return ParameterLocation::HEADER;
    if (name == "body") return ParameterLocation::BODY;
    if (name == "formData") return ParameterLocation::FORM_DATA;
    throw std::invalid_argument("Unknown parameter location: '" + std::string(name) + "'");
}

namespace {
    int parse_response_key(const std::string &key) {
        if (key == "default")
            return DEFAULT_RESPONSE;
        int code = 0;
        auto res = std::from_chars(key.data(), key.data() + key.size(), code);
        if (res.ec != std::errc() || res.ptr != key.data() + key.size() || code < 100 || code > 599)
            throw std::invalid_argument("Invalid response key: '" + key + "'");
        return code;
    }

    std::string text_field(const qb::json &object, const char *name) {
        auto it = object.find(name);
        if (it == object.end() || it->is_null())
            return {};
        if (!it->is_string())
            throw std::invalid_argument(std::string("Contract field '") + name + "' must be a string.");
        return it->get<std::string>();
    }

    void append_unique(std::vector<std::string> &target, const std::vector<std::string> &items) {
        for (const auto &item : items) {
            if (std::find(target.begin(), target.end(), item) == target.end())
                target.push_back(item);
        }
    }

    ResponseSpec merge_response(const ResponseSpec &outer, const ResponseSpec &inner) {
        ResponseSpec out = outer;
        if (!inner.description.empty())
            out.description = inner.description;
        if (!inner.schema.is_null())
            out.schema = inner.schema;
        if (!inner.headers.is_null())
            out.headers = inner.headers;
        return out;
    }
} // namespace

Contract Contract::from_json(const qb::json &declaration) {
    if (!declaration.is_object())
        throw std::invalid_argument("Contract declaration must be a JSON object.");

    Contract contract;
    contract.description = text_field(declaration, "description");
    contract.summary = text_field(declaration, "summary");

    if (auto it = declaration.find("consumes"); it != declaration.end()) {
        if (!it->is_array())
            throw std::invalid_argument("Contract field 'consumes' must be an array of content types.");
        std::vector<std::string> types;
        for (const auto &t : *it) {
            if (!t.is_string())
                throw std::invalid_argument("Contract field 'consumes' must be an array of content types.");
            types.push_back(t.get<std::string>());
        }
        append_unique(contract.consumes, types);
    }

    if (auto it = declaration.find("parameters"); it != declaration.end()) {
        if (!it->is_object())
            throw std::invalid_argument("Contract field 'parameters' must be an object keyed by location.");
        for (const auto &[location, schema] : it->items())
            contract.parameters[parse_location(location)] = schema;
    }

    if (auto it = declaration.find("responses"); it != declaration.end()) {
        if (!it->is_object())
            throw std::invalid_argument("Contract field 'responses' must be an object keyed by status code.");
        for (const auto &[key, entry] : it->items()) {
            if (!entry.is_object())
                throw std::invalid_argument("Response entry '" + key + "' must be an object.");
            ResponseSpec spec;
            spec.description = text_field(entry, "description");
            spec.schema = entry.value("schema", qb::json());
            spec.headers = entry.value("headers", qb::json());
            contract.responses[parse_response_key(key)] = std::move(spec);
        }
    }

    return contract;
}

qb::json Contract::to_json() const {
    qb::json out = qb::json::object();
    if (!description.empty())
        out["description"] = description;
    if (!summary.empty())
        out["summary"] = summary;
    if (!consumes.empty())
        out["consumes"] = consumes;
    if (!parameters.empty()) {
        qb::json params = qb::json::object();
        for (const auto &[location, schema] : parameters)
            params[openapi::to_string(location)] = schema;
        out["parameters"] = std::move(params);
    }
    if (!responses.empty()) {
        qb::json resps = qb::json::object();
        for (const auto &[code, spec] : responses) {
            qb::json entry = qb::json::object();
            if (!spec.description.empty())
                entry["description"] = spec.description;
            if (!spec.schema.is_null())
                entry["schema"] = spec.schema;
            if (!spec.headers.is_null())
                entry["headers"] = spec.headers;
            resps[code == DEFAULT_RESPONSE ? std::string("default") : std::to_string(code)] = std::move(entry);
        }
        out["responses"] = std::move(resps);
    }
    return out;
}

qb::json merge_parameter_schema(const qb::json &outer, const qb::json &inner) {
    if (!outer.is_object() || !inner.is_object())
        return inner;

    qb::json out = outer;
    for (const auto &[key, value] : inner.items()) {
        if (key == "properties" || key == "required")
            continue;
        out[key] = value;
    }

    if (inner.contains("properties")) {
        qb::json properties = outer.value("properties", qb::json::object());
        for (const auto &[name, schema] : inner.at("properties").items())
            properties[name] = schema;
        out["properties"] = std::move(properties);
    }

    if (inner.contains("required")) {
        qb::json required = outer.value("required", qb::json::array());
        for (const auto &name : inner.at("required")) {
            if (std::find(required.begin(), required.end(), name) == required.end())
                required.push_back(name);
        }
        out["required"] = std::move(required);
    }

    return out;
}

Contract merge(const Contract &ambient, const Contract &leaf) {
    Contract out = ambient;

    if (!leaf.description.empty())
        out.description = leaf.description;
    if (!leaf.summary.empty())
        out.summary = leaf.summary;

    append_unique(out.consumes, leaf.consumes);

    for (const auto &[location, schema] : leaf.parameters) {
        auto it = out.parameters.find(location);
        if (it == out.parameters.end())
            out.parameters.emplace(location, schema);
        else
            it->second = merge_parameter_schema(it->second, schema);
    }

    for (const auto &[code, spec] : leaf.responses) {
        auto it = out.responses.find(code);
        if (it == out.responses.end())
            out.responses.emplace(code, spec);
        else
            it->second = merge_response(it->second, spec);
    }

    return out;
}

} // namespace qb::swagger::openapi
