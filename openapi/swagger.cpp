/**
 * @file qbm/swagger/openapi/swagger.cpp
 * @brief Implementation of the Swagger 2.0 serializer.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup OpenAPI
 */
#include "./swagger.h"

#include <algorithm>
#include <regex>

namespace qb::swagger::openapi {

namespace {
    bool is_required(const qb::json &schema, const std::string &name) {
        auto it = schema.find("required");
        if (it == schema.end() || !it->is_array())
            return false;
        return std::find(it->begin(), it->end(), qb::json(name)) != it->end();
    }

    qb::json operation_of(const Contract &contract) {
        qb::json operation = qb::json::object();
        if (!contract.description.empty())
            operation["description"] = contract.description;
        if (!contract.summary.empty())
            operation["summary"] = contract.summary;
        if (!contract.consumes.empty())
            operation["consumes"] = contract.consumes;
        operation["parameters"] = to_swagger_parameters(contract.parameters);
        operation["responses"] = to_swagger_responses(contract.responses);
        return operation;
    }
} // namespace

std::string to_swagger_path(const std::string &path_template) {
    static const std::regex param_regex(":([a-zA-Z0-9_\\-]+)");
    return std::regex_replace(path_template, param_regex, "{$1}");
}

qb::json to_swagger_parameters(const Parameters &parameters) {
    qb::json out = qb::json::array();

    for (const auto &[location, schema] : parameters) {
        if (location == ParameterLocation::BODY) {
            std::string name = "body";
            if (schema.is_object() && schema.contains("title") && schema.at("title").is_string())
                name = schema.at("title").get<std::string>();
            qb::json param = {
                {"in", "body"},
                {"name", name},
                {"required", true},
                {"schema", schema}
            };
            out.push_back(std::move(param));
            continue;
        }

        if (!schema.is_object() || !schema.contains("properties"))
            continue;

        for (const auto &[name, property] : schema.at("properties").items()) {
            qb::json param = property.is_object() ? property : qb::json::object();
            param.erase("title");
            param["in"] = to_string(location);
            param["name"] = name;
            param["required"] = location == ParameterLocation::PATH || is_required(schema, name);
            out.push_back(std::move(param));
        }
    }

    return out;
}

qb::json to_swagger_responses(const Responses &responses) {
    qb::json out = qb::json::object();

    for (const auto &[code, spec] : responses) {
        qb::json entry = qb::json::object();
        if (!spec.description.empty())
            entry["description"] = spec.description;
        else
            entry["description"] = code == DEFAULT_RESPONSE ? std::string() : status::reason_phrase(code);

        if (!spec.schema.is_null())
            entry["schema"] = spec.schema;

        if (spec.headers.is_object() && spec.headers.contains("properties")) {
            qb::json headers = qb::json::object();
            for (const auto &[name, header] : spec.headers.at("properties").items())
                headers[name] = header;
            entry["headers"] = std::move(headers);
        }

        out[code == DEFAULT_RESPONSE ? std::string("default") : std::to_string(code)] = std::move(entry);
    }

    return out;
}

qb::json to_swagger_json(const AggregateDocument &document) {
    qb::json info = {
        {"title", document.info.title},
        {"version", document.info.version}
    };
    if (!document.info.description.empty())
        info["description"] = document.info.description;

    qb::json paths = qb::json::object();
    for (const auto &[path, item] : document.paths) {
        qb::json path_item = qb::json::object();
        for (const auto &[method, contract] : item)
            path_item[method] = operation_of(contract);
        paths[to_swagger_path(path)] = std::move(path_item);
    }

    qb::json swagger = qb::json::object();
    swagger["swagger"] = "2.0";
    swagger["info"] = std::move(info);
    swagger["paths"] = std::move(paths);
    return swagger;
}

} // namespace qb::swagger::openapi
