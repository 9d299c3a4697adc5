/**
 * @file qbm/swagger/response.h
 * @brief Defines the structured HTTP response record produced by handlers.
 *
 * A `Response` carries a status code, a structured JSON body and a header
 * object. Unlike request headers, response header names keep their case.
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

struct Response {
    int status = status::OK;
    qb::json body;
    qb::json headers = qb::json::object();

    Response() = default;

    explicit Response(int s, qb::json b = nullptr)
        : status(s)
        , body(std::move(b)) {
    }

    Response &set_header(std::string_view name, std::string value) {
        headers[std::string(name)] = std::move(value);
        return *this;
    }

    /**
     * @brief Record view validated by the response-validation interceptor.
     * @return `{"status", "body", "headers"}`
     */
    [[nodiscard]] qb::json to_record() const {
        qb::json record = qb::json::object();
        record["status"] = status;
        record["body"] = body;
        record["headers"] = headers;
        return record;
    }

    /// Writes `body` and `headers` back from a validated record; the status is never changed.
    void assign_record(const qb::json &record) {
        if (!record.is_object())
            return;
        if (record.contains("body"))
            body = record.at("body");
        if (record.contains("headers"))
            headers = record.at("headers");
    }

    /// Builds an error response `{key: payload}`.
    [[nodiscard]] static Response error(int s, std::string_view key, qb::json payload) {
        qb::json body = qb::json::object();
        body[std::string(key)] = std::move(payload);
        return Response(s, std::move(body));
    }
};

} // namespace qb::swagger
