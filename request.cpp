/**
 * @file qbm/swagger/request.cpp
 * @brief Implementation of the structured HTTP request record.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Swagger
 */
#include "./request.h"
#include "./utility.h"

#include <qb/io/uri.h> // For qb::io::uri::decode

namespace qb::swagger {

namespace {
    using utility::to_lower;

    std::string trim(std::string_view in) {
        const auto first = in.find_first_not_of(" \t");
        if (first == std::string_view::npos)
            return {};
        const auto last = in.find_last_not_of(" \t");
        return std::string(in.substr(first, last - first + 1));
    }

    void add_param(qb::json &target, const std::string &key, std::string value) {
        if (!target.contains(key)) {
            target[key] = std::move(value);
            return;
        }
        auto &slot = target[key];
        if (!slot.is_array()) {
            qb::json first = std::move(slot);
            slot = qb::json::array();
            slot.push_back(std::move(first));
        }
        slot.push_back(std::move(value));
    }
} // namespace

qb::json parse_urlencoded(std::string_view input) {
    qb::json result = qb::json::object();

    size_t start = 0;
    while (start < input.length()) {
        size_t end_pair = input.find('&', start);
        if (end_pair == std::string_view::npos)
            end_pair = input.length();

        std::string_view pair_str = input.substr(start, end_pair - start);
        size_t eq_pos = pair_str.find('=');

        if (eq_pos != std::string_view::npos) {
            std::string key = qb::io::uri::decode(pair_str.substr(0, eq_pos));
            std::string value = qb::io::uri::decode(pair_str.substr(eq_pos + 1));
            if (!key.empty())
                add_param(result, key, std::move(value));
        } else {
            std::string key = qb::io::uri::decode(pair_str);
            if (!key.empty())
                add_param(result, key, "");
        }
        start = end_pair + 1;
    }

    return result;
}

Request &Request::set_header(std::string_view name, std::string value) {
    headers[to_lower(name)] = std::move(value);
    return *this;
}

std::string Request::header(std::string_view name) const {
    if (!headers.is_object())
        return {};
    auto it = headers.find(to_lower(name));
    if (it == headers.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

std::string Request::content_type() const {
    const std::string raw = header("content-type");
    return to_lower(trim(std::string_view(raw).substr(0, raw.find(';'))));
}

Request &Request::extract_query() {
    const auto qpos = path.find('?');
    if (qpos == std::string::npos)
        return *this;

    qb::json parsed = parse_urlencoded(std::string_view(path).substr(qpos + 1));
    path.erase(qpos);
    if (!query_params.is_object())
        query_params = qb::json::object();
    for (auto &[key, value] : parsed.items()) {
        if (!query_params.contains(key))
            query_params[key] = value;
    }
    return *this;
}

qb::json Request::to_record() const {
    qb::json record = qb::json::object();
    record[field::BODY_PARAMS] = body_params;
    record[field::FORM_PARAMS] = form_params;
    record[field::PATH_PARAMS] = path_params;
    record[field::QUERY_PARAMS] = query_params;
    record[field::HEADERS] = headers;
    return record;
}

void Request::assign_record(const qb::json &record) {
    if (!record.is_object())
        return;
    if (record.contains(field::BODY_PARAMS))
        body_params = record.at(field::BODY_PARAMS);
    if (record.contains(field::FORM_PARAMS))
        form_params = record.at(field::FORM_PARAMS);
    if (record.contains(field::PATH_PARAMS))
        path_params = record.at(field::PATH_PARAMS);
    if (record.contains(field::QUERY_PARAMS))
        query_params = record.at(field::QUERY_PARAMS);
    if (record.contains(field::HEADERS))
        headers = record.at(field::HEADERS);
}

} // namespace qb::swagger
