/**
 * @file qbm/swagger/routing/router.cpp
 * @brief Implementation of the path-template router.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#include "./router.h"
#include "../logger.h"

#include <vector>
#include <qb/io/uri.h> // For qb::io::uri::decode

namespace qb::swagger {
    namespace {
        std::vector<std::string_view> split_segments(std::string_view path) {
            std::vector<std::string_view> segments;
            std::size_t start = 0;
            while (start < path.size()) {
                std::size_t end = path.find('/', start);
                if (end == std::string_view::npos)
                    end = path.size();
                if (end > start)
                    segments.push_back(path.substr(start, end - start));
                start = end + 1;
            }
            return segments;
        }
    } // namespace

    bool match_path(std::string_view path_template, std::string_view path, qb::json &params) {
        const auto expected = split_segments(path_template);
        const auto actual = split_segments(path);
        if (expected.size() != actual.size())
            return false;

        qb::json captured = qb::json::object();
        for (std::size_t i = 0; i < expected.size(); ++i) {
            if (expected[i].front() == ':') {
                captured[std::string(expected[i].substr(1))] = qb::io::uri::decode(actual[i]);
            } else if (expected[i] != actual[i]) {
                return false;
            }
        }
        params = std::move(captured);
        return true;
    }

    Router::Router(RouteTable routes)
        : _routes(std::move(routes)) {
    }

    const Route *Router::match(Method method, std::string_view path, qb::json &params) const {
        for (const auto &route : _routes) {
            if (route.method == method && match_path(route.path, path, params))
                return &route;
        }
        return nullptr;
    }

    Response Router::route(Request request) const {
        request.extract_query();

        qb::json params;
        const Route *route = match(request.method, request.path, params);
        if (!route) {
            LOG_SWAGGER_DEBUG("Router: no route for " << request.method << " " << request.path);
            return Response(status::NOT_FOUND, "Not Found");
        }

        if (!request.path_params.is_object())
            request.path_params = qb::json::object();
        for (auto &[name, value] : params.items())
            request.path_params[name] = value;

        Context ctx(std::move(request), route);
        Chain(route->interceptors).execute(ctx);

        if (!ctx.has_response()) {
            LOG_SWAGGER_WARN("Router: route " << route->method << " " << route->path << " produced no response");
            return Response(status::NOT_FOUND, "Not Found");
        }
        return std::move(ctx.response());
    }
} // namespace qb::swagger
