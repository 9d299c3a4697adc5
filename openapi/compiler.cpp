/**
 * @file qbm/swagger/openapi/compiler.cpp
 * @brief Implementation of the documentation compiler.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup OpenAPI
 */
#include "./compiler.h"
#include "./annotation.h"
#include "../logger.h"

#include <memory>

namespace qb::swagger::openapi {

Contract route_contract(const Route &route) {
    Contract merged;
    for (const auto &interceptor : route.interceptors) {
        if (!interceptor)
            continue;
        if (const Contract *fragment = annotation(*interceptor))
            merged = merge(merged, *fragment);
    }
    return merged;
}

std::map<std::string, PathItem> gen_paths(const RouteTable &routes) {
    std::map<std::string, PathItem> paths;

    for (const auto &route : routes) {
        const IInterceptor *handler = route.handler();
        if (!handler || !annotation(*handler)) {
            LOG_SWAGGER_TRACE("Skipping undocumented route " << route.method << " " << route.path);
            continue;
        }

        auto &item = paths[route.path];
        const std::string method = route.method.lower();
        if (item.count(method)) {
            LOG_SWAGGER_WARN("Route " << route.method << " " << route.path
                << " is declared more than once; documenting the first declaration");
            continue;
        }
        item.emplace(method, route_contract(route));
    }

    return paths;
}

AggregateDocument compile(const RouteTable &routes, const ApiInfo &info) {
    AggregateDocument document;
    document.info = info;
    document.paths = gen_paths(routes);
    return document;
}

RouteTable inject_docs(const ApiInfo &info, const RouteTable &routes) {
    auto document = std::make_shared<const AggregateDocument>(compile(routes, info));

    RouteTable out = routes;
    for (auto &route : out) {
        route.contract = std::make_shared<const Contract>(route_contract(route));
        route.document = document;
    }

    LOG_SWAGGER_DEBUG("Compiled API document '" << info.title << "' " << info.version
        << " with " << document->paths.size() << " documented path(s)");
    return out;
}

} // namespace qb::swagger::openapi
