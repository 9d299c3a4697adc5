/**
 * @file qbm/swagger/routing/route_group.cpp
 * @brief Implementation of the route tree and its expansion.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#include "./route_group.h"

#include <iterator>
#include <stdexcept>

namespace qb::swagger {
    namespace detail {
        std::string normalize_path_segment(const std::string &segment) {
            std::string normalized = segment;

            while (!normalized.empty() && normalized.front() == '/') {
                normalized.erase(0, 1);
            }
            while (!normalized.empty() && normalized.back() == '/') {
                normalized.pop_back();
            }

            return normalized;
        }

        std::string join_paths(const std::string &parent, const std::string &segment) {
            std::string normalized_parent = normalize_path_segment(parent);
            std::string normalized_segment = normalize_path_segment(segment);

            if (normalized_parent.empty() && normalized_segment.empty()) {
                return "/";
            }

            std::string result = "/";
            result += normalized_parent;
            if (!normalized_segment.empty()) {
                if (!normalized_parent.empty()) {
                    result += "/";
                }
                result += normalized_segment;
            }
            return result;
        }
    } // namespace detail

    RouteGroup::RouteGroup(std::string segment)
        : _segment(std::move(segment)) {
    }

    RouteGroup &RouteGroup::use(InterceptorPtr interceptor) {
        if (!interceptor) {
            throw std::invalid_argument("RouteGroup::use(): interceptor cannot be null.");
        }
        _interceptors.push_back(std::move(interceptor));
        return *this;
    }

    RouteGroup &RouteGroup::route(Method method, std::vector<InterceptorPtr> chain) {
        if (chain.empty()) {
            throw std::invalid_argument("RouteGroup::route(): a route needs at least a handler.");
        }
        for (const auto &interceptor : chain) {
            if (!interceptor) {
                throw std::invalid_argument("RouteGroup::route(): interceptor cannot be null.");
            }
        }
        _verbs.push_back(Verb{method, std::move(chain)});
        return *this;
    }

    RouteGroup &RouteGroup::group(RouteGroup child) {
        _children.push_back(std::move(child));
        return *this;
    }

    RouteTable RouteGroup::expand(const std::string &prefix, const std::vector<InterceptorPtr> &ambient) const {
        const std::string path = detail::join_paths(prefix, _segment);

        std::vector<InterceptorPtr> inherited = ambient;
        inherited.insert(inherited.end(), _interceptors.begin(), _interceptors.end());

        RouteTable routes;
        for (const auto &verb : _verbs) {
            Route route;
            route.path = path;
            route.method = verb.method;
            route.interceptors = inherited;
            route.interceptors.insert(route.interceptors.end(), verb.chain.begin(), verb.chain.end());
            routes.push_back(std::move(route));
        }

        for (const auto &child : _children) {
            RouteTable nested = child.expand(path, inherited);
            routes.insert(routes.end(),
                          std::make_move_iterator(nested.begin()),
                          std::make_move_iterator(nested.end()));
        }

        return routes;
    }
} // namespace qb::swagger
