/**
 * @file qbm/swagger/routing/route_group.h
 * @brief Defines RouteGroup, a node of the declarative route tree.
 *
 * A group owns a path segment, interceptors applied to everything below it,
 * per-method interceptor lists served at its own path, and child groups.
 * `expand()` flattens the tree into a `RouteTable`, prefixing each route's
 * interceptors with those of its enclosing groups, outermost first.
 *
 * @code
 * RouteGroup api("/");
 * api.use(body_params())
 *    .use(auth)
 *    .get(list_items)
 *    .group(RouteGroup("/items/:id")
 *               .use(load_item)
 *               .put(require_admin, update_item)
 *               .del(delete_item));
 * RouteTable routes = api.expand();
 * @endcode
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "./route.h"

namespace qb::swagger {
    namespace detail {
        /**
         * @brief Strips leading and trailing slashes from a path segment.
         *
         * "/users/" gives "users", "/" and "" give "".
         */
        [[nodiscard]] std::string normalize_path_segment(const std::string &segment);

        /**
         * @brief Joins a parent path and a child segment with a single slash.
         *
         * - parent="/api", segment="users" gives "/api/users"
         * - parent="", segment="" gives "/"
         */
        [[nodiscard]] std::string join_paths(const std::string &parent, const std::string &segment);
    } // namespace detail

    class RouteGroup {
    public:
        explicit RouteGroup(std::string segment = "/");

        [[nodiscard]] const std::string &segment() const noexcept { return _segment; }

        /**
         * @brief Adds an interceptor applied to every route of this group and its children.
         * @throws std::invalid_argument if `interceptor` is null.
         */
        RouteGroup &use(InterceptorPtr interceptor);

        /**
         * @brief Serves `method` at this group's path.
         * @param chain Route interceptors, the last one being the terminal handler.
         * @throws std::invalid_argument if `chain` is empty or holds a null interceptor.
         */
        RouteGroup &route(Method method, std::vector<InterceptorPtr> chain);

        template<typename... Interceptors>
        RouteGroup &get(Interceptors &&...chain) {
            return route(Method::GET, {InterceptorPtr(std::forward<Interceptors>(chain))...});
        }

        template<typename... Interceptors>
        RouteGroup &head(Interceptors &&...chain) {
            return route(Method::HEAD, {InterceptorPtr(std::forward<Interceptors>(chain))...});
        }

        template<typename... Interceptors>
        RouteGroup &post(Interceptors &&...chain) {
            return route(Method::POST, {InterceptorPtr(std::forward<Interceptors>(chain))...});
        }

        template<typename... Interceptors>
        RouteGroup &put(Interceptors &&...chain) {
            return route(Method::PUT, {InterceptorPtr(std::forward<Interceptors>(chain))...});
        }

        template<typename... Interceptors>
        RouteGroup &patch(Interceptors &&...chain) {
            return route(Method::PATCH, {InterceptorPtr(std::forward<Interceptors>(chain))...});
        }

        template<typename... Interceptors>
        RouteGroup &del(Interceptors &&...chain) {
            return route(Method::DEL, {InterceptorPtr(std::forward<Interceptors>(chain))...});
        }

        /// Adds a child group; its segment is relative to this group's path.
        RouteGroup &group(RouteGroup child);

        /**
         * @brief Flattens the tree into routes, in declaration order (own verbs first, then children).
         * @param prefix Path of the enclosing group.
         * @param ambient Interceptors of the enclosing groups, outermost first.
         */
        [[nodiscard]] RouteTable expand(const std::string &prefix = "",
                                        const std::vector<InterceptorPtr> &ambient = {}) const;

    private:
        struct Verb {
            Method method;
            std::vector<InterceptorPtr> chain;
        };

        std::string _segment;
        std::vector<InterceptorPtr> _interceptors;
        std::vector<Verb> _verbs;
        std::vector<RouteGroup> _children;
    };
} // namespace qb::swagger
