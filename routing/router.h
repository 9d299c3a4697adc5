/**
 * @file qbm/swagger/routing/router.h
 * @brief Minimal path-template router driving the interceptor chain of the matched route.
 *
 * Routes are tried in table order. A template segment starting with ':'
 * captures the corresponding (percent-decoded) request segment into
 * `path_params`; any other segment must match literally.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <string_view>

#include "./route.h"
#include "./chain.h"

namespace qb::swagger {
    /**
     * @brief Matches a request path against a path template.
     * @param path_template Template such as "/x/:id".
     * @param path Request path without query string.
     * @param params Receives the captured parameters on success.
     * @return True on a match.
     */
    [[nodiscard]] bool match_path(std::string_view path_template, std::string_view path, qb::json &params);

    class Router {
    public:
        explicit Router(RouteTable routes);

        /**
         * @brief Finds the route serving a method and path.
         * @param params Receives the path parameters of the matched route.
         * @return The route, or nullptr.
         */
        [[nodiscard]] const Route *match(Method method, std::string_view path, qb::json &params) const;

        /**
         * @brief Serves a request.
         *
         * The query string is split off into `query_params`, the matched
         * route's path parameters are merged into `path_params`, and the
         * route's chain is executed. Unmatched requests, and chains that end
         * without a response, answer 404.
         *
         * @throws Any fault not handled by the route's interceptors.
         */
        [[nodiscard]] Response route(Request request) const;

        [[nodiscard]] const RouteTable &routes() const noexcept { return _routes; }

    private:
        RouteTable _routes;
    };
} // namespace qb::swagger
