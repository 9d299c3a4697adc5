/**
 * @file qbm/swagger/middleware/builders.h
 * @brief Factory functions binding a contract to a handler or an interceptor.
 *
 * Every builder returns an interceptor annotated with the given contract;
 * the documentation compiler merges it into the contract of each route the
 * interceptor is part of.
 *
 * @code
 * auto get_item = handler("get-item",
 *     openapi::Contract::from_json({
 *         {"summary", "Fetch an item"},
 *         {"parameters", {{"path", {{"type", "object"},
 *                                   {"properties", {{"id", {{"type", "integer"}}}}},
 *                                   {"required", {"id"}}}}}}
 *     }),
 *     [](const Request &req) {
 *         return Response(200, {{"id", req.path_params["id"]}});
 *     });
 * @endcode
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Middleware
 */
#pragma once

#include <functional>
#include <string>

#include "../routing/interceptor.h"
#include "../openapi/annotation.h"

namespace qb::swagger {
    using HandlerFn = std::function<Response(const Request &)>;
    using RequestFn = std::function<void(Request &)>;
    using ResponseFn = std::function<void(Response &)>;

    /**
     * @brief Terminal handler answering the request.
     * @throws std::invalid_argument if `fn` is empty.
     */
    [[nodiscard]] InterceptorPtr handler(std::string name, openapi::Contract contract, HandlerFn fn);

    /// Undocumented terminal handler; the route is enforced but left out of the document.
    [[nodiscard]] InterceptorPtr handler(std::string name, HandlerFn fn);

    /// Interceptor transforming the request on enter.
    [[nodiscard]] InterceptorPtr on_request(std::string name, openapi::Contract contract, RequestFn fn);

    /// Interceptor transforming the response on leave, when there is one.
    [[nodiscard]] InterceptorPtr on_response(std::string name, openapi::Contract contract, ResponseFn fn);

    /// Interceptor running `fn` on enter.
    [[nodiscard]] InterceptorPtr before(std::string name, openapi::Contract contract, EnterFn fn);

    /// Interceptor running `fn` on leave.
    [[nodiscard]] InterceptorPtr after(std::string name, openapi::Contract contract, LeaveFn fn);

    /// Interceptor with both an enter and a leave stage.
    [[nodiscard]] InterceptorPtr around(std::string name, openapi::Contract contract, EnterFn enter, LeaveFn leave);

    /**
     * @brief Interceptor transforming the request on enter and the response on leave.
     *
     * Either function may be empty, but not both.
     */
    [[nodiscard]] InterceptorPtr middleware(std::string name, openapi::Contract contract,
                                            RequestFn on_request, ResponseFn on_response);
} // namespace qb::swagger
