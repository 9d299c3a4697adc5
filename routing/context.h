/**
 * @file qbm/swagger/routing/context.h
 * @brief Defines the Context class, the state of one exchange while its interceptor chain runs.
 *
 * The `Context` holds the request (mutable, interceptors may replace its
 * parameter maps), the response once an interceptor or the handler produced
 * one, and the compiled route being served.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <optional>
#include <stdexcept>
#include <utility>

#include "../request.h"
#include "../response.h"

namespace qb::swagger {
    struct Route;

    class Context {
    public:
        explicit Context(Request request, const Route *route = nullptr)
            : _request(std::move(request))
            , _route(route) {
        }

        [[nodiscard]] Request &request() noexcept { return _request; }
        [[nodiscard]] const Request &request() const noexcept { return _request; }

        /// True once an interceptor or the handler has produced a response.
        [[nodiscard]] bool has_response() const noexcept { return _response.has_value(); }

        /**
         * @brief The current response.
         * @throws std::logic_error if no response has been produced yet.
         */
        [[nodiscard]] Response &response() {
            if (!_response)
                throw std::logic_error("Context::response(): no response has been produced");
            return *_response;
        }

        [[nodiscard]] const Response &response() const {
            if (!_response)
                throw std::logic_error("Context::response(): no response has been produced");
            return *_response;
        }

        /// Sets the response; during the enter stage this stops the remaining interceptors.
        void set_response(Response response) { _response = std::move(response); }

        /// Route being served, or nullptr when the exchange runs outside a route table.
        [[nodiscard]] const Route *route() const noexcept { return _route; }

    private:
        Request _request;
        std::optional<Response> _response;
        const Route *_route;
    };
} // namespace qb::swagger
