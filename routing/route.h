/**
 * @file qbm/swagger/routing/route.h
 * @brief Defines a flat route entry: path template, method and interceptor list.
 *
 * Routes are produced by expanding a `RouteGroup` tree. The interceptor list
 * is ordered outer to inner and ends with the terminal handler. After
 * `inject_docs()`, every route also carries its merged contract and the
 * aggregate API document.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "../types.h"
#include "./interceptor.h"

namespace qb::swagger {
    namespace openapi {
        struct Contract;
        struct AggregateDocument;
    }

    struct Route {
        std::string path;           ///< Path template, e.g. "/x/:id".
        Method method;
        std::vector<InterceptorPtr> interceptors;

        std::shared_ptr<const openapi::Contract> contract;          ///< Set by inject_docs().
        std::shared_ptr<const openapi::AggregateDocument> document; ///< Set by inject_docs().

        /// Terminal handler, or nullptr for an empty interceptor list.
        [[nodiscard]] const IInterceptor *handler() const {
            return interceptors.empty() ? nullptr : interceptors.back().get();
        }
    };

    using RouteTable = std::vector<Route>;
} // namespace qb::swagger
