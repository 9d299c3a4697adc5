/**
 * @file qbm/swagger/middleware/swagger_json.h
 * @brief Handler serving the API document compiled onto the current route.
 *
 * The route table must have gone through `openapi::inject_docs()`. The
 * handler carries no contract, so its own route does not appear in the
 * document it serves.
 *
 * @code
 * RouteGroup root("/");
 * root.group(RouteGroup("/doc").get(swagger_json()));
 * Router router(openapi::inject_docs(info, root.expand()));
 * @endcode
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Middleware
 */
#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "../routing/interceptor.h"
#include "../routing/route.h"
#include "../openapi/document.h"
#include "../openapi/swagger.h"

namespace qb::swagger {
    class SwaggerJsonHandler : public IInterceptor {
    public:
        /**
         * @param serializer Converts the aggregate document into the response body.
         * @throws std::invalid_argument if `serializer` is empty.
         */
        explicit SwaggerJsonHandler(openapi::DocumentSerializer serializer = openapi::to_swagger_json,
                                    std::string name = "SwaggerJson")
            : _serializer(std::move(serializer)), _name(std::move(name)) {
            if (!_serializer) {
                throw std::invalid_argument("SwaggerJsonHandler: serializer cannot be empty.");
            }
        }

        [[nodiscard]] std::string name() const override {
            return _name;
        }

        /**
         * @brief Answers 200 with the serialized document.
         * @throws std::logic_error if the route carries no compiled document.
         */
        void enter(Context &ctx) override {
            const Route *route = ctx.route();
            if (!route || !route->document) {
                throw std::logic_error("SwaggerJsonHandler: route has no compiled API document, "
                                       "build the route table with openapi::inject_docs()");
            }
            Response response(status::OK, _serializer(*route->document));
            response.set_header("Content-Type", "application/json");
            ctx.set_response(std::move(response));
        }

    private:
        openapi::DocumentSerializer _serializer;
        std::string _name;
    };

    [[nodiscard]] inline std::shared_ptr<SwaggerJsonHandler> swagger_json(
        openapi::DocumentSerializer serializer = openapi::to_swagger_json) {
        return std::make_shared<SwaggerJsonHandler>(std::move(serializer));
    }
} // namespace qb::swagger
