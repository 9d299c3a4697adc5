/**
 * @file qbm/swagger/middleware/coerce_request.h
 * @brief Interceptor coercing inbound request parameters against the route contract.
 *
 * On enter, the interceptor reads the merged `parameters` of the current
 * route, builds the composite request schema and coerces the request record
 * with the configured coercion function (string coercion by default). On
 * success the request's parameter maps are replaced by the coerced values,
 * so that `"42"` reaches the handler as `42`. On a mismatch the exchange is
 * answered with the unprocessable status (422 by default) and a body
 * `{"error": <explanation>}`.
 *
 * The interceptor documents its own 422 response.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Middleware
 */
#pragma once

#include <memory>
#include <string>
#include <utility>

#include "../routing/interceptor.h"
#include "../routing/route.h"
#include "../openapi/contract.h"
#include "../validation/explain.h"
#include "../options.h"
#include "../logger.h"

namespace qb::swagger {
    class CoerceRequestInterceptor : public IInterceptor {
    public:
        explicit CoerceRequestInterceptor(Options options = {}, std::string name = "CoerceRequest")
            : _options(std::move(options)), _name(std::move(name)) {
            _contract.responses[_options.unprocessable_status()] = openapi::ResponseSpec{};
        }

        [[nodiscard]] std::string name() const override {
            return _name;
        }

        void enter(Context &ctx) override {
            const Route *route = ctx.route();
            if (!route || !route->contract || route->contract->parameters.empty())
                return;

            auto result = _options.coerce_request()(route->contract->parameters, ctx.request().to_record());
            if (result) {
                ctx.request().assign_record(result.value());
                return;
            }

            LOG_SWAGGER_DEBUG("CoerceRequest [" << _name << "]: " << route->method << " " << route->path
                << " rejected - " << result.mismatch().error.to_string());
            reject(ctx, result.mismatch());
        }

        /**
         * @brief Answers request-side `SchemaMismatchError`s raised by inner stages.
         *
         * Response-side mismatches and faults of any other kind are rethrown unchanged.
         */
        void error(Context &ctx, std::exception_ptr fault) override {
            try {
                std::rethrow_exception(fault);
            } catch (const validation::SchemaMismatchError &e) {
                if (e.direction() != validation::Direction::REQUEST)
                    throw;
                LOG_SWAGGER_DEBUG("CoerceRequest [" << _name << "]: recovered " << e.what());
                reject(ctx, e.mismatch());
            }
        }

        [[nodiscard]] const openapi::Contract *annotation() const override {
            return &_contract;
        }

    private:
        Options _options;
        std::string _name;
        openapi::Contract _contract;

        void reject(Context &ctx, const validation::SchemaMismatch &mismatch) const {
            ctx.set_response(Response::error(_options.unprocessable_status(), _options.error_key(),
                                             validation::explain(mismatch.error)));
        }
    };

    /**
     * @brief Creates a request-coercion interceptor.
     * @param options Status code, error key and coercion function.
     */
    [[nodiscard]] inline std::shared_ptr<CoerceRequestInterceptor> coerce_request(Options options = {}) {
        return std::make_shared<CoerceRequestInterceptor>(std::move(options));
    }
} // namespace qb::swagger
