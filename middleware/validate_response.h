/**
 * @file qbm/swagger/middleware/validate_response.h
 * @brief Interceptor validating outbound responses against the route contract.
 *
 * On leave, the interceptor selects the response entry declared for the
 * response status (the exact code, else `default`). When one is found the
 * response `{body, headers}` is validated (no coercion by default); a
 * mismatch replaces the response with the internal-error status (500 by
 * default) and `{"error": <explanation>}`. Statuses without an entry pass
 * through unchecked.
 *
 * The interceptor documents its own 500 response.
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
    class ValidateResponseInterceptor : public IInterceptor {
    public:
        explicit ValidateResponseInterceptor(Options options = {}, std::string name = "ValidateResponse")
            : _options(std::move(options)), _name(std::move(name)) {
            _contract.responses[_options.internal_error_status()] = openapi::ResponseSpec{};
        }

        [[nodiscard]] std::string name() const override {
            return _name;
        }

        void leave(Context &ctx) override {
            const Route *route = ctx.route();
            if (!route || !route->contract || !ctx.has_response())
                return;

            const auto *entry = validation::select_response(route->contract->responses, ctx.response().status);
            if (!entry)
                return;

            auto result = _options.validate_response()(*entry, ctx.response().to_record());
            if (result) {
                ctx.response().assign_record(result.value());
                return;
            }

            LOG_SWAGGER_DEBUG("ValidateResponse [" << _name << "]: " << route->method << " " << route->path
                << " answered " << ctx.response().status << " outside its contract - "
                << result.mismatch().error.to_string());
            reject(ctx, result.mismatch());
        }

        /**
         * @brief Answers response-side `SchemaMismatchError`s raised by inner stages.
         *
         * Request-side mismatches and faults of any other kind are rethrown unchanged.
         */
        void error(Context &ctx, std::exception_ptr fault) override {
            try {
                std::rethrow_exception(fault);
            } catch (const validation::SchemaMismatchError &e) {
                if (e.direction() != validation::Direction::RESPONSE)
                    throw;
                LOG_SWAGGER_DEBUG("ValidateResponse [" << _name << "]: recovered " << e.what());
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
            ctx.set_response(Response::error(_options.internal_error_status(), _options.error_key(),
                                             validation::explain(mismatch.error)));
        }
    };

    /**
     * @brief Creates a response-validation interceptor.
     * @param options Status code, error key and validation function.
     */
    [[nodiscard]] inline std::shared_ptr<ValidateResponseInterceptor> validate_response(Options options = {}) {
        return std::make_shared<ValidateResponseInterceptor>(std::move(options));
    }
} // namespace qb::swagger
