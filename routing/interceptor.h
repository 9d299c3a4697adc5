/**
 * @file qbm/swagger/routing/interceptor.h
 * @brief Defines the IInterceptor interface and the function-backed interceptor.
 *
 * An interceptor takes part in an exchange in up to three stages: `enter`
 * on the way in (outer to inner), `leave` on the way out (inner to outer)
 * and `error` on the way out when a stage below it raised. The terminal
 * handler of a route is an interceptor whose `enter` produces the response.
 *
 * An interceptor may carry a contract fragment (see `openapi/annotation.h`);
 * the documentation compiler folds the fragments of every interceptor on a
 * route into the route's contract.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "./context.h"

namespace qb::swagger {
    namespace openapi {
        struct Contract;
    }

    class IInterceptor {
    public:
        virtual ~IInterceptor() = default;

        /**
         * @brief Returns the name of the interceptor instance, for logging/debugging.
         */
        virtual std::string name() const = 0;

        virtual void enter(Context &ctx) { (void) ctx; }

        virtual void leave(Context &ctx) { (void) ctx; }

        /**
         * @brief Handles a fault raised by an inner stage.
         *
         * Returning normally marks the fault as handled and resumes the leave
         * stage with the next outer interceptor. The default implementation
         * rethrows, passing the fault outward unchanged.
         */
        virtual void error(Context &ctx, std::exception_ptr fault) {
            (void) ctx;
            std::rethrow_exception(fault);
        }

        /// Contract fragment carried by this interceptor, or nullptr.
        virtual const openapi::Contract *annotation() const { return nullptr; }
    };

    using InterceptorPtr = std::shared_ptr<IInterceptor>;

    using EnterFn = std::function<void(Context &)>;
    using LeaveFn = std::function<void(Context &)>;
    using ErrorFn = std::function<void(Context &, std::exception_ptr)>;

    /**
     * @brief Interceptor built from plain functions; any stage may be left empty.
     */
    class FunctionalInterceptor : public IInterceptor {
    private:
        std::string _name;
        EnterFn _enter;
        LeaveFn _leave;
        ErrorFn _error;

    public:
        FunctionalInterceptor(std::string name, EnterFn enter, LeaveFn leave = {}, ErrorFn error = {})
            : _name(std::move(name))
            , _enter(std::move(enter))
            , _leave(std::move(leave))
            , _error(std::move(error)) {
            if (!_enter && !_leave && !_error) {
                throw std::invalid_argument("FunctionalInterceptor: at least one stage function is required.");
            }
        }

        std::string name() const override { return _name; }

        void enter(Context &ctx) override {
            if (_enter)
                _enter(ctx);
        }

        void leave(Context &ctx) override {
            if (_leave)
                _leave(ctx);
        }

        void error(Context &ctx, std::exception_ptr fault) override {
            if (_error)
                _error(ctx, std::move(fault));
            else
                std::rethrow_exception(fault);
        }
    };
} // namespace qb::swagger
