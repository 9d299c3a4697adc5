/**
 * @file qbm/swagger/middleware/builders.cpp
 * @brief Implementation of the annotated handler and interceptor builders.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Middleware
 */
#include "./builders.h"

#include <memory>
#include <stdexcept>

namespace qb::swagger {
    namespace {
        InterceptorPtr make_handler(std::string name, HandlerFn fn) {
            if (!fn) {
                throw std::invalid_argument("handler(): function cannot be empty.");
            }
            return std::make_shared<FunctionalInterceptor>(
                std::move(name),
                [fn = std::move(fn)](Context &ctx) { ctx.set_response(fn(ctx.request())); });
        }

        EnterFn wrap_request(RequestFn fn) {
            if (!fn)
                return {};
            return [fn = std::move(fn)](Context &ctx) { fn(ctx.request()); };
        }

        LeaveFn wrap_response(ResponseFn fn) {
            if (!fn)
                return {};
            return [fn = std::move(fn)](Context &ctx) {
                if (ctx.has_response())
                    fn(ctx.response());
            };
        }
    } // namespace

    InterceptorPtr handler(std::string name, openapi::Contract contract, HandlerFn fn) {
        return openapi::annotate(std::move(contract), make_handler(std::move(name), std::move(fn)));
    }

    InterceptorPtr handler(std::string name, HandlerFn fn) {
        return make_handler(std::move(name), std::move(fn));
    }

    InterceptorPtr on_request(std::string name, openapi::Contract contract, RequestFn fn) {
        return middleware(std::move(name), std::move(contract), std::move(fn), {});
    }

    InterceptorPtr on_response(std::string name, openapi::Contract contract, ResponseFn fn) {
        return middleware(std::move(name), std::move(contract), {}, std::move(fn));
    }

    InterceptorPtr before(std::string name, openapi::Contract contract, EnterFn fn) {
        return around(std::move(name), std::move(contract), std::move(fn), {});
    }

    InterceptorPtr after(std::string name, openapi::Contract contract, LeaveFn fn) {
        return around(std::move(name), std::move(contract), {}, std::move(fn));
    }

    InterceptorPtr around(std::string name, openapi::Contract contract, EnterFn enter, LeaveFn leave) {
        return openapi::annotate(std::move(contract),
                                 std::make_shared<FunctionalInterceptor>(std::move(name), std::move(enter),
                                                                         std::move(leave)));
    }

    InterceptorPtr middleware(std::string name, openapi::Contract contract,
                              RequestFn on_request, ResponseFn on_response) {
        return around(std::move(name), std::move(contract),
                      wrap_request(std::move(on_request)), wrap_response(std::move(on_response)));
    }
} // namespace qb::swagger
