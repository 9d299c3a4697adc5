/**
 * @file qbm/swagger/routing/chain.cpp
 * @brief Implementation of the synchronous interceptor chain runner.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#include "./chain.h"
#include "../logger.h"

#include <stdexcept>

namespace qb::swagger {
    std::string describe(const std::exception_ptr &fault) {
        if (!fault)
            return "no fault";
        try {
            std::rethrow_exception(fault);
        } catch (const std::exception &e) {
            return e.what();
        } catch (...) {
            return "non-standard exception";
        }
    }

    Chain::Chain(std::vector<InterceptorPtr> interceptors)
        : _interceptors(std::move(interceptors)) {
        for (const auto &interceptor : _interceptors) {
            if (!interceptor) {
                throw std::invalid_argument("Chain: interceptor pointer cannot be null.");
            }
        }
    }

    void Chain::execute(Context &ctx) const {
        std::size_t entered = 0;
        std::exception_ptr fault;

        for (const auto &interceptor : _interceptors) {
            if (ctx.has_response())
                break;
            ++entered;
            try {
                interceptor->enter(ctx);
            } catch (...) {
                fault = std::current_exception();
                LOG_SWAGGER_DEBUG("Chain: enter() of [" << interceptor->name() << "] raised - "
                    << "Method: " << ctx.request().method << ", "
                    << "Path: " << ctx.request().path << ", "
                    << "Error: " << describe(fault));
                break;
            }
        }

        while (entered > 0) {
            const auto &interceptor = _interceptors[--entered];
            if (fault) {
                std::exception_ptr pending = fault;
                fault = nullptr;
                try {
                    interceptor->error(ctx, pending);
                } catch (...) {
                    fault = std::current_exception();
                }
            } else {
                try {
                    interceptor->leave(ctx);
                } catch (...) {
                    fault = std::current_exception();
                    LOG_SWAGGER_DEBUG("Chain: leave() of [" << interceptor->name() << "] raised - "
                        << describe(fault));
                }
            }
        }

        if (fault) {
            LOG_SWAGGER_ERROR("Chain: unhandled fault - "
                << "Method: " << ctx.request().method << ", "
                << "Path: " << ctx.request().path << ", "
                << "Error: " << describe(fault));
            std::rethrow_exception(fault);
        }
    }
} // namespace qb::swagger
