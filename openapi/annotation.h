/**
 * @file qbm/swagger/openapi/annotation.h
 * @brief Attaching contracts to interceptors and reading them back.
 *
 * `annotate()` wraps an interceptor in an `AnnotatedInterceptor` that
 * forwards every stage unchanged and additionally carries a contract
 * fragment. The documentation compiler reads the fragments back with
 * `annotation()`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup OpenAPI
 */
#pragma once

#include <memory>

#include "./contract.h"
#include "../routing/interceptor.h"
#include "../routing/route.h"

namespace qb::swagger::openapi {

/**
 * @brief Decorator adding a contract to an interceptor without altering its behaviour.
 */
class AnnotatedInterceptor : public IInterceptor {
private:
    InterceptorPtr _inner;
    Contract _contract;

public:
    /**
     * @throws std::invalid_argument if `inner` is null.
     */
    AnnotatedInterceptor(Contract contract, InterceptorPtr inner);

    std::string name() const override { return _inner->name(); }

    void enter(Context &ctx) override { _inner->enter(ctx); }

    void leave(Context &ctx) override { _inner->leave(ctx); }

    void error(Context &ctx, std::exception_ptr fault) override { _inner->error(ctx, std::move(fault)); }

    const Contract *annotation() const override { return &_contract; }

    [[nodiscard]] const InterceptorPtr &inner() const noexcept { return _inner; }
};

/**
 * @brief Attaches a contract to an interceptor.
 *
 * If `interceptor` already carries a contract, the new one is merged over
 * it; the result wraps the original interceptor only once.
 *
 * @throws std::invalid_argument if `interceptor` is null.
 */
[[nodiscard]] InterceptorPtr annotate(Contract contract, InterceptorPtr interceptor);

/// Contract carried by an interceptor, or nullptr.
[[nodiscard]] const Contract *annotation(const IInterceptor &interceptor);

/// Merged contract of a compiled route, or nullptr before `inject_docs()`.
[[nodiscard]] const Contract *annotation(const Route &route);

} // namespace qb::swagger::openapi
