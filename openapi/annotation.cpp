/**
 * @file qbm/swagger/openapi/annotation.cpp
 * @brief Implementation of contract attachment.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup OpenAPI
 */
#include "./annotation.h"

#include <stdexcept>

namespace qb::swagger::openapi {

AnnotatedInterceptor::AnnotatedInterceptor(Contract contract, InterceptorPtr inner)
    : _inner(std::move(inner))
    , _contract(std::move(contract)) {
    if (!_inner) {
        throw std::invalid_argument("AnnotatedInterceptor: inner interceptor cannot be null.");
    }
}

InterceptorPtr annotate(Contract contract, InterceptorPtr interceptor) {
    if (!interceptor) {
        throw std::invalid_argument("annotate(): interceptor cannot be null.");
    }
    if (auto annotated = std::dynamic_pointer_cast<AnnotatedInterceptor>(interceptor)) {
        return std::make_shared<AnnotatedInterceptor>(merge(*annotated->annotation(), contract),
                                                      annotated->inner());
    }
    if (const Contract *own = interceptor->annotation())
        contract = merge(*own, contract);
    return std::make_shared<AnnotatedInterceptor>(std::move(contract), std::move(interceptor));
}

const Contract *annotation(const IInterceptor &interceptor) {
    return interceptor.annotation();
}

const Contract *annotation(const Route &route) {
    return route.contract.get();
}

} // namespace qb::swagger::openapi
