/**
 * @file qbm/swagger/routing/chain.h
 * @brief Synchronous interceptor chain runner.
 *
 * The chain runs `enter` on each interceptor in order until one of them
 * produces a response, then unwinds the interceptors it entered in reverse
 * order calling `leave`. When a stage raises, the fault is offered to the
 * `error` stage of each remaining interceptor on the way out; an interceptor
 * that returns from `error` handles the fault and the unwinding resumes with
 * `leave`. A fault nobody handles is rethrown unchanged by `execute()`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <exception>
#include <string>
#include <vector>

#include "./interceptor.h"

namespace qb::swagger {
    /// Printable description of a captured fault, for logging.
    [[nodiscard]] std::string describe(const std::exception_ptr &fault);

    class Chain {
    public:
        explicit Chain(std::vector<InterceptorPtr> interceptors);

        /**
         * @brief Runs the exchange through the chain.
         * @param ctx The exchange state.
         * @throws Any fault raised by a stage and not handled by an `error` stage.
         */
        void execute(Context &ctx) const;

        [[nodiscard]] const std::vector<InterceptorPtr> &interceptors() const noexcept { return _interceptors; }

    private:
        std::vector<InterceptorPtr> _interceptors;
    };
} // namespace qb::swagger
