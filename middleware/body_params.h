/**
 * @file qbm/swagger/middleware/body_params.h
 * @brief Interceptor decoding the raw request body into structured parameters.
 *
 * The parser is chosen by the request media type, compared without its
 * parameters and case-insensitively. By default `application/json` fills
 * `body-params` and `application/x-www-form-urlencoded` fills `form-params`.
 * Requests with an empty body or an unknown media type pass through. A body
 * the parser rejects is answered with the bad-request status (400 by
 * default) and an opaque message.
 *
 * The interceptor documents its 400 response and its media types as
 * `consumes`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Middleware
 */
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include "../routing/interceptor.h"
#include "../openapi/contract.h"
#include "../options.h"

namespace qb::swagger {
    /// Message of the bad-request body; parser details are only logged.
    constexpr const char *DESERIALIZATION_ERROR_MESSAGE = "Deserialisation error";

    /**
     * @brief Raised when a request body cannot be decoded.
     */
    class DeserializationError : public std::runtime_error {
    public:
        explicit DeserializationError(const std::string &what)
            : std::runtime_error(what) {}
    };

    /// Decodes `request.body` into the request's parameter maps; throws on malformed input.
    using BodyParser = std::function<void(Request &)>;
    /// Parsers keyed by media type (e.g. "application/json").
    using ParserMap = std::map<std::string, BodyParser>;

    /// JSON parser filling `body_params`.
    [[nodiscard]] BodyParser json_parser();

    /// URL-encoded form parser filling `form_params`.
    [[nodiscard]] BodyParser form_parser();

    /// `application/json` and `application/x-www-form-urlencoded` parsers.
    [[nodiscard]] ParserMap default_parsers();

    class BodyParamsInterceptor : public IInterceptor {
    public:
        /**
         * @throws std::invalid_argument if a parser is empty.
         */
        explicit BodyParamsInterceptor(ParserMap parsers = default_parsers(), Options options = {},
                                       std::string name = "BodyParams");

        [[nodiscard]] std::string name() const override {
            return _name;
        }

        void enter(Context &ctx) override;

        /**
         * @brief Answers `DeserializationError`s raised by inner stages; other faults are rethrown.
         */
        void error(Context &ctx, std::exception_ptr fault) override;

        [[nodiscard]] const openapi::Contract *annotation() const override {
            return &_contract;
        }

    private:
        ParserMap _parsers;
        Options _options;
        std::string _name;
        openapi::Contract _contract;

        void reject(Context &ctx) const;
    };

    /**
     * @brief Creates a body-parsing interceptor.
     * @param parsers Parsers keyed by media type.
     * @param options Bad-request status.
     */
    [[nodiscard]] inline std::shared_ptr<BodyParamsInterceptor> body_params(ParserMap parsers = default_parsers(),
                                                                            Options options = {}) {
        return std::make_shared<BodyParamsInterceptor>(std::move(parsers), std::move(options));
    }
} // namespace qb::swagger
