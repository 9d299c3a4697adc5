/**
 * @file qbm/swagger/middleware/body_params.cpp
 * @brief Implementation of the body-parsing interceptor and the default parsers.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Middleware
 */
#include "./body_params.h"
#include "../logger.h"
#include "../utility.h"

namespace qb::swagger {
    BodyParser json_parser() {
        return [](Request &request) {
            request.body_params = qb::json::parse(request.body);
        };
    }

    BodyParser form_parser() {
        return [](Request &request) {
            request.form_params = parse_urlencoded(request.body);
        };
    }

    ParserMap default_parsers() {
        return {
            {"application/json", json_parser()},
            {"application/x-www-form-urlencoded", form_parser()}
        };
    }

    BodyParamsInterceptor::BodyParamsInterceptor(ParserMap parsers, Options options, std::string name)
        : _options(std::move(options)), _name(std::move(name)) {
        for (auto &[media_type, parser] : parsers) {
            if (!parser) {
                throw std::invalid_argument("BodyParamsInterceptor: parser for '" + media_type + "' cannot be empty.");
            }
            _contract.consumes.push_back(media_type);
            _parsers.emplace(utility::to_lower(media_type), std::move(parser));
        }
        _contract.responses[_options.bad_request_status()] = openapi::ResponseSpec{};
    }

    void BodyParamsInterceptor::enter(Context &ctx) {
        auto &request = ctx.request();
        if (request.body.empty())
            return;

        auto it = _parsers.find(request.content_type());
        if (it == _parsers.end())
            return;

        try {
            it->second(request);
        } catch (const std::exception &e) {
            LOG_SWAGGER_WARN("BodyParams [" << _name << "]: cannot decode " << it->first << " body of "
                << request.method << " " << request.path << " - " << e.what());
            reject(ctx);
        }
    }

    void BodyParamsInterceptor::error(Context &ctx, std::exception_ptr fault) {
        try {
            std::rethrow_exception(fault);
        } catch (const DeserializationError &e) {
            LOG_SWAGGER_WARN("BodyParams [" << _name << "]: recovered " << e.what());
            reject(ctx);
        }
    }

    void BodyParamsInterceptor::reject(Context &ctx) const {
        Response response(_options.bad_request_status(), DESERIALIZATION_ERROR_MESSAGE);
        response.set_header("Content-Type", "text/plain");
        ctx.set_response(std::move(response));
    }
} // namespace qb::swagger
