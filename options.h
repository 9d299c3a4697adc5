/**
 * @file qbm/swagger/options.h
 * @brief Configuration shared by the contract-enforcing interceptors.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Swagger
 */
#pragma once

#include <string>

#include "./types.h"
#include "./validation/adapter.h"

namespace qb::swagger {

/**
 * @brief Options of the request-coercion, response-validation and body-parsing interceptors.
 */
class Options {
private:
    int _unprocessable_status = status::UNPROCESSABLE_ENTITY; ///< Answered on a request mismatch
    int _internal_error_status = status::INTERNAL_SERVER_ERROR; ///< Answered on a response mismatch
    int _bad_request_status = status::BAD_REQUEST; ///< Answered on an undecodable body
    std::string _error_key = "error"; ///< Key of the error payload in error bodies
    validation::RequestCoercionFn _coerce_request;
    validation::ResponseValidationFn _validate_response;

public:
    /**
     * @brief Default options: string coercion for requests, pure validation for responses.
     */
    Options();

    Options &unprocessable_status(int status);
    Options &internal_error_status(int status);
    Options &bad_request_status(int status);
    Options &error_key(std::string key);

    /**
     * @brief Replaces the request coercion function.
     * @throws std::invalid_argument if `fn` is empty.
     */
    Options &coerce_request(validation::RequestCoercionFn fn);

    /**
     * @brief Replaces the response validation function.
     * @throws std::invalid_argument if `fn` is empty.
     */
    Options &validate_response(validation::ResponseValidationFn fn);

    [[nodiscard]] int unprocessable_status() const { return _unprocessable_status; }
    [[nodiscard]] int internal_error_status() const { return _internal_error_status; }
    [[nodiscard]] int bad_request_status() const { return _bad_request_status; }
    [[nodiscard]] const std::string &error_key() const { return _error_key; }
    [[nodiscard]] const validation::RequestCoercionFn &coerce_request() const { return _coerce_request; }
    [[nodiscard]] const validation::ResponseValidationFn &validate_response() const { return _validate_response; }
};

} // namespace qb::swagger
