#include "./options.h"

#include <stdexcept>

namespace qb::swagger {

Options::Options()
    : _coerce_request(validation::make_coerce_request(validation::string_coercion_matcher()))
    , _validate_response(validation::make_validate_response(validation::no_coercion())) {}

Options &
Options::unprocessable_status(int status) {
    _unprocessable_status = status;
    return *this;
}

Options &
Options::internal_error_status(int status) {
    _internal_error_status = status;
    return *this;
}

Options &
Options::bad_request_status(int status) {
    _bad_request_status = status;
    return *this;
}

Options &
Options::error_key(std::string key) {
    _error_key = std::move(key);
    return *this;
}

Options &
Options::coerce_request(validation::RequestCoercionFn fn) {
    if (!fn) {
        throw std::invalid_argument("Options::coerce_request(): function cannot be empty.");
    }
    _coerce_request = std::move(fn);
    return *this;
}

Options &
Options::validate_response(validation::ResponseValidationFn fn) {
    if (!fn) {
        throw std::invalid_argument("Options::validate_response(): function cannot be empty.");
    }
    _validate_response = std::move(fn);
    return *this;
}

} // namespace qb::swagger
