/**
 * @file qbm/swagger/types.h
 * @brief Core HTTP type definitions used by the contract layer
 *
 * This file defines the HTTP method wrapper and the status code helpers
 * shared by the routing table, the runtime interceptors and the
 * documentation serializer. Method and reason phrase names come from llhttp.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Swagger
 */
#pragma once

#include "./utility.h"
#include <llhttp.h>      // For http_method, http_status, http_method_name, http_status_name
#include <functional>    // For std::hash
#include <ostream>
#include <string>
#include <string_view>

namespace qb::swagger {
    /**
     * @brief HTTP method of a route or of an inbound request.
     *
     * Thin wrapper over llhttp's `http_method`. Only the verbs a route table
     * can be declared with are exposed as named constants.
     */
    class Method {
    public:
        enum class Value : int {
            DEL = ::HTTP_DELETE, ///< DELETE method. "DEL" is used as "DELETE" is a C++ reserved keyword.
            GET = ::HTTP_GET,
            HEAD = ::HTTP_HEAD,
            POST = ::HTTP_POST,
            PUT = ::HTTP_PUT,
            OPTIONS = ::HTTP_OPTIONS,
            PATCH = ::HTTP_PATCH
        };

        constexpr Method() : _value(Value::GET) {
        }

        constexpr Method(Value v) : _value(v) {
        }

        constexpr Method(::http_method m) : _value(static_cast<Value>(m)) {
        }

        constexpr bool operator==(Method other) const {
            return _value == other._value;
        }

        constexpr bool operator!=(Method other) const {
            return !(*this == other);
        }

        constexpr bool operator==(Value v) const {
            return _value == v;
        }

        constexpr bool operator!=(Value v) const {
            return _value != v;
        }

        /// Less-than comparison (for maps and sorted route tables).
        constexpr bool operator<(const Method &other) const {
            return static_cast<int>(_value) < static_cast<int>(other._value);
        }

        constexpr operator ::http_method() const {
            return static_cast<::http_method>(_value);
        }

        constexpr operator Value() const {
            return _value;
        }

        /// Upper-case wire name (e.g., "GET", "DELETE").
        [[nodiscard]] std::string str() const {
            const char *name = ::http_method_name(static_cast<::http_method>(_value));
            return name ? name : "UNKNOWN";
        }

        /**
         * @brief Lower-case name used as the operation key of a documentation path item.
         * @return e.g. "get", "delete".
         */
        [[nodiscard]] std::string lower() const {
            return utility::to_lower(str());
        }

        friend std::ostream &operator<<(std::ostream &os, const Method &m) {
            return os << m.str();
        }

        static constexpr Value DEL = Value::DEL;
        static constexpr Value GET = Value::GET;
        static constexpr Value HEAD = Value::HEAD;
        static constexpr Value POST = Value::POST;
        static constexpr Value PUT = Value::PUT;
        static constexpr Value OPTIONS = Value::OPTIONS;
        static constexpr Value PATCH = Value::PATCH;

    private:
        Value _value;
    };

    using method = Method;

    /**
     * @brief Status codes the contract layer answers with by default.
     */
    namespace status {
        constexpr int OK = ::HTTP_STATUS_OK;
        constexpr int CREATED = ::HTTP_STATUS_CREATED;
        constexpr int BAD_REQUEST = ::HTTP_STATUS_BAD_REQUEST;
        constexpr int NOT_FOUND = ::HTTP_STATUS_NOT_FOUND;
        constexpr int UNPROCESSABLE_ENTITY = ::HTTP_STATUS_UNPROCESSABLE_ENTITY;
        constexpr int INTERNAL_SERVER_ERROR = ::HTTP_STATUS_INTERNAL_SERVER_ERROR;

        /**
         * @brief Canonical reason phrase of a status code.
         * @param code Numeric HTTP status code.
         * @return The reason phrase (e.g. "Not Found"), or an empty string for unknown codes.
         */
        [[nodiscard]] inline std::string reason_phrase(int code) {
            if (code < 100 || code > 999)
                return {};
            // http_status_name can return nullptr for codes llhttp does not know
            const char *name = ::http_status_name(static_cast<::http_status>(code));
            return name ? name : "";
        }
    } // namespace status
} // namespace qb::swagger

namespace std {
    template<>
    struct hash<qb::swagger::method> {
        [[nodiscard]] size_t operator()(qb::swagger::method const &m) const noexcept {
            return static_cast<size_t>(static_cast<::http_method>(m));
        }
    };

    [[nodiscard]] inline std::string to_string(qb::swagger::method m) {
        return m.str();
    }
} // namespace std
