/**
 * @file qbm/swagger/utility.h
 * @brief String helpers shared by the request record, the body parsers and the validators.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Swagger
 */
#pragma once

#include <algorithm>     // For std::transform
#include <cctype>        // For std::tolower
#include <string>        // For std::string
#include <string_view>   // For std::string_view

#include <qb/json.h>

namespace qb::swagger::utility {
    /**
     * @brief ASCII lower-case copy of a string.
     * @note Header names, media types and method names are ASCII; other bytes are left as-is.
     */
    [[nodiscard]] inline std::string
    to_lower(std::string_view in) {
        std::string out(in);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    /**
     * @brief Compact JSON text of a value received from a client.
     *
     * Invalid UTF-8 in strings is replaced by U+FFFD instead of throwing,
     * so diagnostics can always be built from raw request data.
     */
    [[nodiscard]] inline std::string
    dump(const qb::json &value) {
        return value.dump(-1, ' ', false, qb::json::error_handler_t::replace);
    }
} // namespace qb::swagger::utility
