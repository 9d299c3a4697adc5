/**
 * @file qbm/swagger/validation/explain.h
 * @brief Renders a schema failure tree as a JSON error map.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Validation
 */
#pragma once

#include <qb/json.h>
#include "./error.h"

namespace qb::swagger::validation {

/**
 * @brief Converts a failure tree into a nested error map keyed like the rejected value.
 *
 * - a named failure wrapping a map is explained as that map;
 * - a named failure wrapping anything else is explained as its name;
 * - a map is explained key by key;
 * - a sequence is explained element by element, valid elements as null;
 * - any other failure is explained by its printable rendering.
 *
 * @code
 * // {"headers": {"auth": "missing-required-key"}}
 * qb::json body = explain(mismatch.error);
 * @endcode
 */
[[nodiscard]] qb::json explain(const SchemaError &error);

} // namespace qb::swagger::validation
