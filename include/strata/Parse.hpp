/**
 * @file Parse.hpp
 * @brief String-to-Value typing
 *
 * Two rule sets:
 *
 * parse_value() types a value given on the command line (--set PATH=VALUE,
 * STRATA_* variables). First match wins:
 * - Boolean ("true", "false", case-insensitive)
 * - Null ("null", case-insensitive)
 * - Integer (^-?[0-9]+$, fits in int64)
 * - Float (^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - JSON compound ({...} or [...])
 * - Quoted string ("...", JSON escapes)
 * - Raw string (fallback)
 *
 * resolve_plain_scalar() types an unquoted YAML scalar with the YAML 1.2
 * core schema.
 */

#ifndef STRATA_PARSE_HPP
#define STRATA_PARSE_HPP

#include "strata/Value.hpp"
#include <string>

namespace strata {

/**
 * @brief Parse a command-line string value to the appropriate type
 *
 * Examples:
 * ```cpp
 * parse_value("true")       // -> true (boolean)
 * parse_value("NULL")       // -> null
 * parse_value("-17")        // -> -17 (integer)
 * parse_value("-2.5e10")    // -> -2.5e10 (float)
 * parse_value("[1,2,3]")    // -> [1, 2, 3] (sequence)
 * parse_value("\"42\"")     // -> "42" (string, unquoted)
 * parse_value("hello")      // -> "hello" (string)
 * parse_value("")           // -> "" (empty string)
 * ```
 */
Value parse_value(const std::string& str);

/**
 * @brief Resolve an unquoted YAML scalar (YAML 1.2 core schema)
 *
 * - "", "~", "null", "Null", "NULL" -> null
 * - "true"/"True"/"TRUE", "false"/"False"/"FALSE" -> boolean
 * - [-+]?[0-9]+, 0o[0-7]+, 0x[0-9a-fA-F]+ -> integer
 * - [-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)? -> float
 * - [-+]?(.inf|.Inf|.INF), .nan/.NaN/.NAN -> float
 * - anything else -> string
 *
 * Integers too large for 64 bits are read as floats.
 */
Value resolve_plain_scalar(const std::string& str);

} // namespace strata

#endif // STRATA_PARSE_HPP
