/**
 * @file Parse.hpp
 * @brief Typing of values given inline on the command line
 *
 * `jpatch add /port 8080` should add the number 8080, not the string
 * "8080". Parsing order (first match wins):
 * - Boolean ("true", "false" - case insensitive)
 * - Null ("null" - case insensitive)
 * - Integer (matches ^-?[0-9]+$)
 * - Float (matches ^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - JSON Compound ({...} or [...])
 * - Quoted String ("...", JSON escapes applied)
 * - Raw String (fallback)
 */

#ifndef JPATCH_PARSE_HPP
#define JPATCH_PARSE_HPP

#include "jpatch/Element.hpp"
#include <string>

namespace jpatch {

/**
 * @brief Parse a command line argument into a typed value
 *
 * Examples:
 * ```cpp
 * parse_value("TRUE")       // → true (boolean)
 * parse_value("null")       // → null
 * parse_value("-17")        // → -17 (integer)
 * parse_value("2.5e3")      // → 2500.0 (float)
 * parse_value("[1,2]")      // → [1, 2] (array)
 * parse_value("\"42\"")     // → "42" (string, unquoted)
 * parse_value("hello")      // → "hello" (string)
 * parse_value("")           // → "" (empty string)
 * ```
 */
Element parse_value(const std::string& str);

} // namespace jpatch

#endif // JPATCH_PARSE_HPP
