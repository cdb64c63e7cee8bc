/**
 * @file Parse.hpp
 * @brief String-to-value parsing for environment variables and CLI overrides
 *
 * Parsing order (first match wins):
 * - Boolean ("true", "false", case insensitive)
 * - Null ("null", case insensitive)
 * - Integer (^-?[0-9]+$)
 * - Float (^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - JSON compound ({...} or [...])
 * - Quoted string ("...")
 * - Raw string (fallback)
 */

#ifndef TREEMERGE_PARSE_HPP
#define TREEMERGE_PARSE_HPP

#include <nlohmann/json.hpp>

#include <string>

namespace treemerge {

/**
 * @brief Parse a string into a typed configuration value
 *
 * Examples:
 * ```cpp
 * parse_value("true")      // → true
 * parse_value("8")         // → 8
 * parse_value("0.5")       // → 0.5
 * parse_value("[1,2]")     // → [1, 2]
 * parse_value("\"8\"")     // → "8"
 * parse_value("newer_wins") // → "newer_wins"
 * ```
 *
 * @param str Input text
 * @return Parsed value; never throws for malformed input
 */
nlohmann::json parse_value(const std::string& str);

} // namespace treemerge

#endif // TREEMERGE_PARSE_HPP
