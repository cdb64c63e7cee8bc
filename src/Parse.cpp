/**
 * @file Parse.cpp
 * @brief Implementation of typed value parsing
 */

#include "treemerge/Parse.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <regex>
#include <stdexcept>

namespace treemerge {

namespace {
    std::string to_lower(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    const std::regex& integer_pattern() {
        static const std::regex re("^-?[0-9]+$");
        return re;
    }

    const std::regex& float_pattern() {
        static const std::regex re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
        return re;
    }

    bool wrapped_in(const std::string& str, char open, char close) {
        return str.size() >= 2 && str.front() == open && str.back() == close;
    }
}

nlohmann::json parse_value(const std::string& str) {
    if (str.empty()) {
        return "";
    }

    const std::string lower = to_lower(str);
    if (lower == "true") return true;
    if (lower == "false") return false;
    if (lower == "null") return nullptr;

    if (std::regex_match(str, integer_pattern())) {
        try {
            std::size_t pos = 0;
            const long long val = std::stoll(str, &pos);
            if (pos == str.size()) {
                return static_cast<std::int64_t>(val);
            }
        } catch (const std::out_of_range&) {
            // Too large for int64: keep as text
            return str;
        }
    }

    if (std::regex_match(str, float_pattern())) {
        try {
            std::size_t pos = 0;
            const double val = std::stod(str, &pos);
            if (pos == str.size()) {
                return val;
            }
        } catch (const std::out_of_range&) {
            return str;
        }
    }

    if (wrapped_in(str, '{', '}') || wrapped_in(str, '[', ']')) {
        auto parsed = nlohmann::json::parse(str, nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }

    if (wrapped_in(str, '"', '"')) {
        auto parsed = nlohmann::json::parse(str, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_string()) {
            return parsed;
        }
    }

    return str;
}

} // namespace treemerge
