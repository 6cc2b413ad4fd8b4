/**
 * @file Parse.cpp
 * @brief Implementation of command line value typing
 */

#include "jpatch/Parse.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <regex>
#include <stdexcept>

namespace jpatch {

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
}

Element parse_value(const std::string& str) {
    if (str.empty()) {
        return Element(std::string());
    }

    const std::string lower = to_lower(str);
    if (lower == "true") {
        return Element(true);
    }
    if (lower == "false") {
        return Element(false);
    }
    if (lower == "null") {
        return Element(nullptr);
    }

    if (std::regex_match(str, integer_pattern())) {
        try {
            size_t pos = 0;
            long long val = std::stoll(str, &pos);
            if (pos == str.size()) {
                return Element(Number(static_cast<std::int64_t>(val)));
            }
        } catch (const std::out_of_range&) {
            // Too large for int64; the JSON decoder below keeps it exact
            // (as unsigned) or falls back to a double
        }
    }

    if (std::regex_match(str, float_pattern())) {
        try {
            size_t pos = 0;
            double val = std::stod(str, &pos);
            if (pos == str.size()) {
                return Element(Number(val));
            }
        } catch (const std::out_of_range&) {
            // Fall through to the raw string
        }
    }

    const bool compound = (str.front() == '{' && str.back() == '}') ||
                          (str.front() == '[' && str.back() == ']');
    const bool quoted = str.size() >= 2 && str.front() == '"' && str.back() == '"';
    const bool digits = std::regex_match(str, integer_pattern());

    if (compound || quoted || digits) {
        Json parsed = Json::parse(str, nullptr, false);
        if (!parsed.is_discarded()) {
            return Element::from_json(parsed);
        }
    }

    return Element(str);
}

} // namespace jpatch
