/**
 * @file Parse.cpp
 * @brief Implementation of plain scalar typing
 */

#include "permforge/Parse.hpp"
#include "permforge/Util.hpp"
#include <cstdint>
#include <regex>

namespace permforge {

namespace {
    bool matches_regex(const std::string& str, const std::regex& re) {
        return std::regex_match(str, re);
    }

    const std::regex& integer_pattern() {
        static const std::regex re("^[-+]?[0-9]+$");
        return re;
    }

    const std::regex& float_pattern() {
        static const std::regex re("^[-+]?[0-9]*\\.[0-9]+([eE][+-]?[0-9]+)?$");
        return re;
    }
}

Value parse_scalar(const std::string& str) {
    // Empty plain scalar
    if (str.empty() || str == "~") {
        return nullptr;
    }

    // Boolean
    std::string lower = to_lower(str);
    if (lower == "true") {
        return true;
    }
    if (lower == "false") {
        return false;
    }

    // Null
    if (lower == "null") {
        return nullptr;
    }

    // Integer
    if (matches_regex(str, integer_pattern())) {
        try {
            size_t pos = 0;
            long long val = std::stoll(str, &pos);
            if (pos == str.size()) {
                return static_cast<int64_t>(val);
            }
        } catch (const std::out_of_range&) {
            // Too large for int64: keep the text
        }
    }

    // Float
    if (matches_regex(str, float_pattern())) {
        try {
            size_t pos = 0;
            double val = std::stod(str, &pos);
            if (pos == str.size()) {
                return val;
            }
        } catch (const std::out_of_range&) {
            // Overflows double: keep the text
        }
    }

    // Anything else stays a string
    return str;
}

} // namespace permforge
