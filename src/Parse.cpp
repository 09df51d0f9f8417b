/**
 * @file Parse.cpp
 * @brief Implementation of string typing
 */

#include "strata/Parse.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <regex>
#include <stdexcept>

namespace strata {

namespace {
    /**
     * @brief Convert string to lowercase
     */
    std::string to_lower(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                      [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    const std::regex& cli_integer_re() {
        static const std::regex re("^-?[0-9]+$");
        return re;
    }

    const std::regex& cli_float_re() {
        static const std::regex re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
        return re;
    }

    const std::regex& yaml_decimal_re() {
        static const std::regex re("^[-+]?[0-9]+$");
        return re;
    }

    const std::regex& yaml_float_re() {
        static const std::regex re("^[-+]?(\\.[0-9]+|[0-9]+(\\.[0-9]*)?)([eE][-+]?[0-9]+)?$");
        return re;
    }

    /**
     * @brief Read a signed decimal integer, falling back to unsigned for
     *        large positive values
     * @return false if the value does not fit in 64 bits
     */
    bool read_integer(const std::string& text, int base, Value& out) {
        try {
            std::size_t pos = 0;
            const long long val = std::stoll(text, &pos, base);
            if (pos == text.size()) {
                out = static_cast<std::int64_t>(val);
                return true;
            }
            return false;
        } catch (const std::out_of_range&) {
            // Too large for int64; positive values may still fit uint64
        } catch (const std::invalid_argument&) {
            return false;
        }

        if (text.empty() || text[0] == '-') return false;
        try {
            std::size_t pos = 0;
            const unsigned long long val = std::stoull(text, &pos, base);
            if (pos == text.size()) {
                out = static_cast<std::uint64_t>(val);
                return true;
            }
        } catch (const std::out_of_range&) {
        } catch (const std::invalid_argument&) {
        }
        return false;
    }

    bool read_float(const std::string& text, Value& out) {
        try {
            std::size_t pos = 0;
            const double val = std::stod(text, &pos);
            if (pos == text.size()) {
                out = val;
                return true;
            }
        } catch (const std::out_of_range&) {
        } catch (const std::invalid_argument&) {
        }
        return false;
    }
}

Value parse_value(const std::string& str) {
    if (str.empty()) {
        return "";
    }

    const std::string lower = to_lower(str);
    if (lower == "true") {
        return true;
    }
    if (lower == "false") {
        return false;
    }
    if (lower == "null") {
        return nullptr;
    }

    Value number;
    if (std::regex_match(str, cli_integer_re()) && read_integer(str, 10, number) &&
        number.is_number_integer() && !number.is_number_unsigned()) {
        return number;
    }
    if (std::regex_match(str, cli_float_re()) && read_float(str, number)) {
        return number;
    }

    // JSON compound (objects and arrays)
    if ((str.front() == '{' && str.back() == '}') ||
        (str.front() == '[' && str.back() == ']')) {
        Value parsed = Value::parse(str, nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }

    // Quoted string, JSON escapes
    if (str.size() >= 2 && str.front() == '"' && str.back() == '"') {
        Value parsed = Value::parse(str, nullptr, false);
        if (parsed.is_string()) {
            return parsed;
        }
    }

    return str;
}

Value resolve_plain_scalar(const std::string& str) {
    if (str.empty() || str == "~" || str == "null" || str == "Null" || str == "NULL") {
        return nullptr;
    }
    if (str == "true" || str == "True" || str == "TRUE") {
        return true;
    }
    if (str == "false" || str == "False" || str == "FALSE") {
        return false;
    }

    Value number;
    if (std::regex_match(str, yaml_decimal_re())) {
        // stoll accepts a leading '+'
        if (read_integer(str, 10, number)) {
            return number;
        }
        if (read_float(str, number)) {
            return number;
        }
        return str;
    }

    if (str.size() > 2 && str[0] == '0' && (str[1] == 'o' || str[1] == 'x')) {
        const std::string digits = str.substr(2);
        const bool octal = str[1] == 'o';
        const bool valid = std::all_of(digits.begin(), digits.end(), [octal](unsigned char c) {
            return octal ? (c >= '0' && c <= '7') : (std::isxdigit(c) != 0);
        });
        if (valid && read_integer(digits, octal ? 8 : 16, number)) {
            return number;
        }
        return str;
    }

    if (std::regex_match(str, yaml_float_re())) {
        if (read_float(str, number)) {
            return number;
        }
        return str;
    }

    std::string unsigned_part = str;
    double sign = 1.0;
    if (!unsigned_part.empty() && (unsigned_part[0] == '+' || unsigned_part[0] == '-')) {
        sign = unsigned_part[0] == '-' ? -1.0 : 1.0;
        unsigned_part = unsigned_part.substr(1);
    }
    if (unsigned_part == ".inf" || unsigned_part == ".Inf" || unsigned_part == ".INF") {
        return sign * std::numeric_limits<double>::infinity();
    }
    if (str == ".nan" || str == ".NaN" || str == ".NAN") {
        return std::numeric_limits<double>::quiet_NaN();
    }

    return str;
}

} // namespace strata
