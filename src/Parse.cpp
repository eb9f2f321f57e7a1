/**
 * @file Parse.cpp
 * @brief Implementation of string-to-Value typing rules
 */

#include "confstore/Parse.hpp"
#include <cstdint>
#include <limits>
#include <regex>

namespace confstore {

namespace {
    bool matches(const std::string& str, const std::regex& re) {
        return std::regex_match(str, re);
    }

    /**
     * @brief Parse a decimal integer, widening on overflow
     *
     * int64 first, then uint64 for large positives, then double.
     */
    Value decimal_integer(const std::string& text) {
        try {
            return static_cast<std::int64_t>(std::stoll(text));
        } catch (const std::out_of_range&) {
            // Fall through to uint64
        }
        if (text[0] != '-') {
            try {
                return static_cast<std::uint64_t>(std::stoull(text));
            } catch (const std::out_of_range&) {
                // Fall through to double
            }
        }
        return std::stod(text);
    }

    Value radix_integer(const std::string& digits, int base, const std::string& text) {
        try {
            return static_cast<std::uint64_t>(std::stoull(digits, nullptr, base));
        } catch (const std::out_of_range&) {
            return text;
        }
    }
}

Value coerce_value(const std::string& raw) {
    static const std::regex int_re("^-?(0|[1-9][0-9]*)$");
    static const std::regex float_re(
        "^[-+]?([0-9]+\\.[0-9]*|\\.[0-9]+)([eE][-+]?[0-9]+)?$"
        "|^[-+]?[0-9]+[eE][-+]?[0-9]+$"
        "|^\\+[0-9]+$");

    // N1: Integer, or float when it does not fit in int64
    if (matches(raw, int_re)) {
        try {
            return static_cast<std::int64_t>(std::stoll(raw));
        } catch (const std::out_of_range&) {
            return std::stod(raw);
        }
    }

    // N2: Float
    if (matches(raw, float_re)) {
        try {
            return std::stod(raw);
        } catch (const std::out_of_range&) {
            // Fall through to string
        }
    }

    // N3: String
    return raw;
}

Value resolve_plain_scalar(const std::string& text) {
    static const std::regex null_re("^(~|null|Null|NULL)?$");
    static const std::regex true_re("^(true|True|TRUE)$");
    static const std::regex false_re("^(false|False|FALSE)$");
    static const std::regex dec_re("^[-+]?[0-9]+$");
    static const std::regex oct_re("^0o[0-7]+$");
    static const std::regex hex_re("^0x[0-9a-fA-F]+$");
    static const std::regex float_re(
        "^[-+]?(\\.[0-9]+|[0-9]+(\\.[0-9]*)?)([eE][-+]?[0-9]+)?$");
    static const std::regex inf_re("^[-+]?\\.(inf|Inf|INF)$");
    static const std::regex nan_re("^\\.(nan|NaN|NAN)$");

    if (matches(text, null_re)) {
        return nullptr;
    }
    if (matches(text, true_re)) {
        return true;
    }
    if (matches(text, false_re)) {
        return false;
    }
    if (matches(text, dec_re)) {
        return decimal_integer(text);
    }
    if (matches(text, oct_re)) {
        return radix_integer(text.substr(2), 8, text);
    }
    if (matches(text, hex_re)) {
        return radix_integer(text.substr(2), 16, text);
    }
    if (matches(text, float_re)) {
        try {
            return std::stod(text);
        } catch (const std::out_of_range&) {
            return text;
        }
    }
    if (matches(text, inf_re)) {
        const double inf = std::numeric_limits<double>::infinity();
        return text[0] == '-' ? -inf : inf;
    }
    if (matches(text, nan_re)) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    return text;
}

bool resolves_as_non_string(const std::string& text) {
    return !resolve_plain_scalar(text).is_string();
}

} // namespace confstore
