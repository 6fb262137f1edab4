#include "cpswap/bigint_ish.hpp"

#include <cctype>

namespace cpswap {

namespace {

result<bigint> parse_string(const std::string& s) {
    bool hex = s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
    std::size_t start = hex ? 2 : 0;
    if (s.size() == start) {
        return make_error_code(errc::parse_error);
    }

    bigint value = 0;
    for (std::size_t i = start; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (hex) {
            if (!std::isxdigit(c)) {
                return make_error_code(errc::parse_error);
            }
            int digit = std::isdigit(c) ? c - '0' : std::tolower(c) - 'a' + 10;
            value = value * 16 + digit;
        } else {
            if (!std::isdigit(c)) {
                return make_error_code(errc::parse_error);
            }
            value = value * 10 + (c - '0');
        }
    }
    return value;
}

} // namespace

result<bigint> parse_bigint_ish(const BigintIsh& value) {
    if (const auto* b = std::get_if<bigint>(&value)) {
        if (*b < 0) {
            return make_error_code(errc::parse_error);
        }
        return *b;
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        if (*i < 0) {
            return make_error_code(errc::parse_error);
        }
        return bigint(*i);
    }
    return parse_string(std::get<std::string>(value));
}

} // namespace cpswap
