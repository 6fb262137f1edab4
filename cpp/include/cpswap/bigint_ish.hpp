#ifndef CPSWAP_BIGINT_ISH_HPP
#define CPSWAP_BIGINT_ISH_HPP

#include <cstdint>
#include <string>
#include <variant>

#include "cpswap/constant_product_math.hpp"

namespace cpswap {

// Integer-like input as it arrives from callers: native big integer,
// decimal or 0x-hex string, or a fixed-width integer.
using BigintIsh = std::variant<bigint, std::string, std::int64_t>;

// Normalizes to bigint. Negative values and malformed strings are parse_error.
result<bigint> parse_bigint_ish(const BigintIsh& value);

} // namespace cpswap

#endif // CPSWAP_BIGINT_ISH_HPP
