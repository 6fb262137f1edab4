#ifndef CPSWAP_PRICE_HPP
#define CPSWAP_PRICE_HPP

#include <string>

#include "cpswap/constant_product_math.hpp"
#include "cpswap/token.hpp"
#include "cpswap/token_amount.hpp"

namespace cpswap {

// Price of one raw unit of `base` in raw units of `quote`, kept as the exact
// fraction numerator / denominator.
class Price {
public:
    Price(Token base, Token quote, bigint denominator, bigint numerator);

    const Token& base() const { return base_; }
    const Token& quote_token() const { return quote_; }
    const bigint& numerator() const { return numerator_; }
    const bigint& denominator() const { return denominator_; }

    Price invert() const;

    // this.quote must be other.base
    result<Price> multiply(const Price& other) const;

    // Converts an amount of base into quote, rounding down.
    result<TokenAmount> quote(const TokenAmount& amount) const;

    // Decimal-adjusted value with `digits` significant digits.
    result<std::string> to_significant(int digits = 6) const;

    // Exact rational equality; fractions need not be reduced.
    bool operator==(const Price& other) const;
    bool operator!=(const Price& other) const { return !(*this == other); }

private:
    Token base_;
    Token quote_;
    bigint denominator_;
    bigint numerator_;
};

} // namespace cpswap

#endif // CPSWAP_PRICE_HPP
