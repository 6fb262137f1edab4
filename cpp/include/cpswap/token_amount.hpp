#ifndef CPSWAP_TOKEN_AMOUNT_HPP
#define CPSWAP_TOKEN_AMOUNT_HPP

#include <string>

#include "cpswap/constant_product_math.hpp"
#include "cpswap/token.hpp"

namespace cpswap {

// Raw (smallest-unit) magnitude tagged with the token it denominates.
// The magnitude is never negative.
class TokenAmount {
public:
    // Throws std::invalid_argument on a negative magnitude.
    TokenAmount(Token token, bigint raw);

    const Token& token() const { return token_; }
    const bigint& raw() const { return raw_; }

    result<TokenAmount> add(const TokenAmount& other) const;
    // Fails with invalid_amount rather than going negative.
    result<TokenAmount> subtract(const TokenAmount& other) const;

    // raw / 10^decimals without trailing zeros, e.g. "1.5"
    std::string to_exact() const;

    bool operator==(const TokenAmount& other) const {
        return token_ == other.token_ && raw_ == other.raw_;
    }
    bool operator!=(const TokenAmount& other) const { return !(*this == other); }

private:
    Token token_;
    bigint raw_;
};

} // namespace cpswap

#endif // CPSWAP_TOKEN_AMOUNT_HPP
