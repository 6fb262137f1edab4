#include "cpswap/token_amount.hpp"

#include <stdexcept>
#include <utility>

namespace cpswap {

TokenAmount::TokenAmount(Token token, bigint raw)
    : token_(std::move(token)), raw_(std::move(raw)) {
    if (raw_ < 0) {
        throw std::invalid_argument("negative amount for " + token_.address() + ": " + raw_.str());
    }
}

result<TokenAmount> TokenAmount::add(const TokenAmount& other) const {
    if (token_ != other.token_) {
        return errc::invalid_asset;
    }
    return TokenAmount(token_, raw_ + other.raw_);
}

result<TokenAmount> TokenAmount::subtract(const TokenAmount& other) const {
    if (token_ != other.token_) {
        return errc::invalid_asset;
    }
    if (other.raw_ > raw_) {
        return errc::invalid_amount;
    }
    return TokenAmount(token_, raw_ - other.raw_);
}

std::string TokenAmount::to_exact() const {
    std::string digits = raw_.str();

    std::size_t decimals = token_.decimals();
    if (digits.size() <= decimals) {
        digits.insert(0, decimals - digits.size() + 1, '0');
    }

    std::string whole = digits.substr(0, digits.size() - decimals);
    std::string fraction = digits.substr(digits.size() - decimals);
    while (!fraction.empty() && fraction.back() == '0') {
        fraction.pop_back();
    }

    std::string out = whole;
    if (!fraction.empty()) {
        out += "." + fraction;
    }
    return out;
}

} // namespace cpswap
