#include "cpswap/price.hpp"

#include <utility>

namespace cpswap {

namespace {

bigint power_of_ten(unsigned exponent) {
    return boost::multiprecision::pow(bigint(10), exponent);
}

} // namespace

Price::Price(Token base, Token quote, bigint denominator, bigint numerator)
    : base_(std::move(base)),
      quote_(std::move(quote)),
      denominator_(std::move(denominator)),
      numerator_(std::move(numerator)) {}

Price Price::invert() const {
    return Price(quote_, base_, numerator_, denominator_);
}

result<Price> Price::multiply(const Price& other) const {
    if (quote_ != other.base_) {
        return errc::invalid_asset;
    }
    return Price(base_, other.quote_,
                 denominator_ * other.denominator_,
                 numerator_ * other.numerator_);
}

result<TokenAmount> Price::quote(const TokenAmount& amount) const {
    if (amount.token() != base_) {
        return errc::invalid_asset;
    }
    if (denominator_ == 0) {
        return errc::insufficient_reserves;
    }
    return TokenAmount(quote_, amount.raw() * numerator_ / denominator_);
}

result<std::string> Price::to_significant(int digits) const {
    if (denominator_ == 0) {
        return errc::insufficient_reserves;
    }
    if (digits <= 0 || numerator_ < 0 || denominator_ < 0) {
        return errc::invalid_amount;
    }

    // raw units -> whole units: scale by 10^base.decimals / 10^quote.decimals
    const bigint num = numerator_ * power_of_ten(base_.decimals());
    const bigint den = denominator_ * power_of_ten(quote_.decimals());
    if (num == 0) {
        return std::string("0");
    }

    // 10^exponent <= num/den < 10^(exponent + 1)
    long exponent = static_cast<long>(num.str().size()) - static_cast<long>(den.str().size());
    const bool below = exponent >= 0 ? num < den * power_of_ten(static_cast<unsigned>(exponent))
                                     : num * power_of_ten(static_cast<unsigned>(-exponent)) < den;
    if (below) {
        --exponent;
    }

    // keep `places` fractional digits; negative means rounding left of the point
    const long places = digits - 1 - exponent;
    bigint dividend = num;
    bigint divisor = den;
    if (places >= 0) {
        dividend *= power_of_ten(static_cast<unsigned>(places));
    } else {
        divisor *= power_of_ten(static_cast<unsigned>(-places));
    }
    bigint rounded = dividend / divisor;
    if ((dividend % divisor) * 2 >= divisor) {
        ++rounded;
    }

    std::string out = rounded.str();
    if (places <= 0) {
        return out.append(static_cast<std::size_t>(-places), '0');
    }

    const std::size_t fraction_digits = static_cast<std::size_t>(places);
    if (out.size() <= fraction_digits) {
        out.insert(0, fraction_digits - out.size() + 1, '0');
    }
    out.insert(out.size() - fraction_digits, 1, '.');
    while (out.back() == '0') {
        out.pop_back();
    }
    if (out.back() == '.') {
        out.pop_back();
    }
    return out;
}

bool Price::operator==(const Price& other) const {
    return base_ == other.base_ && quote_ == other.quote_ &&
           numerator_ * other.denominator_ == other.numerator_ * denominator_;
}

} // namespace cpswap
