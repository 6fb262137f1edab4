#include "cpswap/pair.hpp"

namespace cpswap {

namespace {

constexpr uint8_t LIQUIDITY_TOKEN_DECIMALS = 18;

Token make_liquidity_token(
    const Token& token0,
    const Token& token1,
    const std::string& pool_address
) {
    const std::string symbols = token0.symbol() + "-" + token1.symbol();
    return Token(
        token0.chain_id(),
        pool_address,
        LIQUIDITY_TOKEN_DECIMALS,
        "MOON-V1-" + symbols,
        "Mooniswap V1 (" + symbols + ")"
    );
}

} // namespace

Pair::Pair(TokenAmount amount0, TokenAmount amount1, std::string pool_address)
    : reserves_{std::move(amount0), std::move(amount1)},
      pool_address_(std::move(pool_address)),
      liquidity_token_(make_liquidity_token(reserves_[0].token(), reserves_[1].token(), pool_address_)) {}

result<Pair> Pair::from_unsorted(
    const TokenAmount& amount_a,
    const TokenAmount& amount_b,
    std::string pool_address
) {
    auto a_first = amount_a.token().sorts_before(amount_b.token());
    if (!a_first) {
        return a_first.error();
    }
    if (a_first.value()) {
        return Pair(amount_a, amount_b, std::move(pool_address));
    }
    return Pair(amount_b, amount_a, std::move(pool_address));
}

bool Pair::involves_token(const Token& token) const {
    return token == token0() || token == token1();
}

result<TokenAmount> Pair::reserve_of(const Token& token) const {
    if (!involves_token(token)) {
        return errc::invalid_asset;
    }
    return token == token0() ? reserve0() : reserve1();
}

Price Pair::token0_price() const {
    return Price(token0(), token1(), reserve0().raw(), reserve1().raw());
}

Price Pair::token1_price() const {
    return Price(token1(), token0(), reserve1().raw(), reserve0().raw());
}

result<Price> Pair::price_of(const Token& token) const {
    if (!involves_token(token)) {
        return errc::invalid_asset;
    }
    return token == token0() ? token0_price() : token1_price();
}

const Token& Pair::other_token(const Token& token) const {
    return token == token0() ? token1() : token0();
}

Pair Pair::with_reserves(const TokenAmount& a, const TokenAmount& b) const {
    if (a.token() == token0()) {
        return Pair(a, b, pool_address_);
    }
    return Pair(b, a, pool_address_);
}

result<SwapResult> Pair::get_output_amount(const TokenAmount& input_amount) const {
    if (!involves_token(input_amount.token())) {
        return errc::invalid_asset;
    }

    const TokenAmount& input_reserve = input_amount.token() == token0() ? reserve0() : reserve1();
    const TokenAmount& output_reserve = input_amount.token() == token0() ? reserve1() : reserve0();

    auto amount_out = ConstantProductMath::get_amount_out(
        input_amount.raw(), input_reserve.raw(), output_reserve.raw());
    if (!amount_out) {
        return amount_out.error();
    }
    TokenAmount output_amount(other_token(input_amount.token()), amount_out.value());

    auto next_input_reserve = input_reserve.add(input_amount);
    if (!next_input_reserve) {
        return next_input_reserve.error();
    }
    auto next_output_reserve = output_reserve.subtract(output_amount);
    if (!next_output_reserve) {
        return next_output_reserve.error();
    }

    return SwapResult(
        output_amount,
        with_reserves(next_input_reserve.value(), next_output_reserve.value())
    );
}

result<SwapResult> Pair::get_input_amount(const TokenAmount& output_amount) const {
    if (!involves_token(output_amount.token())) {
        return errc::invalid_asset;
    }

    const TokenAmount& output_reserve = output_amount.token() == token0() ? reserve0() : reserve1();
    const TokenAmount& input_reserve = output_amount.token() == token0() ? reserve1() : reserve0();

    auto amount_in = ConstantProductMath::get_amount_in(
        output_amount.raw(), input_reserve.raw(), output_reserve.raw());
    if (!amount_in) {
        return amount_in.error();
    }
    TokenAmount input_amount(other_token(output_amount.token()), amount_in.value());

    auto next_input_reserve = input_reserve.add(input_amount);
    if (!next_input_reserve) {
        return next_input_reserve.error();
    }
    auto next_output_reserve = output_reserve.subtract(output_amount);
    if (!next_output_reserve) {
        return next_output_reserve.error();
    }

    return SwapResult(
        input_amount,
        with_reserves(next_input_reserve.value(), next_output_reserve.value())
    );
}

result<TokenAmount> Pair::get_liquidity_minted(
    const TokenAmount& total_supply,
    const TokenAmount& amount0,
    const TokenAmount& amount1
) const {
    if (total_supply.token() != liquidity_token_) {
        return errc::invalid_token;
    }
    if (amount0.token() != token0() || amount1.token() != token1()) {
        return errc::invalid_asset;
    }

    auto liquidity = ConstantProductMath::liquidity_minted(
        total_supply.raw(), amount0.raw(), amount1.raw(),
        reserve0().raw(), reserve1().raw());
    if (!liquidity) {
        return liquidity.error();
    }
    return TokenAmount(liquidity_token_, liquidity.value());
}

result<TokenAmount> Pair::get_liquidity_value(
    const Token& token,
    const TokenAmount& total_supply,
    const TokenAmount& liquidity,
    bool fee_on,
    const std::optional<BigintIsh>& k_last
) const {
    if (!involves_token(token)) {
        return errc::invalid_asset;
    }
    if (total_supply.token() != liquidity_token_ || liquidity.token() != liquidity_token_) {
        return errc::invalid_token;
    }
    if (liquidity.raw() > total_supply.raw()) {
        return errc::invalid_amount;
    }

    bigint total_supply_adjusted = total_supply.raw();
    if (fee_on) {
        if (!k_last) {
            return errc::missing_parameter;
        }
        auto k_last_parsed = parse_bigint_ish(*k_last);
        if (!k_last_parsed) {
            return k_last_parsed.error();
        }
        auto fee_liquidity = ConstantProductMath::protocol_fee_liquidity(
            total_supply.raw(), reserve0().raw(), reserve1().raw(), k_last_parsed.value());
        if (!fee_liquidity) {
            return fee_liquidity.error();
        }
        total_supply_adjusted += fee_liquidity.value();
    }

    const TokenAmount& reserve = token == token0() ? reserve0() : reserve1();
    auto value = ConstantProductMath::liquidity_value(
        liquidity.raw(), reserve.raw(), total_supply_adjusted);
    if (!value) {
        return value.error();
    }
    return TokenAmount(token, value.value());
}

} // namespace cpswap
