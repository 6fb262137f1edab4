#ifndef CPSWAP_PAIR_HPP
#define CPSWAP_PAIR_HPP

#include <array>
#include <optional>
#include <string>
#include <utility>

#include "cpswap/bigint_ish.hpp"
#include "cpswap/constant_product_math.hpp"
#include "cpswap/price.hpp"
#include "cpswap/token.hpp"
#include "cpswap/token_amount.hpp"

namespace cpswap {

class Pair;

// (amount, pool snapshot after the trade)
using SwapResult = std::pair<TokenAmount, Pair>;

// Immutable snapshot of a constant-product pool holding two tokens.
//
// Swap simulation never touches the receiver: it returns the amount together
// with the pair the pool would become, so hypothetical trades can be chained
// from the same starting reserves.
class Pair {
public:
    // Amounts must already be in canonical order (token0 sorts before token1);
    // the order is not checked.
    Pair(TokenAmount amount0, TokenAmount amount1, std::string pool_address);

    // Sorts the two amounts before constructing.
    static result<Pair> from_unsorted(
        const TokenAmount& amount_a,
        const TokenAmount& amount_b,
        std::string pool_address
    );

    // ------------------------ Identity ------------------------
    const Token& token0() const { return reserves_[0].token(); }
    const Token& token1() const { return reserves_[1].token(); }
    const TokenAmount& reserve0() const { return reserves_[0]; }
    const TokenAmount& reserve1() const { return reserves_[1]; }
    const Token& liquidity_token() const { return liquidity_token_; }
    const std::string& pool_address() const { return pool_address_; }
    uint64_t chain_id() const { return token0().chain_id(); }

    bool involves_token(const Token& token) const;
    result<TokenAmount> reserve_of(const Token& token) const;

    // ------------------------ Prices ------------------------
    // token0 in units of token1: reserve1 / reserve0
    Price token0_price() const;
    // token1 in units of token0: reserve0 / reserve1
    Price token1_price() const;
    result<Price> price_of(const Token& token) const;

    // ------------------------ Swaps ------------------------
    result<SwapResult> get_output_amount(const TokenAmount& input_amount) const;
    result<SwapResult> get_input_amount(const TokenAmount& output_amount) const;

    // ------------------------ Liquidity ------------------------
    // amount0/amount1 must be in token0/token1 order
    result<TokenAmount> get_liquidity_minted(
        const TokenAmount& total_supply,
        const TokenAmount& amount0,
        const TokenAmount& amount1
    ) const;

    // Underlying `token` redeemable for `liquidity`. With fee_on, total
    // supply is first diluted by the protocol fee accrued since k_last.
    result<TokenAmount> get_liquidity_value(
        const Token& token,
        const TokenAmount& total_supply,
        const TokenAmount& liquidity,
        bool fee_on = false,
        const std::optional<BigintIsh>& k_last = std::nullopt
    ) const;

private:
    std::array<TokenAmount, 2> reserves_;
    std::string pool_address_;
    Token liquidity_token_;

    // Pair with the given reserves, keeping this pair's token order
    Pair with_reserves(const TokenAmount& a, const TokenAmount& b) const;
    const Token& other_token(const Token& token) const;
};

} // namespace cpswap

#endif // CPSWAP_PAIR_HPP
