#ifndef CPSWAP_CONSTANT_PRODUCT_MATH_HPP
#define CPSWAP_CONSTANT_PRODUCT_MATH_HPP

#include <boost/multiprecision/cpp_int.hpp>

#include "cpswap/errors.hpp"

namespace cpswap {

// Unbounded: no product in the formulas below can overflow.
using bigint = boost::multiprecision::cpp_int;

// 0.3% swap fee taken from the input side
inline const bigint FEE_NUMERATOR = 997;
inline const bigint FEE_DENOMINATOR = 1000;

// Shares burned on the first deposit
inline const bigint MINIMUM_LIQUIDITY = 1000;

// Protocol fee is 1/6 of sqrt(k) growth: fee = S * (rootK - rootKLast) / (5 * rootK + rootKLast)
inline const bigint PROTOCOL_FEE_ROOT_K_FACTOR = 5;

// Integer formulas of a constant-product pool over bare reserve magnitudes.
// Multiply/divide order is fixed; every division truncates.
class ConstantProductMath {
public:
    // floor(sqrt(y)), Newton iteration in integers only
    static result<bigint> sqrt(const bigint& y);

    // amount_in * 997 * reserve_out / (reserve_in * 1000 + amount_in * 997)
    static result<bigint> get_amount_out(
        const bigint& amount_in,
        const bigint& reserve_in,
        const bigint& reserve_out
    );

    // reserve_in * amount_out * 1000 / ((reserve_out - amount_out) * 997) + 1
    static result<bigint> get_amount_in(
        const bigint& amount_out,
        const bigint& reserve_in,
        const bigint& reserve_out
    );

    static result<bigint> liquidity_minted(
        const bigint& total_supply,
        const bigint& amount0,
        const bigint& amount1,
        const bigint& reserve0,
        const bigint& reserve1
    );

    // Shares the protocol would mint for sqrt(k) growth since k_last.
    // Zero when k_last is zero or k has not grown.
    static result<bigint> protocol_fee_liquidity(
        const bigint& total_supply,
        const bigint& reserve0,
        const bigint& reserve1,
        const bigint& k_last
    );

    // liquidity * reserve / adjusted_supply
    static result<bigint> liquidity_value(
        const bigint& liquidity,
        const bigint& reserve,
        const bigint& adjusted_supply
    );
};

} // namespace cpswap

#endif // CPSWAP_CONSTANT_PRODUCT_MATH_HPP
