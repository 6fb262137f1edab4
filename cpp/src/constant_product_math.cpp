#include "cpswap/constant_product_math.hpp"
#include "cpswap/trace.hpp"

#include <iostream>

namespace cpswap {

result<bigint> ConstantProductMath::sqrt(const bigint& y) {
    if (y < 0) {
        return make_error_code(errc::invalid_amount);
    }

    bigint z = 0;
    if (y > 3) {
        z = y;
        bigint x = y / 2 + 1;
        while (x < z) {
            z = x;
            x = (y / x + x) / 2;
        }
    } else if (y != 0) {
        z = 1;
    }
    return z;
}

result<bigint> ConstantProductMath::get_amount_out(
    const bigint& amount_in,
    const bigint& reserve_in,
    const bigint& reserve_out
) {
    if (reserve_in == 0 || reserve_out == 0) {
        return make_error_code(errc::insufficient_reserves);
    }
    if (amount_in < 0) {
        return make_error_code(errc::invalid_amount);
    }

    bigint amount_in_with_fee = amount_in * FEE_NUMERATOR;
    bigint numerator = amount_in_with_fee * reserve_out;
    bigint denominator = reserve_in * FEE_DENOMINATOR + amount_in_with_fee;
    bigint amount_out = numerator / denominator;

    if (trace_enabled()) {
        std::cout << "TRACE get_amount_out amount_in=" << amount_in
                  << " reserve_in=" << reserve_in
                  << " reserve_out=" << reserve_out
                  << " numerator=" << numerator
                  << " denominator=" << denominator
                  << " amount_out=" << amount_out
                  << "\n";
    }

    if (amount_out == 0) {
        return make_error_code(errc::insufficient_input_amount);
    }
    return amount_out;
}

result<bigint> ConstantProductMath::get_amount_in(
    const bigint& amount_out,
    const bigint& reserve_in,
    const bigint& reserve_out
) {
    if (reserve_in == 0 || reserve_out == 0 || amount_out >= reserve_out) {
        return make_error_code(errc::insufficient_reserves);
    }
    if (amount_out < 0) {
        return make_error_code(errc::invalid_amount);
    }

    bigint numerator = reserve_in * amount_out * FEE_DENOMINATOR;
    bigint denominator = (reserve_out - amount_out) * FEE_NUMERATOR;
    // +1: the quoted input must never fall short because of truncation
    bigint amount_in = numerator / denominator + 1;

    if (trace_enabled()) {
        std::cout << "TRACE get_amount_in amount_out=" << amount_out
                  << " reserve_in=" << reserve_in
                  << " reserve_out=" << reserve_out
                  << " numerator=" << numerator
                  << " denominator=" << denominator
                  << " amount_in=" << amount_in
                  << "\n";
    }
    return amount_in;
}

result<bigint> ConstantProductMath::liquidity_minted(
    const bigint& total_supply,
    const bigint& amount0,
    const bigint& amount1,
    const bigint& reserve0,
    const bigint& reserve1
) {
    if (total_supply < 0 || amount0 < 0 || amount1 < 0) {
        return make_error_code(errc::invalid_amount);
    }

    bigint liquidity = 0;
    if (total_supply == 0) {
        auto root = sqrt(amount0 * amount1);
        if (!root) {
            return root.error();
        }
        liquidity = root.value() - MINIMUM_LIQUIDITY;
    } else {
        if (reserve0 == 0 || reserve1 == 0) {
            return make_error_code(errc::insufficient_reserves);
        }
        bigint liquidity0 = amount0 * total_supply / reserve0;
        bigint liquidity1 = amount1 * total_supply / reserve1;
        liquidity = liquidity0 <= liquidity1 ? liquidity0 : liquidity1;
    }

    if (trace_enabled()) {
        std::cout << "TRACE liquidity_minted total_supply=" << total_supply
                  << " amount0=" << amount0
                  << " amount1=" << amount1
                  << " liquidity=" << liquidity
                  << "\n";
    }

    if (liquidity <= 0) {
        return make_error_code(errc::insufficient_input_amount);
    }
    return liquidity;
}

result<bigint> ConstantProductMath::protocol_fee_liquidity(
    const bigint& total_supply,
    const bigint& reserve0,
    const bigint& reserve1,
    const bigint& k_last
) {
    if (k_last < 0) {
        return make_error_code(errc::invalid_amount);
    }
    if (k_last == 0) {
        return bigint(0);
    }

    auto root_k = sqrt(reserve0 * reserve1);
    if (!root_k) {
        return root_k.error();
    }
    auto root_k_last = sqrt(k_last);
    if (!root_k_last) {
        return root_k_last.error();
    }
    if (root_k.value() <= root_k_last.value()) {
        return bigint(0);
    }

    bigint numerator = total_supply * (root_k.value() - root_k_last.value());
    bigint denominator = root_k.value() * PROTOCOL_FEE_ROOT_K_FACTOR + root_k_last.value();
    bigint fee_liquidity = numerator / denominator;

    if (trace_enabled()) {
        std::cout << "TRACE protocol_fee_liquidity root_k=" << root_k.value()
                  << " root_k_last=" << root_k_last.value()
                  << " fee_liquidity=" << fee_liquidity
                  << "\n";
    }
    return fee_liquidity;
}

result<bigint> ConstantProductMath::liquidity_value(
    const bigint& liquidity,
    const bigint& reserve,
    const bigint& adjusted_supply
) {
    if (liquidity < 0 || adjusted_supply <= 0) {
        return make_error_code(errc::invalid_amount);
    }
    return bigint(liquidity * reserve / adjusted_supply);
}

} // namespace cpswap
