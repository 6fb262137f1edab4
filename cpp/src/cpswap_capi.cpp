// C API wrapper exposing the constant-product math (bigint) for scripted parity checks
#include "cpswap/cpswap_capi.h"
#include "cpswap/bigint_ish.hpp"

#include <cstdlib>
#include <cstring>
#include <string>

using cpswap::bigint;
using cpswap::ConstantProductMath;
using cpswap::result;

namespace {

char* alloc_cstr(const std::string& s) {
    char* out = static_cast<char*>(std::malloc(s.size() + 1));
    if (!out) return nullptr;
    std::memcpy(out, s.c_str(), s.size() + 1);
    return out;
}

result<bigint> to_bigint(const char* s) {
    if (!s) {
        return cpswap::make_error_code(cpswap::errc::missing_parameter);
    }
    return cpswap::parse_bigint_ish(cpswap::BigintIsh(std::string(s)));
}

const char* to_cstr(const result<bigint>& r) {
    if (!r) return nullptr;
    return alloc_cstr(r.value().str());
}

} // namespace

extern "C" {

const char* cpswap_get_amount_out(const char* amount_in, const char* reserve_in, const char* reserve_out) {
    auto a = to_bigint(amount_in);
    auto ri = to_bigint(reserve_in);
    auto ro = to_bigint(reserve_out);
    if (!a || !ri || !ro) return nullptr;
    return to_cstr(ConstantProductMath::get_amount_out(a.value(), ri.value(), ro.value()));
}

const char* cpswap_get_amount_in(const char* amount_out, const char* reserve_in, const char* reserve_out) {
    auto a = to_bigint(amount_out);
    auto ri = to_bigint(reserve_in);
    auto ro = to_bigint(reserve_out);
    if (!a || !ri || !ro) return nullptr;
    return to_cstr(ConstantProductMath::get_amount_in(a.value(), ri.value(), ro.value()));
}

const char* cpswap_sqrt(const char* y) {
    auto v = to_bigint(y);
    if (!v) return nullptr;
    return to_cstr(ConstantProductMath::sqrt(v.value()));
}

const char* cpswap_liquidity_value(
    const char* liquidity,
    const char* reserve,
    const char* total_supply,
    const char* reserve0,
    const char* reserve1,
    const char* k_last
) {
    auto liq = to_bigint(liquidity);
    auto res = to_bigint(reserve);
    auto supply = to_bigint(total_supply);
    auto r0 = to_bigint(reserve0);
    auto r1 = to_bigint(reserve1);
    if (!liq || !res || !supply || !r0 || !r1) return nullptr;
    if (liq.value() > supply.value()) return nullptr;

    bigint adjusted = supply.value();
    if (k_last) {
        auto k = to_bigint(k_last);
        if (!k) return nullptr;
        auto fee = ConstantProductMath::protocol_fee_liquidity(supply.value(), r0.value(), r1.value(), k.value());
        if (!fee) return nullptr;
        adjusted += fee.value();
    }
    return to_cstr(ConstantProductMath::liquidity_value(liq.value(), res.value(), adjusted));
}

void cpswap_free_string(const char* s) {
    if (s) std::free(const_cast<char*>(s));
}

} // extern "C"
