#ifndef CPSWAP_CAPI_H
#define CPSWAP_CAPI_H

#ifdef __cplusplus
extern "C" {
#endif

// All arguments are decimal (or 0x-hex) integer strings. Results are
// malloc-allocated decimal strings released with cpswap_free_string, or
// NULL when the inputs are malformed or the formula fails.

const char* cpswap_get_amount_out(const char* amount_in, const char* reserve_in, const char* reserve_out);
const char* cpswap_get_amount_in(const char* amount_out, const char* reserve_in, const char* reserve_out);
const char* cpswap_sqrt(const char* y);

// k_last may be NULL when the protocol fee is off
const char* cpswap_liquidity_value(
    const char* liquidity,
    const char* reserve,
    const char* total_supply,
    const char* reserve0,
    const char* reserve1,
    const char* k_last
);

void cpswap_free_string(const char* s);

#ifdef __cplusplus
} // extern "C"
#endif

#endif // CPSWAP_CAPI_H
