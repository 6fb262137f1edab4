#ifndef CPSWAP_ERRORS_HPP
#define CPSWAP_ERRORS_HPP

#include <boost/outcome/std_result.hpp>
#include <string>
#include <system_error>
#include <type_traits>

namespace cpswap {

// Failure kinds reported by pair arithmetic. Zero is reserved for success.
enum class errc {
    invalid_asset = 1,          // amount/asset does not belong to the pair
    invalid_token,              // amount is not denominated in the liquidity token
    invalid_amount,             // magnitude out of range (negative, above supply)
    insufficient_reserves,      // empty pool or output >= reserve
    insufficient_input_amount,  // result truncated to zero
    missing_parameter,          // protocol fee requested without kLast
    parse_error                 // numeric-like input not an integer
};

const std::error_category& cpswap_category() noexcept;

inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), cpswap_category()};
}

template <typename T>
using result = boost::outcome_v2::std_result<T>;

} // namespace cpswap

namespace std {
template <>
struct is_error_code_enum<cpswap::errc> : true_type {};
} // namespace std

#endif // CPSWAP_ERRORS_HPP
