#ifndef CPSWAP_PAIR_HARNESS_HPP
#define CPSWAP_PAIR_HARNESS_HPP

#include <boost/json.hpp>

#include "cpswap/pair.hpp"

namespace cpswap {
namespace harness {

namespace json = boost::json;

// Raw amount from a JSON string ("123", "0x7b") or integer.
// Throws std::system_error on malformed input.
bigint amount_from_json(const json::value& v);

Token token_from_json(const json::object& config, uint64_t chain_id);

// {"name", "chain_id", "pool_address", "token0", "token1", "reserves"}
Pair pair_from_json(const json::object& config);

json::object pair_state_to_json(const Pair& pair);

// Runs one action sequence against one pair snapshot. Swaps replace the
// running pair with the simulated next pair; failed actions leave it as is.
json::object process_pair_sequence(
    const json::object& pair_config,
    const json::object& sequence,
    bool save_last_only = false
);

} // namespace harness
} // namespace cpswap

#endif // CPSWAP_PAIR_HARNESS_HPP
