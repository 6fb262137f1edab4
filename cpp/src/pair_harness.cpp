#include "cpswap/pair_harness.hpp"

#include <boost/json/src.hpp>

#include <stdexcept>
#include <string>

namespace cpswap {
namespace harness {

namespace {

std::string str(const json::value& v) {
    return std::string(v.as_string().c_str());
}

json::object price_to_json(const Price& price) {
    json::object obj;
    obj["base"] = price.base().symbol();
    obj["quote"] = price.quote_token().symbol();
    obj["numerator"] = price.numerator().str();
    obj["denominator"] = price.denominator().str();
    return obj;
}

const Token& token_by_index(const Pair& pair, const json::value& index) {
    int64_t i = index.as_int64();
    if (i == 0) return pair.token0();
    if (i == 1) return pair.token1();
    throw std::invalid_argument("token index out of range");
}

// Applies one action to `pair`; returns the raw amount the action produced.
bigint apply_action(Pair& pair, const json::object& act) {
    auto type = act.at("type").as_string();

    if (type == "swap_exact_in") {
        const Token& token = token_by_index(pair, act.at("token"));
        TokenAmount input(token, amount_from_json(act.at("amount")));
        auto [output, next] = pair.get_output_amount(input).value();
        pair = next;
        return output.raw();
    }
    if (type == "swap_exact_out") {
        const Token& token = token_by_index(pair, act.at("token"));
        TokenAmount output(token, amount_from_json(act.at("amount")));
        auto [input, next] = pair.get_input_amount(output).value();
        pair = next;
        return input.raw();
    }
    if (type == "liquidity_minted") {
        const auto& amounts = act.at("amounts").as_array();
        TokenAmount total_supply(pair.liquidity_token(), amount_from_json(act.at("total_supply")));
        TokenAmount amount0(pair.token0(), amount_from_json(amounts.at(0)));
        TokenAmount amount1(pair.token1(), amount_from_json(amounts.at(1)));
        return pair.get_liquidity_minted(total_supply, amount0, amount1).value().raw();
    }
    if (type == "liquidity_value") {
        const Token& token = token_by_index(pair, act.at("token"));
        TokenAmount total_supply(pair.liquidity_token(), amount_from_json(act.at("total_supply")));
        TokenAmount liquidity(pair.liquidity_token(), amount_from_json(act.at("liquidity")));
        bool fee_on = false;
        if (act.contains("fee_on")) {
            fee_on = act.at("fee_on").as_bool();
        }
        std::optional<BigintIsh> k_last;
        if (act.contains("k_last")) {
            k_last = BigintIsh(amount_from_json(act.at("k_last")));
        }
        return pair.get_liquidity_value(token, total_supply, liquidity, fee_on, k_last).value().raw();
    }

    throw std::invalid_argument("unknown action type: " + std::string(type.c_str()));
}

} // namespace

bigint amount_from_json(const json::value& v) {
    if (v.is_string()) {
        return parse_bigint_ish(BigintIsh(str(v))).value();
    }
    return parse_bigint_ish(BigintIsh(v.as_int64())).value();
}

Token token_from_json(const json::object& config, uint64_t chain_id) {
    std::string symbol = str(config.at("symbol"));
    std::string name = config.contains("name") ? str(config.at("name")) : symbol;
    int64_t decimals = config.at("decimals").as_int64();
    if (decimals < 0 || decimals > 255) {
        throw std::invalid_argument("decimals out of range for " + symbol);
    }
    return Token(chain_id, str(config.at("address")), static_cast<uint8_t>(decimals), symbol, name);
}

Pair pair_from_json(const json::object& config) {
    uint64_t chain_id = static_cast<uint64_t>(config.at("chain_id").as_int64());
    Token token0 = token_from_json(config.at("token0").as_object(), chain_id);
    Token token1 = token_from_json(config.at("token1").as_object(), chain_id);
    const auto& reserves = config.at("reserves").as_array();
    return Pair(
        TokenAmount(token0, amount_from_json(reserves.at(0))),
        TokenAmount(token1, amount_from_json(reserves.at(1))),
        str(config.at("pool_address"))
    );
}

json::object pair_state_to_json(const Pair& pair) {
    json::object obj;
    obj["reserves"] = json::array{pair.reserve0().raw().str(), pair.reserve1().raw().str()};
    obj["token0_price"] = price_to_json(pair.token0_price());
    obj["token1_price"] = price_to_json(pair.token1_price());
    obj["liquidity_token"] = pair.liquidity_token().symbol();
    return obj;
}

json::object process_pair_sequence(
    const json::object& pair_config,
    const json::object& sequence,
    bool save_last_only
) {
    json::object result;
    result["pair_name"] = pair_config.at("name");

    try {
        Pair pair = pair_from_json(pair_config);

        json::array states;
        if (!save_last_only) {
            states.push_back(pair_state_to_json(pair));
        }

        bool all_success = true;
        for (const auto& action : sequence.at("actions").as_array()) {
            const auto& act = action.as_object();

            bool success = true;
            std::string error;
            bigint amount = 0;
            try {
                amount = apply_action(pair, act);
            } catch (const std::exception& e) {
                success = false;
                error = e.what();
            }
            if (!success) all_success = false;

            if (!save_last_only) {
                auto state = pair_state_to_json(pair);
                state["action"] = act.at("type");
                state["action_success"] = success;
                if (success) {
                    state["amount"] = amount.str();
                } else {
                    state["error"] = error;
                }
                states.push_back(state);
            }
        }

        if (save_last_only) {
            auto final_state = pair_state_to_json(pair);
            final_state["action_success"] = all_success;
            result["final_state"] = final_state;
        } else {
            result["states"] = states;
        }
        result["success"] = all_success;

    } catch (const std::exception& e) {
        result["success"] = false;
        result["error"] = e.what();
    }

    return result;
}

} // namespace harness
} // namespace cpswap
