// Pair harness tests

#include <catch2/catch.hpp>
#include "cpswap/pair_harness.hpp"

using namespace cpswap;
namespace json = boost::json;

namespace {

json::object pair_config() {
    return json::parse(R"({
        "name": "dai-usdc",
        "chain_id": 1,
        "pool_address": "0xAE461cA67B15dc8dc81CE7615e0320dA1A9aB8D5",
        "token0": {"address": "0x6B175474E89094C44Da98b954EedeAC495271d0F", "symbol": "DAI", "decimals": 18},
        "token1": {"address": "0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48", "symbol": "USDC", "decimals": 6},
        "reserves": ["1000", "1000"]
    })").as_object();
}

json::object sequence(const char* actions) {
    json::object seq;
    seq["name"] = "test";
    seq["actions"] = json::parse(actions);
    return seq;
}

std::string str(const json::value& v) {
    return std::string(v.as_string().c_str());
}

} // namespace

TEST_CASE("Pair from JSON", "[harness]") {
    Pair pair = harness::pair_from_json(pair_config());
    REQUIRE(pair.token0().symbol() == "DAI");
    REQUIRE(pair.token1().decimals() == 6);
    REQUIRE(pair.reserve0().raw() == 1000);
    REQUIRE(pair.liquidity_token().symbol() == "MOON-V1-DAI-USDC");

    SECTION("Amounts accept strings, hex and integers") {
        REQUIRE(harness::amount_from_json(json::value("0x10")) == 16);
        REQUIRE(harness::amount_from_json(json::value(42)) == 42);
        REQUIRE_THROWS(harness::amount_from_json(json::value("nope")));
    }

    SECTION("State snapshot") {
        auto state = harness::pair_state_to_json(pair);
        REQUIRE(str(state.at("reserves").as_array().at(0)) == "1000");
        REQUIRE(str(state.at("token0_price").as_object().at("numerator")) == "1000");
        REQUIRE(str(state.at("liquidity_token")) == "MOON-V1-DAI-USDC");
    }
}

TEST_CASE("Chained swaps", "[harness]") {
    auto result = harness::process_pair_sequence(pair_config(), sequence(R"([
        {"type": "swap_exact_in", "token": 0, "amount": "100"},
        {"type": "swap_exact_in", "token": 0, "amount": "100"},
        {"type": "swap_exact_out", "token": 0, "amount": "200"}
    ])"));

    REQUIRE(result.at("success").as_bool());
    const auto& states = result.at("states").as_array();
    REQUIRE(states.size() == 4);

    const auto& first = states.at(1).as_object();
    REQUIRE(str(first.at("amount")) == "90");
    REQUIRE(str(first.at("reserves").as_array().at(0)) == "1100");
    REQUIRE(str(first.at("reserves").as_array().at(1)) == "910");

    const auto& second = states.at(2).as_object();
    REQUIRE(str(second.at("amount")) == "75");
    REQUIRE(str(second.at("reserves").as_array().at(1)) == "835");

    // 835 * 200 * 1000 / ((1200 - 200) * 997) + 1
    const auto& third = states.at(3).as_object();
    REQUIRE(str(third.at("amount")) == "168");
    REQUIRE(str(third.at("reserves").as_array().at(0)) == "1000");
    REQUIRE(str(third.at("reserves").as_array().at(1)) == "1003");
}

TEST_CASE("Failed actions keep the running pair", "[harness]") {
    auto result = harness::process_pair_sequence(pair_config(), sequence(R"([
        {"type": "swap_exact_out", "token": 1, "amount": "1000"},
        {"type": "swap_exact_in", "token": 2, "amount": "1"},
        {"type": "bogus"},
        {"type": "swap_exact_in", "token": 1, "amount": "100"}
    ])"));

    REQUIRE_FALSE(result.at("success").as_bool());
    const auto& states = result.at("states").as_array();
    REQUIRE(states.size() == 5);

    const auto& drained = states.at(1).as_object();
    REQUIRE_FALSE(drained.at("action_success").as_bool());
    REQUIRE(str(drained.at("error")) == "insufficient reserves");
    REQUIRE(str(drained.at("reserves").as_array().at(1)) == "1000");

    REQUIRE_FALSE(states.at(2).as_object().at("action_success").as_bool());
    REQUIRE_FALSE(states.at(3).as_object().at("action_success").as_bool());

    const auto& last = states.at(4).as_object();
    REQUIRE(last.at("action_success").as_bool());
    REQUIRE(str(last.at("amount")) == "90");
}

TEST_CASE("Liquidity actions", "[harness]") {
    auto result = harness::process_pair_sequence(pair_config(), sequence(R"([
        {"type": "liquidity_minted", "total_supply": "0", "amounts": ["10000", "10000"]},
        {"type": "liquidity_value", "token": 0, "total_supply": "500", "liquidity": "500", "fee_on": true, "k_last": 250000},
        {"type": "liquidity_value", "token": 0, "total_supply": "500", "liquidity": "500", "fee_on": true}
    ])"), true);

    REQUIRE_FALSE(result.at("success").as_bool());
    REQUIRE_FALSE(result.contains("states"));
    const auto& final_state = result.at("final_state").as_object();
    REQUIRE_FALSE(final_state.at("action_success").as_bool());
    REQUIRE(str(final_state.at("reserves").as_array().at(0)) == "1000");
}

TEST_CASE("Liquidity action amounts", "[harness]") {
    auto result = harness::process_pair_sequence(pair_config(), sequence(R"([
        {"type": "liquidity_minted", "total_supply": "0", "amounts": ["10000", "10000"]},
        {"type": "liquidity_value", "token": 0, "total_supply": "500", "liquidity": "500", "fee_on": true, "k_last": "250000"}
    ])"));

    REQUIRE(result.at("success").as_bool());
    const auto& states = result.at("states").as_array();
    REQUIRE(str(states.at(1).as_object().at("amount")) == "9000");
    REQUIRE(str(states.at(2).as_object().at("amount")) == "917");
}

TEST_CASE("Malformed pair config", "[harness]") {
    auto config = pair_config();
    config["reserves"] = json::array{"1000", "-1"};
    auto result = harness::process_pair_sequence(config, sequence("[]"));
    REQUIRE_FALSE(result.at("success").as_bool());
    REQUIRE(result.contains("error"));
}
