// Price tests

#include <catch2/catch.hpp>
#include "cpswap/price.hpp"
#include "test_tokens.hpp"

using namespace cpswap;

TEST_CASE("Price fraction", "[price]") {
    // 1 DAI = 2 USDC in raw units
    Price dai_usdc(DAI, USDC, 100, 200);

    SECTION("Invert swaps sides") {
        Price inverted = dai_usdc.invert();
        REQUIRE(inverted.base() == USDC);
        REQUIRE(inverted.quote_token() == DAI);
        REQUIRE(inverted.numerator() == 100);
        REQUIRE(inverted.denominator() == 200);
        REQUIRE(inverted.invert() == dai_usdc);
    }

    SECTION("Equality is rational, not structural") {
        REQUIRE(dai_usdc == Price(DAI, USDC, 1, 2));
        REQUIRE(dai_usdc != Price(DAI, USDC, 1, 3));
        REQUIRE(dai_usdc != Price(USDC, DAI, 1, 2));
    }

    SECTION("Quote") {
        REQUIRE(dai_usdc.quote(TokenAmount(DAI, 10)).value() == TokenAmount(USDC, 20));
        // rounds down
        REQUIRE(Price(DAI, USDC, 3, 1).quote(TokenAmount(DAI, 10)).value().raw() == 3);
        REQUIRE(dai_usdc.quote(TokenAmount(USDC, 10)).error() == errc::invalid_asset);
        REQUIRE(Price(DAI, USDC, 0, 1).quote(TokenAmount(DAI, 10)).error() == errc::insufficient_reserves);
    }

    SECTION("Multiply chains through the shared token") {
        Price usdc_weth(USDC, WETH, 4, 1);
        Price dai_weth = dai_usdc.multiply(usdc_weth).value();
        REQUIRE(dai_weth.base() == DAI);
        REQUIRE(dai_weth.quote_token() == WETH);
        REQUIRE(dai_weth == Price(DAI, WETH, 2, 1));
        REQUIRE(usdc_weth.multiply(dai_usdc).error() == errc::invalid_asset);
    }
}

TEST_CASE("Price significant digits", "[price]") {
    // 1 DAI (1e18 raw) buys 2 USDC (2e6 raw)
    bigint one_dai = boost::multiprecision::pow(bigint(10), 18);
    Price price(DAI, USDC, one_dai, 2000000);

    REQUIRE(price.to_significant().value() == "2");
    REQUIRE(price.invert().to_significant().value() == "0.5");
    REQUIRE(Price(DAI, USDC, 0, 1).to_significant().error() == errc::insufficient_reserves);
    REQUIRE(price.to_significant(0).error() == errc::invalid_amount);
}

TEST_CASE("Price significant digits stay positional", "[price]") {
    Token a(1, "0x0000000000000000000000000000000000000001", 0, "A");
    Token b(1, "0x0000000000000000000000000000000000000002", 0, "B");

    SECTION("Small values") {
        REQUIRE(Price(a, b, 100000, 1).to_significant().value() == "0.00001");
        REQUIRE(Price(a, b, 3, 2).to_significant(4).value() == "0.6667");
        REQUIRE(Price(a, b, 3, 1).to_significant().value() == "0.333333");
    }

    SECTION("Large values round left of the point") {
        REQUIRE(Price(a, b, 1, 123456789).to_significant(4).value() == "123500000");
        REQUIRE(Price(a, b, 1, 100).to_significant().value() == "100");
    }

    SECTION("Half-up carry") {
        REQUIRE(Price(a, b, 100000, 999996).to_significant(5).value() == "10");
        REQUIRE(Price(a, b, 10, 15).to_significant(1).value() == "2");
    }

    SECTION("Zero") {
        REQUIRE(Price(a, b, 7, 0).to_significant().value() == "0");
    }
}
