#include <catch2/catch.hpp>
#include "cpswap/bigint_ish.hpp"

using cpswap::bigint;
using cpswap::BigintIsh;
using cpswap::errc;
using cpswap::parse_bigint_ish;

TEST_CASE("Parse integer-like input", "[bigint_ish]") {
    SECTION("Decimal string") {
        REQUIRE(parse_bigint_ish(BigintIsh(std::string("250000"))).value() == 250000);
        REQUIRE(parse_bigint_ish(BigintIsh(std::string("0"))).value() == 0);

        bigint expected = boost::multiprecision::pow(bigint(10), 30);
        REQUIRE(parse_bigint_ish(BigintIsh(std::string("1000000000000000000000000000000"))).value() == expected);
    }

    SECTION("Hex string") {
        REQUIRE(parse_bigint_ish(BigintIsh(std::string("0x3d090"))).value() == 250000);
        REQUIRE(parse_bigint_ish(BigintIsh(std::string("0XFF"))).value() == 255);
    }

    SECTION("Native representations") {
        REQUIRE(parse_bigint_ish(BigintIsh(std::int64_t{42})).value() == 42);
        REQUIRE(parse_bigint_ish(BigintIsh(bigint(7))).value() == 7);
    }

    SECTION("Malformed or negative") {
        for (const char* bad : {"", "12a", " 1", "-5", "0x", "1.5", "0xZZ"}) {
            auto r = parse_bigint_ish(BigintIsh(std::string(bad)));
            REQUIRE_FALSE(r);
            REQUIRE(r.error() == errc::parse_error);
        }
        REQUIRE(parse_bigint_ish(BigintIsh(std::int64_t{-1})).error() == errc::parse_error);
        REQUIRE(parse_bigint_ish(BigintIsh(bigint(-1))).error() == errc::parse_error);
    }
}
