#include "v6net_catch.hpp"

using namespace v6net;

TEST_CASE("128 bit integer helpers", "[uint128]")
{
    SECTION("construction and decomposition")
    {
        auto value = make_uint128(0x20010db800000000, 0x1);
        REQUIRE(high_bits(value) == 0x20010db800000000);
        REQUIRE(low_bits(value) == 0x1);
        REQUIRE(make_uint128(~0ULL, ~0ULL) == uint128_max);
    }

    SECTION("magnitude")
    {
        REQUIRE(magnitude(0) == 0);
        REQUIRE(magnitude(-5) == 5);
        REQUIRE(magnitude(5) == 5);

        auto minimum = static_cast<int128_t>(uint128_t{1} << 127);
        REQUIRE(magnitude(minimum) == (uint128_t{1} << 127));
    }

    SECTION("checked addition")
    {
        REQUIRE(checked_add(1, 1) == uint128_t{2});
        REQUIRE(checked_add(1, -1) == uint128_t{0});
        REQUIRE(checked_add(uint128_max - 1, 1) == uint128_max);
        REQUIRE_FALSE(checked_add(uint128_max, 1));
        REQUIRE_FALSE(checked_add(0, -1));
    }

    SECTION("checked subtraction")
    {
        REQUIRE(checked_subtract(2, 1) == uint128_t{1});
        REQUIRE(checked_subtract(1, -1) == uint128_t{2});
        REQUIRE_FALSE(checked_subtract(0, 1));
        REQUIRE_FALSE(checked_subtract(uint128_max, -1));
    }

    SECTION("string conversion")
    {
        REQUIRE(to_string(uint128_t{0}) == "0");
        REQUIRE(to_string(uint128_max)
                == "340282366920938463463374607431768211455");
        REQUIRE(to_string(int128_t{-42}) == "-42");
        REQUIRE(to_hex_string(uint128_t{0}) == "0x0");
        REQUIRE(to_hex_string(make_uint128(0xABCD, 0)) == "0xabcd0000000000000000");
    }
}
