#include <algorithm>
#include <functional>
#include <sstream>
#include <vector>

#include "v6net_catch.hpp"

#include "v6net/ipv6_network.hpp"

using namespace v6net;

TEST_CASE("ipv6_network functionality checks", "[ipv6_network]")
{
    SECTION("constructor functionality checks")
    {
        ipv6_network test(ipv6_address("2001:1:1::1"), 16);

        REQUIRE(test.address() == ipv6_address("2001::"));
        REQUIRE(test.prefix_length() == 16);

        REQUIRE(ipv6_network(std::string("2001:db8::/32"))
                == ipv6_network(ipv6_address("2001:db8::"), 32));
        REQUIRE_THROWS_AS(ipv6_network(ipv6_address("2001:db8::"), 129),
                          v6net::exception);
        REQUIRE_THROWS_AS(ipv6_network(std::string("2001:db8::")),
                          v6net::exception);
    }

    SECTION("create")
    {
        auto from_text = ipv6_network::create("2001:db8::", 32);
        REQUIRE(from_text);
        REQUIRE(from_text->address() == ipv6_address("2001:db8::"));

        auto from_integer =
            ipv6_network::create(make_uint128(0x20010db800000000, 0), 32);
        REQUIRE(from_integer);
        REQUIRE(*from_integer == *from_text);

        auto too_long = ipv6_network::create(ipv6_address("::"), 129);
        REQUIRE_FALSE(too_long);
        REQUIRE(too_long.error().code == error_code::out_of_range);

        auto bad_address = ipv6_network::create(std::string("2001::db8::"), 32);
        REQUIRE_FALSE(bad_address);
        REQUIRE(bad_address.error().code == error_code::multiple_elision);

        auto negative = ipv6_network::create(-1, 32);
        REQUIRE_FALSE(negative);
        REQUIRE(negative.error().code == error_code::out_of_range);
    }

    SECTION("parse")
    {
        auto network = ipv6_network::parse("2001:DB8::/32");
        REQUIRE(network);
        REQUIRE(network->address() == ipv6_address("2001:db8::"));
        REQUIRE(network->prefix_length() == 32);

        auto missing = ipv6_network::parse("2001:db8::");
        REQUIRE_FALSE(missing);
        REQUIRE(missing.error().code == error_code::missing_prefix_length);

        auto trailing = ipv6_network::parse("2001:db8::/32/1");
        REQUIRE_FALSE(trailing);
        REQUIRE(trailing.error().code == error_code::trailing_data_after_prefix);

        auto too_long = ipv6_network::parse("2001:db8::/129");
        REQUIRE_FALSE(too_long);
        REQUIRE(too_long.error().code == error_code::out_of_range);
    }

    SECTION("derived values")
    {
        auto network = ipv6_network(ipv6_address("2001:db8::"), 32);
        REQUIRE(network.prefix_mask() == make_uint128(0xffffffff00000000, 0));
        REQUIRE(network.max_index() == make_uint128(0xffffffff, ~0ULL));
        REQUIRE(network.host_count() == uint128_t{1} << 96);
        REQUIRE(network.first() == ipv6_address("2001:db8::"));
        REQUIRE(network.last()
                == ipv6_address("2001:db8:ffff:ffff:ffff:ffff:ffff:ffff"));

        auto host = ipv6_network(ipv6_address("2001:db8::1"), 128);
        REQUIRE(host.host_count() == uint128_t{1});
        REQUIRE(host.max_index() == 0);
        REQUIRE(host.first() == host.last());

        auto everything = ipv6_network(ipv6_address(), 0);
        REQUIRE_FALSE(everything.host_count());
        REQUIRE(everything.max_index() == uint128_max);
        REQUIRE(everything.prefix_mask() == 0);
        REQUIRE(everything.last().to_integer() == uint128_max);
    }

    SECTION("contains")
    {
        auto network = *ipv6_network::parse("2001:DB8::/32");
        REQUIRE(network.contains(ipv6_address("2001:DB8:0:0:8:800:200C:417A")));
        REQUIRE(network.contains(network.first()));
        REQUIRE(network.contains(network.last()));
        REQUIRE_FALSE(network.contains(ipv6_address("2001:DB9::")));
        REQUIRE_FALSE(network.contains(ipv6_address("2001:db7:ffff::")));

        REQUIRE(ipv6_network(ipv6_address(), 0)
                    .contains(ipv6_address::from_integer(uint128_max).value()));
    }

    SECTION("address at index")
    {
        auto network = ipv6_network(ipv6_address("2001:db8::"), 120);
        REQUIRE(*network.address_at(0) == ipv6_address("2001:db8::"));
        REQUIRE(*network.address_at(0x10) == ipv6_address("2001:db8::10"));
        REQUIRE(*network.address_at(255) == ipv6_address("2001:db8::ff"));

        auto past_end = network.address_at(256);
        REQUIRE_FALSE(past_end);
        REQUIRE(past_end.error().code == error_code::index_out_of_range);

        auto negative = network.address_at(-1);
        REQUIRE_FALSE(negative);
        REQUIRE(negative.error().code == error_code::index_out_of_range);
    }

    SECTION("address at index covers the whole address space")
    {
        auto everything = ipv6_network(ipv6_address(), 0);

        auto top = everything.address_at(everything.max_index());
        REQUIRE(top);
        REQUIRE(top->to_integer() == uint128_max);

        auto upper_half = everything.address_at(uint128_t{1} << 127);
        REQUIRE(upper_half);
        REQUIRE(*upper_half == ipv6_address("8000::"));

        auto host = ipv6_network(ipv6_address("2001:db8::1"), 128);
        REQUIRE(*host.address_at(uint128_t{0}) == ipv6_address("2001:db8::1"));
        REQUIRE_FALSE(host.address_at(uint128_t{1}));
        REQUIRE_FALSE(host.address_at(int128_t{-1}));
    }

    SECTION("iteration")
    {
        auto network = ipv6_network(ipv6_address("2001:db8::"), 124);

        std::vector<ipv6_address> addresses;
        for (const auto& addr : network) { addresses.push_back(addr); }

        REQUIRE(addresses.size() == *network.host_count());
        REQUIRE(addresses.front() == network.first());
        REQUIRE(addresses.back() == network.last());
        REQUIRE(std::adjacent_find(addresses.begin(),
                                   addresses.end(),
                                   std::greater_equal<ipv6_address>{})
                == addresses.end());

        /* Iteration can be repeated */
        REQUIRE(std::distance(network.begin(), network.end())
                == static_cast<std::ptrdiff_t>(addresses.size()));

        auto host = ipv6_network(ipv6_address::from_integer(uint128_max).value(), 128);
        REQUIRE(std::distance(host.begin(), host.end()) == 1);
        REQUIRE(*host.begin() == host.address());
    }

    SECTION("comparison operator checks")
    {
        REQUIRE(ipv6_network(ipv6_address("2001:1:1::1001"), 124)
                == ipv6_network(ipv6_address("2001:1:1::1002"), 124));
        REQUIRE(ipv6_network(ipv6_address("2001:1:1::1001"), 124)
                != ipv6_network(ipv6_address("2001:1:1::1102"), 124));
        REQUIRE(ipv6_network(ipv6_address("2001::"), 16)
                < ipv6_network(ipv6_address("2001::"), 32));
        REQUIRE(ipv6_network(ipv6_address("2002::"), 16)
                > ipv6_network(ipv6_address("2001::"), 32));
    }

    SECTION("string conversion")
    {
        auto network = ipv6_network(ipv6_address("2001:db8::"), 32);
        REQUIRE(to_string(network) == "2001:db8::/32");
        REQUIRE(to_string(network, format_long)
                == "2001:0db8:0000:0000:0000:0000:0000:0000/32");
        REQUIRE(*format(network, "tc") == "2001:db8::/32");
        REQUIRE_FALSE(format(network, "z"));

        std::ostringstream os;
        os << network;
        REQUIRE(os.str() == "2001:db8::/32");
    }
}
