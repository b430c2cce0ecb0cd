#include "doctest.h"

#include "vectorlink/net/ip_address.h"

using vectorlink::net::AddressFamily;
using vectorlink::net::IpAddress;

TEST_CASE("IpAddress: parses dotted quad")
{
    auto a = IpAddress::parse("192.168.1.20");
    REQUIRE(a.has_value());
    CHECK(a->family() == AddressFamily::V4);
    CHECK(a->to_string() == "192.168.1.20");
    CHECK(*a == IpAddress::v4(192, 168, 1, 20));
}

TEST_CASE("IpAddress: parses IPv6 and prints the canonical form")
{
    auto a = IpAddress::parse("FE80:0000:0000:0000:0000:0000:0000:0001");
    REQUIRE(a.has_value());
    CHECK(a->family() == AddressFamily::V6);
    CHECK(a->to_string() == "fe80::1");
}

TEST_CASE("IpAddress: ignores surrounding whitespace")
{
    auto a = IpAddress::parse("  10.0.0.7 \t");
    REQUIRE(a.has_value());
    CHECK(a->to_string() == "10.0.0.7");
}

TEST_CASE("IpAddress: rejects garbage")
{
    CHECK_FALSE(IpAddress::parse("").has_value());
    CHECK_FALSE(IpAddress::parse("   ").has_value());
    CHECK_FALSE(IpAddress::parse("256.1.1.1").has_value());
    CHECK_FALSE(IpAddress::parse("vector.local").has_value());
    CHECK_FALSE(IpAddress::parse("::g").has_value());
}

TEST_CASE("IpAddress: v4 and v6 never compare equal")
{
    auto v4 = IpAddress::parse("0.0.0.1");
    auto v6 = IpAddress::parse("::1");
    REQUIRE(v4.has_value());
    REQUIRE(v6.has_value());
    CHECK(*v4 != *v6);
}
