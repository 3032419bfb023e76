#include <catch2/catch_test_macros.hpp>

#include "core/types/CidrRange.hpp"

#include <stdexcept>

using namespace netsentry::core;

TEST_CASE("CidrRange parsing", "[CidrRange]") {
    SECTION("Canonical network") {
        auto range = CidrRange::parse("192.168.1.0/24");
        REQUIRE(range.prefixLength() == 24);
        REQUIRE(range.toString() == "192.168.1.0/24");
    }

    SECTION("Host bits are cleared") {
        auto range = CidrRange::parse("10.0.0.7/30");
        REQUIRE(range.toString() == "10.0.0.4/30");
    }

    SECTION("Bare address is a /32") {
        auto range = CidrRange::parse("172.16.5.9");
        REQUIRE(range.prefixLength() == 32);
        REQUIRE(range.hostCount() == 1);
    }

    SECTION("Invalid input throws") {
        REQUIRE_THROWS_AS(CidrRange::parse("10.0.0.0/33"), std::invalid_argument);
        REQUIRE_THROWS_AS(CidrRange::parse("10.0.0/24"), std::invalid_argument);
        REQUIRE_THROWS_AS(CidrRange::parse("256.1.1.1/24"), std::invalid_argument);
        REQUIRE_THROWS_AS(CidrRange::parse("10.0.0.0/"), std::invalid_argument);
        REQUIRE_THROWS_AS(CidrRange::parse("not-a-network"), std::invalid_argument);
    }

    SECTION("isValid mirrors parse") {
        REQUIRE(CidrRange::isValid("10.1.0.0/16"));
        REQUIRE_FALSE(CidrRange::isValid("10.1.0.0/-1"));
    }
}

TEST_CASE("CidrRange host counting", "[CidrRange]") {
    REQUIRE(CidrRange::parse("10.0.0.0/24").addressCount() == 256);
    REQUIRE(CidrRange::parse("10.0.0.0/24").hostCount() == 254);
    REQUIRE(CidrRange::parse("10.0.0.0/30").hostCount() == 2);
    REQUIRE(CidrRange::parse("10.0.0.0/31").hostCount() == 2);
    REQUIRE(CidrRange::parse("0.0.0.0/0").addressCount() == 4294967296ULL);
}

TEST_CASE("CidrRange host enumeration", "[CidrRange]") {
    SECTION("Skips network and broadcast") {
        auto hosts = CidrRange::parse("10.0.0.0/30").hosts(100);
        REQUIRE(hosts == std::vector<std::string>{"10.0.0.1", "10.0.0.2"});
    }

    SECTION("A /31 yields both addresses") {
        auto hosts = CidrRange::parse("10.0.0.0/31").hosts(100);
        REQUIRE(hosts == std::vector<std::string>{"10.0.0.0", "10.0.0.1"});
    }

    SECTION("Limit caps the enumeration") {
        auto hosts = CidrRange::parse("10.0.0.0/16").hosts(3);
        REQUIRE(hosts.size() == 3);
        REQUIRE(hosts.back() == "10.0.0.3");
    }
}

TEST_CASE("CidrRange membership", "[CidrRange]") {
    auto range = CidrRange::parse("192.168.10.0/23");
    REQUIRE(range.contains("192.168.11.200"));
    REQUIRE_FALSE(range.contains("192.168.12.1"));
    REQUIRE_FALSE(range.contains("garbage"));
}
