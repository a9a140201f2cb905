#include <catch2/catch_test_macros.hpp>
#include "sskr/configuration/sskr_config.hpp"

using namespace sskr::configuration;

TEST_CASE("SskrConfig - Factory methods", "[config]") {
    SECTION("Strict rejects reserved bits") {
        constexpr auto config = SskrConfig::Strict();
        STATIC_REQUIRE(config.GetReservedBitsPolicy() == ReservedBitsPolicy::Reject);
        STATIC_REQUIRE(config.RejectsReservedBits());
    }

    SECTION("Lenient ignores reserved bits") {
        constexpr auto config = SskrConfig::Lenient();
        STATIC_REQUIRE(config.GetReservedBitsPolicy() == ReservedBitsPolicy::Ignore);
        STATIC_REQUIRE_FALSE(config.RejectsReservedBits());
    }

    SECTION("Default is strict") {
        STATIC_REQUIRE(SskrConfig::Default() == SskrConfig::Strict());
        STATIC_REQUIRE(SskrConfig::Default() != SskrConfig::Lenient());
    }
}

TEST_CASE("SskrConfig - Value semantics", "[config]") {
    auto config = SskrConfig::Lenient();
    const auto copy = config;
    REQUIRE(copy == config);
    config = SskrConfig::Strict();
    REQUIRE(copy != config);
    REQUIRE(config.RejectsReservedBits());
}
