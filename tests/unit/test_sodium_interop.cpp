#include <catch2/catch_test_macros.hpp>
#include "sskr/crypto/sodium_interop.hpp"
#include "sskr/crypto/sodium_random_source.hpp"
#include <algorithm>
#include <vector>
using namespace sskr;
using namespace sskr::crypto;
TEST_CASE("SodiumInterop - Initialization is idempotent", "[crypto][sodium]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    REQUIRE(SodiumInterop::Initialize().IsOk());
    REQUIRE(SodiumInterop::IsInitialized());
}
TEST_CASE("SodiumInterop - SecureWipe", "[crypto][sodium]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Small buffer") {
        std::vector<uint8_t> buffer(32, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Large buffer") {
        std::vector<uint8_t> buffer(4096, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Empty buffer") {
        std::vector<uint8_t> buffer;
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
    }
}
TEST_CASE("SodiumInterop - ConstantTimeEquals", "[crypto][sodium]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> a(16, 0x01);
    std::vector<uint8_t> b(16, 0x01);
    std::vector<uint8_t> c(16, 0x01);
    c[15] = 0x02;
    std::vector<uint8_t> shorter(15, 0x01);
    REQUIRE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap());
    REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, c).Unwrap());
    REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, shorter).Unwrap());
}
TEST_CASE("SodiumRandomSource - Fills buffers", "[crypto][sodium]") {
    SodiumRandomSource random;
    std::vector<uint8_t> first(32, 0);
    std::vector<uint8_t> second(32, 0);
    REQUIRE(random.FillRandom(first).IsOk());
    REQUIRE(random.FillRandom(second).IsOk());
    REQUIRE(first != second);
    REQUIRE(random.FillRandom(std::span<uint8_t>()).IsOk());
}
