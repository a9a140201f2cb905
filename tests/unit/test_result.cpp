#include <catch2/catch_test_macros.hpp>
#include "sskr/core/result.hpp"
#include "sskr/core/failures.hpp"
#include <string>
using namespace sskr;
TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(result.IsErr());
        REQUIRE_FALSE(result.IsOk());
        REQUIRE(result.UnwrapErr() == "error");
    }
    SECTION("Unit type for void results") {
        auto result = Result<Unit, SskrFailure>::Ok(unit);
        REQUIRE(result.IsOk());
    }
    SECTION("Unwrap on Err throws") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE_THROWS_AS(result.Unwrap(), std::runtime_error);
    }
    SECTION("UnwrapErr on Ok throws") {
        auto result = Result<int, std::string>::Ok(1);
        REQUIRE_THROWS_AS(result.UnwrapErr(), std::runtime_error);
    }
}
TEST_CASE("Result<T, E> - Monadic Operations", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto result = Result<int, std::string>::Ok(21);
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("Map preserves Err") {
        auto result = Result<int, std::string>::Err("error");
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error");
    }
    SECTION("MapErr converts sodium failures") {
        auto result = Result<int, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed("sodium_malloc returned null"));
        auto mapped = std::move(result).MapErr([](const SodiumFailure& failure) {
            return SskrFailure::FromSodiumFailure(failure);
        });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr().type == SskrFailureType::SecureMemory);
        REQUIRE(mapped.UnwrapErr().message == "sodium_malloc returned null");
    }
    SECTION("Bind chains operations") {
        auto result = Result<int, std::string>::Ok(10);
        auto bound = std::move(result).Bind([](int x) {
            if (x > 5) {
                return Result<int, std::string>::Ok(x * 2);
            }
            return Result<int, std::string>::Err("too small");
        });
        REQUIRE(bound.IsOk());
        REQUIRE(bound.Unwrap() == 20);
    }
    SECTION("Bind short-circuits on Err") {
        bool called = false;
        auto result = Result<int, std::string>::Err("first");
        auto bound = std::move(result).Bind([&called](int x) {
            called = true;
            return Result<int, std::string>::Ok(x);
        });
        REQUIRE_FALSE(called);
        REQUIRE(bound.UnwrapErr() == "first");
    }
}
TEST_CASE("Result<T, E> - IsErrAnd", "[result][core]") {
    auto result = Result<int, SskrFailure>::Err(
        SskrFailure::ChecksumMismatch("digest"));
    REQUIRE(result.IsErrAnd([](const SskrFailure& f) {
        return f.type == SskrFailureType::ChecksumMismatch;
    }));
    REQUIRE_FALSE(result.IsErrAnd([](const SskrFailure& f) {
        return f.type == SskrFailureType::DuplicateShare;
    }));
    auto ok = Result<int, SskrFailure>::Ok(1);
    REQUIRE_FALSE(ok.IsErrAnd([](const SskrFailure&) { return true; }));
}
TEST_CASE("SskrFailure - Type names", "[result][core]") {
    REQUIRE(ToString(SskrFailureType::InsufficientShares) == "InsufficientShares");
    REQUIRE(ToString(SskrFailureType::MixedShareSets) == "MixedShareSets");
    REQUIRE(ToString(SskrFailureType::RandomnessUnavailable) == "RandomnessUnavailable");
}
