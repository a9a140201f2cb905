#include <catch2/catch_test_macros.hpp>
#include "sskr/crypto/secure_memory_handle.hpp"
#include "sskr/crypto/sodium_interop.hpp"
#include <algorithm>
#include <vector>
using namespace sskr;
using namespace sskr::crypto;
TEST_CASE("SecureMemoryHandle - Allocation", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Allocate secret-sized buffer") {
        auto result = SecureMemoryHandle::Allocate(32);
        REQUIRE(result.IsOk());
        auto handle = std::move(result).Unwrap();
        REQUIRE_FALSE(handle.IsInvalid());
        REQUIRE(handle.Size() == 32);
        REQUIRE(handle.View().size() == 32);
    }
    SECTION("Cannot allocate zero bytes") {
        auto result = SecureMemoryHandle::Allocate(0);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::AllocationFailed);
    }
    SECTION("Default handle is invalid and empty") {
        SecureMemoryHandle handle;
        REQUIRE(handle.IsInvalid());
        REQUIRE(handle.View().empty());
        REQUIRE(handle.MutableView().empty());
    }
}
TEST_CASE("SecureMemoryHandle - Move Semantics", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Move construction keeps the same memory") {
        auto handle1 = SecureMemoryHandle::Allocate(16).Unwrap();
        const auto* data = handle1.View().data();
        SecureMemoryHandle handle2(std::move(handle1));
        REQUIRE(handle1.IsInvalid());
        REQUIRE_FALSE(handle2.IsInvalid());
        REQUIRE(handle2.View().data() == data);
    }
    SECTION("Move assignment releases the previous buffer") {
        auto handle1 = SecureMemoryHandle::Allocate(16).Unwrap();
        auto handle2 = SecureMemoryHandle::Allocate(32).Unwrap();
        handle2 = std::move(handle1);
        REQUIRE(handle1.IsInvalid());
        REQUIRE(handle2.Size() == 16);
    }
    SECTION("Handles survive vector growth") {
        std::vector<SecureMemoryHandle> handles;
        for (uint8_t i = 0; i < 16; ++i) {
            auto handle = SecureMemoryHandle::Allocate(16).Unwrap();
            std::vector<uint8_t> data(16, i);
            REQUIRE(handle.Write(data).IsOk());
            handles.push_back(std::move(handle));
        }
        for (uint8_t i = 0; i < 16; ++i) {
            REQUIRE(handles[i].ReadBytes(16).Unwrap() == std::vector<uint8_t>(16, i));
        }
    }
}
TEST_CASE("SecureMemoryHandle - Write and Read", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Round trip") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        std::vector<uint8_t> data(32, 0x42);
        REQUIRE(handle.Write(data).IsOk());
        REQUIRE(handle.ReadBytes(32).Unwrap() == data);
    }
    SECTION("Short write zeroes the tail") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        std::vector<uint8_t> full(32, 0xFF);
        REQUIRE(handle.Write(full).IsOk());
        std::vector<uint8_t> half(16, 0x11);
        REQUIRE(handle.Write(half).IsOk());
        auto read = handle.ReadBytes(32).Unwrap();
        REQUIRE(std::all_of(read.begin(), read.begin() + 16, [](uint8_t b) { return b == 0x11; }));
        REQUIRE(std::all_of(read.begin() + 16, read.end(), [](uint8_t b) { return b == 0x00; }));
    }
    SECTION("Write larger than buffer fails") {
        auto handle = SecureMemoryHandle::Allocate(16).Unwrap();
        std::vector<uint8_t> data(32, 0x42);
        auto result = handle.Write(data);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::BufferTooSmall);
    }
    SECTION("Write to moved-from handle fails") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        auto moved = std::move(handle);
        std::vector<uint8_t> data(32, 0x42);
        REQUIRE(handle.Write(data).IsErr());
    }
    SECTION("ReadBytes beyond size fails") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        REQUIRE(handle.ReadBytes(64).IsErr());
    }
    SECTION("MutableView writes are visible through View") {
        auto handle = SecureMemoryHandle::Allocate(16).Unwrap();
        auto view = handle.MutableView();
        std::fill(view.begin(), view.end(), uint8_t{0xA5});
        REQUIRE(handle.View()[15] == 0xA5);
    }
}
