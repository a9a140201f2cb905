#pragma once
#include "sskr/interfaces/i_random_source.hpp"
#include "sskr/core/result.hpp"
#include "sskr/core/failures.hpp"
#include <sodium.h>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace sskr::test_helpers {

using interfaces::IRandomSource;

/// Reproducible stream: every call expands the current seed with
/// randombytes_buf_deterministic, then increments the seed.
class DeterministicRandomSource : public IRandomSource {
public:
    explicit DeterministicRandomSource(const uint8_t seed_byte = 0x42) {
        seed_.fill(seed_byte);
    }

    [[nodiscard]] Result<Unit, SskrFailure> FillRandom(std::span<uint8_t> buffer) override {
        randombytes_buf_deterministic(buffer.data(), buffer.size(), seed_.data());
        sodium_increment(seed_.data(), seed_.size());
        bytes_drawn_ += buffer.size();
        ++calls_;
        return Result<Unit, SskrFailure>::Ok(unit);
    }

    [[nodiscard]] size_t BytesDrawn() const noexcept { return bytes_drawn_; }
    [[nodiscard]] size_t Calls() const noexcept { return calls_; }

private:
    std::array<uint8_t, randombytes_SEEDBYTES> seed_{};
    size_t bytes_drawn_ = 0;
    size_t calls_ = 0;
};

/// Fails with RandomnessUnavailable once more than @p limit bytes are requested.
class LimitedRandomSource : public IRandomSource {
public:
    explicit LimitedRandomSource(const size_t limit) : remaining_(limit) {}

    [[nodiscard]] Result<Unit, SskrFailure> FillRandom(std::span<uint8_t> buffer) override {
        if (buffer.size() > remaining_) {
            return Result<Unit, SskrFailure>::Err(
                SskrFailure::RandomnessUnavailable("Limited random source exhausted"));
        }
        remaining_ -= buffer.size();
        return inner_.FillRandom(buffer);
    }

private:
    DeterministicRandomSource inner_;
    size_t remaining_;
};

/// Emits a fixed byte, for tests that need predictable "random" shares.
class ConstantRandomSource : public IRandomSource {
public:
    explicit ConstantRandomSource(const uint8_t value) : value_(value) {}

    [[nodiscard]] Result<Unit, SskrFailure> FillRandom(std::span<uint8_t> buffer) override {
        for (auto& byte : buffer) {
            byte = value_;
        }
        return Result<Unit, SskrFailure>::Ok(unit);
    }

private:
    uint8_t value_;
};

}
