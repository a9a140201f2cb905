#pragma once
#include "sskr/interfaces/i_random_source.hpp"
#include <cstdint>
#include <span>
namespace sskr::crypto {
/// Production random source backed by libsodium's randombytes_buf.
class SodiumRandomSource final : public interfaces::IRandomSource {
public:
    SodiumRandomSource() = default;
    ~SodiumRandomSource() override = default;
    [[nodiscard]] Result<Unit, SskrFailure> FillRandom(std::span<uint8_t> buffer) override;
};
}
