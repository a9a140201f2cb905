#pragma once
#include <cstdint>
namespace sskr::crypto {
/**
 * @brief Arithmetic in GF(2^8) modulo x^8 + x^4 + x^3 + x + 1
 *
 * Multiplication and inversion go through log/antilog tables generated at
 * compile time from the generator 0x03. Zero operands are masked rather than
 * branched on, so the lookups do not depend on whether a secret byte is zero.
 */
class Gf256 {
public:
    [[nodiscard]] static constexpr uint8_t Add(const uint8_t a, const uint8_t b) noexcept {
        return static_cast<uint8_t>(a ^ b);
    }
    [[nodiscard]] static constexpr uint8_t Sub(const uint8_t a, const uint8_t b) noexcept {
        return static_cast<uint8_t>(a ^ b);
    }
    [[nodiscard]] static uint8_t Mul(uint8_t a, uint8_t b) noexcept;
    /// Inv(0) has no meaning; it returns 0.
    [[nodiscard]] static uint8_t Inv(uint8_t a) noexcept;
    [[nodiscard]] static uint8_t Div(uint8_t a, uint8_t b) noexcept;
private:
    Gf256() = delete;
};
}
