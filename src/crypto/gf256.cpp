#include "sskr/crypto/gf256.hpp"
#include "sskr/core/constants.hpp"
#include <array>
#include <cstddef>

namespace sskr::crypto {
namespace {
struct FieldTables {
    std::array<uint8_t, 256> exp{};
    std::array<uint8_t, 256> log{};
};

constexpr FieldTables BuildTables() {
    FieldTables tables{};
    uint16_t value = 1;
    for (size_t power = 0; power < Gf256Constants::MULTIPLICATIVE_ORDER; ++power) {
        tables.exp[power] = static_cast<uint8_t>(value);
        tables.log[value] = static_cast<uint8_t>(power);
        // value *= 3, i.e. value ^ (value << 1), reduced by the field polynomial
        value = static_cast<uint16_t>(value ^ (value << 1));
        if ((value & 0x100) != 0) {
            value ^= Gf256Constants::REDUCING_POLYNOMIAL;
        }
    }
    tables.exp[Gf256Constants::MULTIPLICATIVE_ORDER] = tables.exp[0];
    return tables;
}

constexpr FieldTables kTables = BuildTables();

static_assert(kTables.exp[0] == 1);
static_assert(kTables.exp[1] == Gf256Constants::GENERATOR);
static_assert(kTables.log[1] == 0);

constexpr uint8_t NonZeroMask(const uint8_t a, const uint8_t b) noexcept {
    return static_cast<uint8_t>(-static_cast<int>((a != 0) & (b != 0)));
}
}

uint8_t Gf256::Mul(const uint8_t a, const uint8_t b) noexcept {
    const size_t exponent =
        (static_cast<size_t>(kTables.log[a]) + kTables.log[b]) % Gf256Constants::MULTIPLICATIVE_ORDER;
    return static_cast<uint8_t>(kTables.exp[exponent] & NonZeroMask(a, b));
}

uint8_t Gf256::Inv(const uint8_t a) noexcept {
    const size_t exponent =
        (Gf256Constants::MULTIPLICATIVE_ORDER - kTables.log[a]) % Gf256Constants::MULTIPLICATIVE_ORDER;
    return static_cast<uint8_t>(kTables.exp[exponent] & NonZeroMask(a, a));
}

uint8_t Gf256::Div(const uint8_t a, const uint8_t b) noexcept {
    return Mul(a, Inv(b));
}
}
