#pragma once

#include <cstdint>

namespace sskr::configuration {

/// How the decoder treats the reserved high nibble of header byte 4
enum class ReservedBitsPolicy : uint8_t {
    /// Non-zero reserved bits make the share malformed
    Reject = 0,

    /// Reserved bits are read and discarded
    Ignore = 1
};

/// Decode-side configuration for share parsing
///
/// Encoding is not configurable: it always writes zero reserved bits.
///
/// @example
/// ```cpp
/// auto secret = Sskr::Recombine(buffers);                         // strict
/// auto secret = Sskr::Recombine(buffers, SskrConfig::Lenient());  // tolerant
/// ```
class SskrConfig {
public:
    /// Reserved bits must be zero
    [[nodiscard]] static constexpr SskrConfig Strict() noexcept {
        return SskrConfig(ReservedBitsPolicy::Reject);
    }

    /// Reserved bits are ignored, for shares written by encoders that
    /// put data there
    [[nodiscard]] static constexpr SskrConfig Lenient() noexcept {
        return SskrConfig(ReservedBitsPolicy::Ignore);
    }

    [[nodiscard]] static constexpr SskrConfig Default() noexcept {
        return Strict();
    }

    [[nodiscard]] constexpr ReservedBitsPolicy GetReservedBitsPolicy() const noexcept {
        return reserved_bits_;
    }

    [[nodiscard]] constexpr bool RejectsReservedBits() const noexcept {
        return reserved_bits_ == ReservedBitsPolicy::Reject;
    }

    [[nodiscard]] constexpr bool operator==(const SskrConfig& other) const noexcept {
        return reserved_bits_ == other.reserved_bits_;
    }

    [[nodiscard]] constexpr bool operator!=(const SskrConfig& other) const noexcept {
        return reserved_bits_ != other.reserved_bits_;
    }

private:
    explicit constexpr SskrConfig(const ReservedBitsPolicy reserved_bits) noexcept
        : reserved_bits_(reserved_bits) {}

    ReservedBitsPolicy reserved_bits_;
};

} // namespace sskr::configuration
