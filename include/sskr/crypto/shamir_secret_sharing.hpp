#pragma once
#include "sskr/core/result.hpp"
#include "sskr/core/failures.hpp"
#include "sskr/core/constants.hpp"
#include "sskr/crypto/secure_memory_handle.hpp"
#include "sskr/interfaces/i_random_source.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sskr::crypto {

/// One point of a byte-wise polynomial: x-coordinate and y-values.
struct ShamirShare {
    uint8_t index;
    std::span<const uint8_t> value;
};

/**
 * @brief Single-level threshold sharing of one secret-length buffer
 *
 * Every byte position is an independent polynomial over GF(256). Share i is
 * the evaluation at x = i. The secret sits at x = 255 and the digest point
 * at x = 254, so share coordinates never collide with either.
 *
 * With threshold 1 every share is a verbatim copy of the secret and no
 * digest is involved.
 */
class ShamirSecretSharing {
public:
    static constexpr uint8_t MAX_SHARE_COUNT = ShamirConstants::MAX_SHARE_COUNT;
    static constexpr uint8_t SECRET_INDEX = ShamirConstants::SECRET_INDEX;
    static constexpr uint8_t DIGEST_INDEX = ShamirConstants::DIGEST_INDEX;

    static Result<std::vector<SecureMemoryHandle>, SskrFailure> Split(
        uint8_t threshold,
        uint8_t share_count,
        std::span<const uint8_t> secret,
        interfaces::IRandomSource& random);

    /**
     * @brief Rebuild the secret from at least @p threshold distinct shares
     *
     * Extra shares are accepted; the lowest @p threshold indexes are used.
     * The recovered secret is checked against the interpolated digest point.
     */
    static Result<SecureMemoryHandle, SskrFailure> Recover(
        uint8_t threshold,
        std::span<const ShamirShare> shares);

    /// Lagrange interpolation of @p points evaluated at @p x.
    static Result<std::vector<uint8_t>, SskrFailure> Interpolate(
        std::span<const ShamirShare> points,
        uint8_t x);

    static Result<Unit, SskrFailure> ValidateSecretLength(size_t length);

private:
    ShamirSecretSharing() = delete;
};

}
