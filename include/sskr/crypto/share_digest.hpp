#pragma once
#include "sskr/core/result.hpp"
#include "sskr/core/failures.hpp"
#include "sskr/core/constants.hpp"
#include "sskr/interfaces/i_random_source.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
namespace sskr::crypto {
/**
 * @brief Integrity digest carried by every Shamir polynomial
 *
 * The digest point has the same length L as the secret:
 *
 *     digest_point = HMAC-SHA256(key = salt, msg = secret)[0..4] || salt
 *
 * where salt is L - 4 random bytes. It is interpolated at the reserved
 * x = 254 next to the secret at x = 255, so a wrong share combination
 * recovers a (secret, digest point) pair that fails Verify.
 */
class ShareDigest {
public:
    static constexpr size_t DIGEST_LENGTH = Constants::DIGEST_LENGTH;

    /**
     * @brief Fill @p digest_point (secret.size() bytes) with digest || fresh salt
     */
    static Result<Unit, SskrFailure> Seal(
        std::span<const uint8_t> secret,
        interfaces::IRandomSource& random,
        std::span<uint8_t> digest_point);

    /**
     * @brief Recompute the digest from the salt part of @p digest_point
     *
     * @return Ok(true) when the digest matches, Ok(false) when it does not
     */
    static Result<bool, SskrFailure> Verify(
        std::span<const uint8_t> digest_point,
        std::span<const uint8_t> secret);

    /// Truncated HMAC-SHA256 of @p secret keyed by @p salt.
    static Result<Unit, SskrFailure> Compute(
        std::span<const uint8_t> salt,
        std::span<const uint8_t> secret,
        std::span<uint8_t> digest_out);

private:
    ShareDigest() = delete;
};
}
