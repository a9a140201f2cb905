#include "sskr/crypto/share_digest.hpp"
#include "sskr/crypto/sodium_interop.hpp"
#include "sskr/core/format.hpp"
#include <sodium.h>
#include <algorithm>
#include <array>

namespace sskr::crypto {

Result<Unit, SskrFailure> ShareDigest::Compute(
    std::span<const uint8_t> salt,
    std::span<const uint8_t> secret,
    std::span<uint8_t> digest_out) {
    if (digest_out.size() != DIGEST_LENGTH) {
        return Result<Unit, SskrFailure>::Err(
            SskrFailure::InvalidParameters(compat::format(
                "Digest output must be {} bytes, got {}", DIGEST_LENGTH, digest_out.size())));
    }
    if (salt.empty()) {
        return Result<Unit, SskrFailure>::Err(
            SskrFailure::InvalidParameters("Digest salt must not be empty"));
    }
    if (auto init_result = SodiumInterop::Initialize(); init_result.IsErr()) {
        return Result<Unit, SskrFailure>::Err(
            SskrFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }

    crypto_auth_hmacsha256_state state;
    std::array<uint8_t, crypto_auth_hmacsha256_BYTES> mac{};
    crypto_auth_hmacsha256_init(&state, salt.data(), salt.size());
    crypto_auth_hmacsha256_update(&state, secret.data(), secret.size());
    crypto_auth_hmacsha256_final(&state, mac.data());

    std::copy_n(mac.begin(), DIGEST_LENGTH, digest_out.begin());

    sodium_memzero(&state, sizeof(state));
    sodium_memzero(mac.data(), mac.size());
    return Result<Unit, SskrFailure>::Ok(unit);
}

Result<Unit, SskrFailure> ShareDigest::Seal(
    std::span<const uint8_t> secret,
    interfaces::IRandomSource& random,
    std::span<uint8_t> digest_point) {
    if (digest_point.size() != secret.size() || secret.size() <= DIGEST_LENGTH) {
        return Result<Unit, SskrFailure>::Err(
            SskrFailure::InvalidParameters(compat::format(
                "Digest point must match the secret length ({} vs {})",
                digest_point.size(), secret.size())));
    }

    auto salt = digest_point.subspan(DIGEST_LENGTH);
    if (auto fill_result = random.FillRandom(salt); fill_result.IsErr()) {
        return fill_result;
    }
    return Compute(salt, secret, digest_point.first(DIGEST_LENGTH));
}

Result<bool, SskrFailure> ShareDigest::Verify(
    std::span<const uint8_t> digest_point,
    std::span<const uint8_t> secret) {
    if (digest_point.size() != secret.size() || secret.size() <= DIGEST_LENGTH) {
        return Result<bool, SskrFailure>::Err(
            SskrFailure::InvalidParameters(compat::format(
                "Digest point must match the secret length ({} vs {})",
                digest_point.size(), secret.size())));
    }

    std::array<uint8_t, DIGEST_LENGTH> expected{};
    auto compute_result = Compute(digest_point.subspan(DIGEST_LENGTH), secret, expected);
    if (compute_result.IsErr()) {
        return Result<bool, SskrFailure>::Err(std::move(compute_result).UnwrapErr());
    }

    auto cmp_result = SodiumInterop::ConstantTimeEquals(
        expected, digest_point.first(DIGEST_LENGTH));
    if (cmp_result.IsErr()) {
        return Result<bool, SskrFailure>::Err(
            SskrFailure::FromSodiumFailure(cmp_result.UnwrapErr()));
    }
    return Result<bool, SskrFailure>::Ok(cmp_result.Unwrap());
}

}
