#include "sskr/crypto/shamir_secret_sharing.hpp"
#include "sskr/crypto/gf256.hpp"
#include "sskr/crypto/share_digest.hpp"
#include "sskr/crypto/sodium_interop.hpp"
#include "sskr/core/format.hpp"
#include <algorithm>
#include <array>
#include <map>

namespace sskr::crypto {
namespace {

Result<Unit, SskrFailure> EnsureSodium() {
    if (auto init_result = SodiumInterop::Initialize(); init_result.IsErr()) {
        return Result<Unit, SskrFailure>::Err(
            SskrFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }
    return Result<Unit, SskrFailure>::Ok(unit);
}

Result<SecureMemoryHandle, SskrFailure> AllocateBuffer(const size_t length) {
    auto handle_result = SecureMemoryHandle::Allocate(length);
    if (handle_result.IsErr()) {
        return Result<SecureMemoryHandle, SskrFailure>::Err(
            SskrFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    return Result<SecureMemoryHandle, SskrFailure>::Ok(std::move(handle_result).Unwrap());
}

void InterpolateInto(
    std::span<const ShamirShare> points,
    const uint8_t x,
    std::span<uint8_t> out) {
    std::fill(out.begin(), out.end(), uint8_t{0});
    for (size_t i = 0; i < points.size(); ++i) {
        uint8_t numerator = 1;
        uint8_t denominator = 1;
        for (size_t j = 0; j < points.size(); ++j) {
            if (i == j) {
                continue;
            }
            numerator = Gf256::Mul(numerator, Gf256::Sub(x, points[j].index));
            denominator = Gf256::Mul(denominator, Gf256::Sub(points[i].index, points[j].index));
        }
        const uint8_t basis = Gf256::Div(numerator, denominator);
        const auto y = points[i].value;
        for (size_t k = 0; k < out.size(); ++k) {
            out[k] = Gf256::Add(out[k], Gf256::Mul(basis, y[k]));
        }
    }
}

Result<Unit, SskrFailure> ValidatePoints(std::span<const ShamirShare> points) {
    if (points.empty()) {
        return Result<Unit, SskrFailure>::Err(
            SskrFailure::InsufficientShares(std::string(ErrorMessages::NO_SHARES)));
    }
    const size_t length = points.front().value.size();
    std::array<bool, 256> seen{};
    for (const auto& point : points) {
        if (point.value.size() != length) {
            return Result<Unit, SskrFailure>::Err(
                SskrFailure::InconsistentParameters(compat::format(
                    "Share lengths differ ({} vs {})", point.value.size(), length)));
        }
        if (seen[point.index]) {
            return Result<Unit, SskrFailure>::Err(
                SskrFailure::DuplicateShare(compat::format(
                    "Share index {} supplied twice", point.index)));
        }
        seen[point.index] = true;
    }
    return Result<Unit, SskrFailure>::Ok(unit);
}

}

Result<Unit, SskrFailure> ShamirSecretSharing::ValidateSecretLength(const size_t length) {
    if (length < Constants::MIN_SECRET_LENGTH ||
        length > Constants::MAX_SECRET_LENGTH ||
        length % 2 != 0) {
        return Result<Unit, SskrFailure>::Err(
            SskrFailure::InvalidParameters(compat::format(
                "Secret length must be an even number between {} and {}, got {}",
                Constants::MIN_SECRET_LENGTH, Constants::MAX_SECRET_LENGTH, length)));
    }
    return Result<Unit, SskrFailure>::Ok(unit);
}

Result<std::vector<SecureMemoryHandle>, SskrFailure> ShamirSecretSharing::Split(
    const uint8_t threshold,
    const uint8_t share_count,
    std::span<const uint8_t> secret,
    interfaces::IRandomSource& random) {
    using SplitResult = Result<std::vector<SecureMemoryHandle>, SskrFailure>;

    if (share_count == 0 || share_count > MAX_SHARE_COUNT) {
        return SplitResult::Err(SskrFailure::InvalidParameters(compat::format(
            "Share count must be between 1 and {}, got {}", MAX_SHARE_COUNT, share_count)));
    }
    if (threshold == 0 || threshold > share_count) {
        return SplitResult::Err(SskrFailure::InvalidParameters(compat::format(
            "Threshold must be between 1 and {}, got {}", share_count, threshold)));
    }
    if (auto length_result = ValidateSecretLength(secret.size()); length_result.IsErr()) {
        return SplitResult::Err(std::move(length_result).UnwrapErr());
    }
    if (auto init_result = EnsureSodium(); init_result.IsErr()) {
        return SplitResult::Err(std::move(init_result).UnwrapErr());
    }

    std::vector<SecureMemoryHandle> shares;
    shares.reserve(share_count);
    for (uint8_t i = 0; i < share_count; ++i) {
        auto handle_result = AllocateBuffer(secret.size());
        if (handle_result.IsErr()) {
            return SplitResult::Err(std::move(handle_result).UnwrapErr());
        }
        shares.push_back(std::move(handle_result).Unwrap());
    }

    if (threshold == 1) {
        for (auto& share : shares) {
            if (auto write_result = share.Write(secret); write_result.IsErr()) {
                return SplitResult::Err(SskrFailure::FromSodiumFailure(write_result.UnwrapErr()));
            }
        }
        return SplitResult::Ok(std::move(shares));
    }

    const uint8_t random_share_count = static_cast<uint8_t>(threshold - 2);
    std::vector<ShamirShare> points;
    points.reserve(threshold);
    for (uint8_t i = 0; i < random_share_count; ++i) {
        if (auto fill_result = random.FillRandom(shares[i].MutableView()); fill_result.IsErr()) {
            return SplitResult::Err(std::move(fill_result).UnwrapErr());
        }
        points.push_back(ShamirShare{i, shares[i].View()});
    }

    auto digest_result = AllocateBuffer(secret.size());
    if (digest_result.IsErr()) {
        return SplitResult::Err(std::move(digest_result).UnwrapErr());
    }
    SecureMemoryHandle digest_point = std::move(digest_result).Unwrap();
    if (auto seal_result = ShareDigest::Seal(secret, random, digest_point.MutableView());
        seal_result.IsErr()) {
        return SplitResult::Err(std::move(seal_result).UnwrapErr());
    }
    points.push_back(ShamirShare{DIGEST_INDEX, digest_point.View()});
    points.push_back(ShamirShare{SECRET_INDEX, secret});

    for (uint8_t i = random_share_count; i < share_count; ++i) {
        InterpolateInto(points, i, shares[i].MutableView());
    }

    return SplitResult::Ok(std::move(shares));
}

Result<SecureMemoryHandle, SskrFailure> ShamirSecretSharing::Recover(
    const uint8_t threshold,
    std::span<const ShamirShare> shares) {
    using RecoverResult = Result<SecureMemoryHandle, SskrFailure>;

    if (threshold == 0 || threshold > MAX_SHARE_COUNT) {
        return RecoverResult::Err(SskrFailure::InvalidParameters(compat::format(
            "Threshold must be between 1 and {}, got {}", MAX_SHARE_COUNT, threshold)));
    }
    if (shares.empty()) {
        return RecoverResult::Err(
            SskrFailure::InsufficientShares(std::string(ErrorMessages::NO_SHARES)));
    }
    if (auto init_result = EnsureSodium(); init_result.IsErr()) {
        return RecoverResult::Err(std::move(init_result).UnwrapErr());
    }

    const size_t length = shares.front().value.size();
    std::map<uint8_t, std::span<const uint8_t>> distinct;
    for (const auto& share : shares) {
        if (share.value.size() != length) {
            return RecoverResult::Err(SskrFailure::InconsistentParameters(compat::format(
                "Share lengths differ ({} vs {})", share.value.size(), length)));
        }
        if (share.index >= DIGEST_INDEX) {
            return RecoverResult::Err(SskrFailure::InvalidParameters(compat::format(
                "Share index {} collides with a reserved coordinate", share.index)));
        }
        auto [it, inserted] = distinct.emplace(share.index, share.value);
        if (!inserted) {
            auto same = SodiumInterop::ConstantTimeEquals(it->second, share.value);
            if (same.IsErr()) {
                return RecoverResult::Err(SskrFailure::FromSodiumFailure(same.UnwrapErr()));
            }
            if (!same.Unwrap()) {
                return RecoverResult::Err(SskrFailure::DuplicateShare(compat::format(
                    "Conflicting values for share index {}", share.index)));
            }
        }
    }
    if (auto length_result = ValidateSecretLength(length); length_result.IsErr()) {
        return RecoverResult::Err(std::move(length_result).UnwrapErr());
    }
    if (distinct.size() < threshold) {
        return RecoverResult::Err(SskrFailure::InsufficientShares(compat::format(
            "Need {} distinct shares, got {}", threshold, distinct.size())));
    }

    auto secret_result = AllocateBuffer(length);
    if (secret_result.IsErr()) {
        return secret_result;
    }
    SecureMemoryHandle secret = std::move(secret_result).Unwrap();

    if (threshold == 1) {
        if (auto write_result = secret.Write(distinct.begin()->second); write_result.IsErr()) {
            return RecoverResult::Err(SskrFailure::FromSodiumFailure(write_result.UnwrapErr()));
        }
        return RecoverResult::Ok(std::move(secret));
    }

    std::vector<ShamirShare> selected;
    selected.reserve(threshold);
    for (const auto& [index, value] : distinct) {
        if (selected.size() == threshold) {
            break;
        }
        selected.push_back(ShamirShare{index, value});
    }

    auto digest_result = AllocateBuffer(length);
    if (digest_result.IsErr()) {
        return digest_result;
    }
    SecureMemoryHandle digest_point = std::move(digest_result).Unwrap();

    InterpolateInto(selected, SECRET_INDEX, secret.MutableView());
    InterpolateInto(selected, DIGEST_INDEX, digest_point.MutableView());

    auto verify_result = ShareDigest::Verify(digest_point.View(), secret.View());
    if (verify_result.IsErr()) {
        return RecoverResult::Err(std::move(verify_result).UnwrapErr());
    }
    if (!verify_result.Unwrap()) {
        return RecoverResult::Err(SskrFailure::ChecksumMismatch(
            std::string(ErrorMessages::DIGEST_VERIFICATION_FAILED)));
    }

    return RecoverResult::Ok(std::move(secret));
}

Result<std::vector<uint8_t>, SskrFailure> ShamirSecretSharing::Interpolate(
    std::span<const ShamirShare> points,
    const uint8_t x) {
    if (auto validate_result = ValidatePoints(points); validate_result.IsErr()) {
        return Result<std::vector<uint8_t>, SskrFailure>::Err(
            std::move(validate_result).UnwrapErr());
    }
    std::vector<uint8_t> result(points.front().value.size());
    InterpolateInto(points, x, result);
    return Result<std::vector<uint8_t>, SskrFailure>::Ok(std::move(result));
}

}
