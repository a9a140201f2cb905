#include "sskr/codec/share_codec.hpp"
#include "sskr/crypto/shamir_secret_sharing.hpp"
#include "sskr/core/format.hpp"

namespace sskr::codec {
namespace {

constexpr uint8_t kNibbleMask = GroupConstants::NIBBLE_MASK;
constexpr uint8_t kNibbleShift = GroupConstants::NIBBLE_SHIFT;

constexpr uint8_t PackNibbles(const uint8_t high, const uint8_t low) noexcept {
    return static_cast<uint8_t>((high << kNibbleShift) | (low & kNibbleMask));
}

constexpr uint8_t HighNibble(const uint8_t byte) noexcept {
    return static_cast<uint8_t>(byte >> kNibbleShift);
}

constexpr uint8_t LowNibble(const uint8_t byte) noexcept {
    return static_cast<uint8_t>(byte & kNibbleMask);
}

Result<Unit, SskrFailure> CheckRange(
    const char* field,
    const unsigned value,
    const unsigned min,
    const unsigned max) {
    if (value < min || value > max) {
        return Result<Unit, SskrFailure>::Err(SskrFailure::InvalidParameters(compat::format(
            "{} must be between {} and {}, got {}", field, min, max, value)));
    }
    return Result<Unit, SskrFailure>::Ok(unit);
}

}

Result<std::vector<uint8_t>, SskrFailure> ShareCodec::Encode(const models::Share& share) {
    using EncodeResult = Result<std::vector<uint8_t>, SskrFailure>;

    const Result<Unit, SskrFailure> checks[] = {
        CheckRange("Group count", share.group_count, 1, GroupConstants::MAX_GROUP_COUNT),
        CheckRange("Group threshold", share.group_threshold, 1, share.group_count),
        CheckRange("Group index", share.group_index, 0, share.group_count - 1u),
        CheckRange("Member threshold", share.member_threshold, 1, GroupConstants::MAX_MEMBER_COUNT),
        CheckRange("Member index", share.member_index, 0, GroupConstants::MAX_MEMBER_COUNT - 1u),
    };
    for (const auto& check : checks) {
        if (check.IsErr()) {
            return EncodeResult::Err(check.UnwrapErr());
        }
    }
    if (auto length_result = crypto::ShamirSecretSharing::ValidateSecretLength(share.value.size());
        length_result.IsErr()) {
        return EncodeResult::Err(std::move(length_result).UnwrapErr());
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(EncodedLength(share.value.size()));
    bytes.push_back(static_cast<uint8_t>(share.identifier >> 8));
    bytes.push_back(static_cast<uint8_t>(share.identifier & 0xFF));
    bytes.push_back(PackNibbles(share.group_threshold - 1, share.group_count - 1));
    bytes.push_back(PackNibbles(share.group_index, share.member_threshold - 1));
    bytes.push_back(PackNibbles(0, share.member_index));
    bytes.insert(bytes.end(), share.value.begin(), share.value.end());
    return EncodeResult::Ok(std::move(bytes));
}

Result<models::Share, SskrFailure> ShareCodec::Decode(
    std::span<const uint8_t> bytes,
    const configuration::SskrConfig config) {
    using DecodeResult = Result<models::Share, SskrFailure>;

    if (bytes.size() < METADATA_SIZE) {
        return DecodeResult::Err(SskrFailure::TruncatedShare(compat::format(
            "Share of {} bytes is shorter than the {}-byte header",
            bytes.size(), METADATA_SIZE)));
    }
    const auto payload = bytes.subspan(METADATA_SIZE);
    if (payload.size() < Constants::MIN_SECRET_LENGTH) {
        return DecodeResult::Err(SskrFailure::TruncatedShare(compat::format(
            "Share payload of {} bytes is shorter than {}",
            payload.size(), Constants::MIN_SECRET_LENGTH)));
    }
    if (payload.size() > Constants::MAX_SECRET_LENGTH || payload.size() % 2 != 0) {
        return DecodeResult::Err(SskrFailure::MalformedShare(compat::format(
            "Share payload length {} is not an even number up to {}",
            payload.size(), Constants::MAX_SECRET_LENGTH)));
    }

    models::Share share;
    share.identifier = static_cast<uint16_t>((bytes[0] << 8) | bytes[1]);
    share.group_threshold = static_cast<uint8_t>(HighNibble(bytes[2]) + 1);
    share.group_count = static_cast<uint8_t>(LowNibble(bytes[2]) + 1);
    share.group_index = HighNibble(bytes[3]);
    share.member_threshold = static_cast<uint8_t>(LowNibble(bytes[3]) + 1);
    const uint8_t reserved = HighNibble(bytes[4]);
    share.member_index = LowNibble(bytes[4]);

    if (share.group_threshold > share.group_count) {
        return DecodeResult::Err(SskrFailure::MalformedShare(compat::format(
            "Group threshold {} exceeds group count {}",
            share.group_threshold, share.group_count)));
    }
    if (share.group_index >= share.group_count) {
        return DecodeResult::Err(SskrFailure::MalformedShare(compat::format(
            "Group index {} is out of range for {} groups",
            share.group_index, share.group_count)));
    }
    if (reserved != 0 && config.RejectsReservedBits()) {
        return DecodeResult::Err(SskrFailure::MalformedShare(compat::format(
            "Reserved bits are set (0x{:x})", reserved)));
    }

    share.value.assign(payload.begin(), payload.end());
    return DecodeResult::Ok(std::move(share));
}

}
