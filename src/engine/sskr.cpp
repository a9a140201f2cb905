#include "sskr/engine/sskr.hpp"
#include "sskr/codec/share_codec.hpp"
#include "sskr/crypto/shamir_secret_sharing.hpp"
#include "sskr/crypto/sodium_interop.hpp"
#include "sskr/crypto/sodium_random_source.hpp"
#include "sskr/core/constants.hpp"
#include "sskr/core/format.hpp"
#include "sskr/debug/share_logger.hpp"
#include <array>
#include <map>
#include <string>

namespace sskr {

using crypto::SecureMemoryHandle;
using crypto::ShamirSecretSharing;
using crypto::ShamirShare;
using crypto::SodiumInterop;

namespace {

using CombineResult = Result<std::vector<uint8_t>, SskrFailure>;

struct GroupShares {
    uint8_t member_threshold = 0;
    std::map<uint8_t, std::span<const uint8_t>> members;
};

/// Logs each stage and forwards it to the caller's observer, if any.
class StageReporter {
public:
    explicit StageReporter(interfaces::IRecoveryObserver* observer) noexcept
        : observer_(observer) {}

    void Enter(const RecoveryStage stage) const {
        debug::LogRecoveryStage(stage);
        if (observer_ != nullptr) {
            observer_->OnStageEntered(stage);
        }
    }

    [[nodiscard]] CombineResult Fail(SskrFailure failure) const {
        Enter(RecoveryStage::Failed);
        return CombineResult::Err(std::move(failure));
    }

private:
    interfaces::IRecoveryObserver* observer_;
};

Result<uint16_t, SskrFailure> DrawIdentifier(interfaces::IRandomSource& random) {
    std::array<uint8_t, Constants::IDENTIFIER_SIZE> bytes{};
    if (auto fill_result = random.FillRandom(bytes); fill_result.IsErr()) {
        return Result<uint16_t, SskrFailure>::Err(std::move(fill_result).UnwrapErr());
    }
    return Result<uint16_t, SskrFailure>::Ok(
        static_cast<uint16_t>((bytes[0] << 8) | bytes[1]));
}

Result<Unit, SskrFailure> CheckShareFields(const models::Share& share) {
    if (share.group_count == 0 || share.group_count > GroupConstants::MAX_GROUP_COUNT ||
        share.group_threshold == 0 || share.group_threshold > share.group_count ||
        share.group_index >= share.group_count ||
        share.member_threshold == 0 || share.member_threshold > GroupConstants::MAX_MEMBER_COUNT ||
        share.member_index >= GroupConstants::MAX_MEMBER_COUNT) {
        return Result<Unit, SskrFailure>::Err(SskrFailure::MalformedShare(compat::format(
            "Share metadata out of range (group {}/{} of {}, member {} threshold {})",
            share.group_index, share.group_threshold, share.group_count,
            share.member_index, share.member_threshold)));
    }
    return Result<Unit, SskrFailure>::Ok(unit);
}

std::string JoinGroupNumbers(const std::vector<uint8_t>& group_indexes) {
    std::string joined;
    for (const auto index : group_indexes) {
        if (!joined.empty()) {
            joined += " and ";
        }
        joined += std::to_string(index + 1);
    }
    return joined;
}

/// Everything after the Collecting stage has been entered.
CombineResult CombineCollected(
    std::span<const models::Share> shares,
    const StageReporter& stages) {
    if (shares.empty()) {
        return stages.Fail(SskrFailure::InsufficientShares(std::string(ErrorMessages::NO_SHARES)));
    }
    if (auto init_result = SodiumInterop::Initialize(); init_result.IsErr()) {
        return stages.Fail(SskrFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }

    const auto& first = shares.front();
    for (const auto& share : shares) {
        if (auto field_result = CheckShareFields(share); field_result.IsErr()) {
            return stages.Fail(std::move(field_result).UnwrapErr());
        }
        if (share.identifier != first.identifier) {
            return stages.Fail(SskrFailure::MixedShareSets(compat::format(
                "Shares carry different identifiers ({:04x} and {:04x})",
                first.identifier, share.identifier)));
        }
    }
    for (const auto& share : shares) {
        if (share.group_threshold != first.group_threshold ||
            share.group_count != first.group_count) {
            return stages.Fail(SskrFailure::InconsistentParameters(
                "Mismatched group threshold or count, shares don't go together"));
        }
        if (share.value.size() != first.value.size()) {
            return stages.Fail(SskrFailure::InconsistentParameters(compat::format(
                "Share values differ in length ({} vs {})",
                share.value.size(), first.value.size())));
        }
    }

    std::map<uint8_t, GroupShares> groups;
    for (const auto& share : shares) {
        auto [group_it, created] = groups.try_emplace(share.group_index);
        GroupShares& group = group_it->second;
        if (created) {
            group.member_threshold = share.member_threshold;
        } else if (group.member_threshold != share.member_threshold) {
            return stages.Fail(SskrFailure::InconsistentParameters(compat::format(
                "Mismatched share member thresholds in group {}, shares don't go together",
                share.group_index + 1)));
        }

        auto [member_it, inserted] = group.members.emplace(share.member_index, share.value);
        if (!inserted) {
            auto same = SodiumInterop::ConstantTimeEquals(member_it->second, share.value);
            if (same.IsErr()) {
                return stages.Fail(SskrFailure::FromSodiumFailure(same.UnwrapErr()));
            }
            if (!same.Unwrap()) {
                return stages.Fail(SskrFailure::DuplicateShare(compat::format(
                    "Member {} of group {} appears with different values",
                    share.member_index + 1, share.group_index + 1)));
            }
        }
    }

    std::vector<uint8_t> qualifying;
    for (const auto& [group_index, group] : groups) {
        if (group.members.size() >= group.member_threshold) {
            qualifying.push_back(group_index);
        }
    }
    if (qualifying.size() < first.group_threshold) {
        return stages.Fail(SskrFailure::InsufficientShares(compat::format(
            "Not enough groups, need to satisfy at least {} but only {} are satisfied ({})",
            first.group_threshold, qualifying.size(), JoinGroupNumbers(qualifying))));
    }
    stages.Enter(RecoveryStage::GroupsQualifying);

    std::vector<SecureMemoryHandle> group_secrets;
    group_secrets.reserve(first.group_threshold);
    for (size_t i = 0; i < first.group_threshold; ++i) {
        const GroupShares& group = groups.at(qualifying[i]);
        std::vector<ShamirShare> member_points;
        member_points.reserve(group.members.size());
        for (const auto& [member_index, value] : group.members) {
            member_points.push_back(ShamirShare{member_index, value});
        }

        auto recover_result = ShamirSecretSharing::Recover(group.member_threshold, member_points);
        if (recover_result.IsErr()) {
            return stages.Fail(std::move(recover_result).UnwrapErr());
        }
        group_secrets.push_back(std::move(recover_result).Unwrap());
        debug::LogRecoveredGroup(qualifying[i], group_secrets.back().View());
    }

    std::vector<ShamirShare> group_points;
    group_points.reserve(group_secrets.size());
    for (size_t i = 0; i < group_secrets.size(); ++i) {
        group_points.push_back(ShamirShare{qualifying[i], group_secrets[i].View()});
    }
    stages.Enter(RecoveryStage::OuterReady);

    auto master_result = ShamirSecretSharing::Recover(first.group_threshold, group_points);
    if (master_result.IsErr()) {
        return stages.Fail(std::move(master_result).UnwrapErr());
    }
    const SecureMemoryHandle master = std::move(master_result).Unwrap();

    auto read_result = master.ReadBytes(master.Size());
    if (read_result.IsErr()) {
        return stages.Fail(SskrFailure::FromSodiumFailure(read_result.UnwrapErr()));
    }
    stages.Enter(RecoveryStage::Verified);
    debug::LogRecoveredSecret(master.View());
    return CombineResult::Ok(std::move(read_result).Unwrap());
}

}

Result<std::vector<std::vector<models::Share>>, SskrFailure> Sskr::Generate(
    std::span<const uint8_t> secret,
    const models::SplitSpec& spec,
    interfaces::IRandomSource& random) {
    using GenerateResult = Result<std::vector<std::vector<models::Share>>, SskrFailure>;

    if (auto length_result = ShamirSecretSharing::ValidateSecretLength(secret.size());
        length_result.IsErr()) {
        return GenerateResult::Err(std::move(length_result).UnwrapErr());
    }

    auto identifier_result = DrawIdentifier(random);
    if (identifier_result.IsErr()) {
        return GenerateResult::Err(std::move(identifier_result).UnwrapErr());
    }
    const uint16_t identifier = identifier_result.Unwrap();
    debug::LogSplitStart(identifier, spec, secret.size());

    auto group_result = ShamirSecretSharing::Split(
        spec.GetGroupThreshold(), spec.GetGroupCount(), secret, random);
    if (group_result.IsErr()) {
        return GenerateResult::Err(std::move(group_result).UnwrapErr());
    }
    const std::vector<SecureMemoryHandle> group_secrets = std::move(group_result).Unwrap();

    const auto groups = spec.GetGroups();
    std::vector<std::vector<models::Share>> result;
    result.reserve(groups.size());
    for (uint8_t group_index = 0; group_index < groups.size(); ++group_index) {
        const auto& group = groups[group_index];
        debug::LogGroupSecret(group_index, group_secrets[group_index].View());

        auto member_result = ShamirSecretSharing::Split(
            group.GetMemberThreshold(), group.GetMemberCount(),
            group_secrets[group_index].View(), random);
        if (member_result.IsErr()) {
            return GenerateResult::Err(std::move(member_result).UnwrapErr());
        }
        const std::vector<SecureMemoryHandle> members = std::move(member_result).Unwrap();

        std::vector<models::Share> group_shares;
        group_shares.reserve(members.size());
        for (uint8_t member_index = 0; member_index < members.size(); ++member_index) {
            auto value_result = members[member_index].ReadBytes(secret.size());
            if (value_result.IsErr()) {
                return GenerateResult::Err(
                    SskrFailure::FromSodiumFailure(value_result.UnwrapErr()));
            }
            group_shares.push_back(models::Share{
                .identifier = identifier,
                .group_threshold = spec.GetGroupThreshold(),
                .group_count = spec.GetGroupCount(),
                .group_index = group_index,
                .member_threshold = group.GetMemberThreshold(),
                .member_index = member_index,
                .value = std::move(value_result).Unwrap()
            });
        }
        result.push_back(std::move(group_shares));
    }

    return GenerateResult::Ok(std::move(result));
}

Result<std::vector<std::vector<uint8_t>>, SskrFailure> Sskr::Split(
    std::span<const uint8_t> secret,
    const models::SplitSpec& spec) {
    crypto::SodiumRandomSource random;
    return Split(secret, spec, random);
}

Result<std::vector<std::vector<uint8_t>>, SskrFailure> Sskr::Split(
    std::span<const uint8_t> secret,
    const models::SplitSpec& spec,
    interfaces::IRandomSource& random) {
    using SplitResult = Result<std::vector<std::vector<uint8_t>>, SskrFailure>;

    auto generate_result = Generate(secret, spec, random);
    if (generate_result.IsErr()) {
        return SplitResult::Err(std::move(generate_result).UnwrapErr());
    }
    const auto groups = std::move(generate_result).Unwrap();

    std::vector<std::vector<uint8_t>> encoded;
    encoded.reserve(spec.GetShareCount());
    for (const auto& group : groups) {
        for (const auto& share : group) {
            auto encode_result = codec::ShareCodec::Encode(share);
            if (encode_result.IsErr()) {
                return SplitResult::Err(std::move(encode_result).UnwrapErr());
            }
            encoded.push_back(std::move(encode_result).Unwrap());
        }
    }
    return SplitResult::Ok(std::move(encoded));
}

Result<std::vector<uint8_t>, SskrFailure> Sskr::Combine(
    std::span<const models::Share> shares,
    interfaces::IRecoveryObserver* observer) {
    const StageReporter stages(observer);
    stages.Enter(RecoveryStage::Collecting);
    return CombineCollected(shares, stages);
}

Result<std::vector<uint8_t>, SskrFailure> Sskr::Recombine(
    std::span<const std::vector<uint8_t>> encoded_shares,
    const configuration::SskrConfig config,
    interfaces::IRecoveryObserver* observer) {
    const StageReporter stages(observer);
    stages.Enter(RecoveryStage::Collecting);

    std::vector<models::Share> shares;
    shares.reserve(encoded_shares.size());
    for (const auto& encoded : encoded_shares) {
        auto decode_result = codec::ShareCodec::Decode(encoded, config);
        if (decode_result.IsErr()) {
            return stages.Fail(std::move(decode_result).UnwrapErr());
        }
        shares.push_back(std::move(decode_result).Unwrap());
    }
    return CombineCollected(shares, stages);
}

}
