#pragma once
#include "sskr/core/result.hpp"
#include "sskr/core/failures.hpp"
#include "sskr/configuration/sskr_config.hpp"
#include "sskr/interfaces/i_random_source.hpp"
#include "sskr/interfaces/i_recovery_observer.hpp"
#include "sskr/models/recovery_stage.hpp"
#include "sskr/models/share.hpp"
#include "sskr/models/split_spec.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace sskr {

using models::RecoveryStage;

/**
 * @brief Two-level secret splitting and recombination
 *
 * The secret is first split into one group secret per group (group
 * threshold of group count), then every group secret is split into member
 * shares (member threshold of member count). Recovery needs member_threshold
 * shares from each of at least group_threshold groups.
 *
 * Every call is self-contained: no state survives it, and intermediate
 * group secrets live in guarded memory that is zeroed on every exit path.
 * Randomness is drawn in a fixed order (identifier, group split, member
 * splits by group), so a deterministic source reproduces a split exactly.
 */
class Sskr {
public:
    /// Shares grouped by group index, members in member index order.
    [[nodiscard]] static Result<std::vector<std::vector<models::Share>>, SskrFailure> Generate(
        std::span<const uint8_t> secret,
        const models::SplitSpec& spec,
        interfaces::IRandomSource& random);

    /// Encoded shares, flattened group by group. Uses libsodium randomness.
    [[nodiscard]] static Result<std::vector<std::vector<uint8_t>>, SskrFailure> Split(
        std::span<const uint8_t> secret,
        const models::SplitSpec& spec);

    [[nodiscard]] static Result<std::vector<std::vector<uint8_t>>, SskrFailure> Split(
        std::span<const uint8_t> secret,
        const models::SplitSpec& spec,
        interfaces::IRandomSource& random);

    /**
     * @brief Recover the secret from decoded shares
     *
     * Shares may arrive in any order and may include identical duplicates
     * or shares from groups beyond the threshold. The lowest qualifying
     * group indexes are used. @p observer, when given, sees every stage
     * entered, starting with Collecting and ending in Verified or Failed.
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, SskrFailure> Combine(
        std::span<const models::Share> shares,
        interfaces::IRecoveryObserver* observer = nullptr);

    /// Decode with @p config, then Combine. Decoding runs in the Collecting stage.
    [[nodiscard]] static Result<std::vector<uint8_t>, SskrFailure> Recombine(
        std::span<const std::vector<uint8_t>> encoded_shares,
        configuration::SskrConfig config = configuration::SskrConfig::Default(),
        interfaces::IRecoveryObserver* observer = nullptr);

private:
    Sskr() = delete;
};

}
