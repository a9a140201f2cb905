#pragma once
#include <cstdint>

namespace sskr::models {

/// Recombine progress. Only Verified ever releases a secret.
enum class RecoveryStage : uint8_t {
    Collecting,
    GroupsQualifying,
    OuterReady,
    Verified,
    Failed
};

constexpr const char* StageToString(const RecoveryStage stage) noexcept {
    switch (stage) {
        case RecoveryStage::Collecting: return "COLLECTING";
        case RecoveryStage::GroupsQualifying: return "GROUPS_QUALIFYING";
        case RecoveryStage::OuterReady: return "OUTER_READY";
        case RecoveryStage::Verified: return "VERIFIED";
        case RecoveryStage::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

}
