#pragma once
#include "sskr/interfaces/i_recovery_observer.hpp"
#include <vector>

namespace sskr::test_helpers {

/// Keeps every stage it is told about, in order.
class RecordingRecoveryObserver : public interfaces::IRecoveryObserver {
public:
    void OnStageEntered(const models::RecoveryStage stage) override {
        stages_.push_back(stage);
    }

    [[nodiscard]] const std::vector<models::RecoveryStage>& Stages() const noexcept {
        return stages_;
    }

private:
    std::vector<models::RecoveryStage> stages_;
};

}
