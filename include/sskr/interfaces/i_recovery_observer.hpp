#pragma once
#include "sskr/models/recovery_stage.hpp"
namespace sskr::interfaces {
/// Notified on every recovery stage a Combine or Recombine call enters.
class IRecoveryObserver {
public:
    virtual ~IRecoveryObserver() = default;
    virtual void OnStageEntered(models::RecoveryStage stage) = 0;
};
}
