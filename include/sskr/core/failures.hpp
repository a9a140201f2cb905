#pragma once
#include <string>
#include <string_view>
namespace sskr {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class SskrFailureType {
    InvalidParameters,
    InsufficientShares,
    DuplicateShare,
    InconsistentParameters,
    MixedShareSets,
    ChecksumMismatch,
    TruncatedShare,
    MalformedShare,
    RandomnessUnavailable,
    SecureMemory
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class SskrFailure {
public:
    SskrFailureType type;
    std::string message;
    SskrFailure(const SskrFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SskrFailure InvalidParameters(std::string msg) {
        return {SskrFailureType::InvalidParameters, std::move(msg)};
    }
    static SskrFailure InsufficientShares(std::string msg) {
        return {SskrFailureType::InsufficientShares, std::move(msg)};
    }
    static SskrFailure DuplicateShare(std::string msg) {
        return {SskrFailureType::DuplicateShare, std::move(msg)};
    }
    static SskrFailure InconsistentParameters(std::string msg) {
        return {SskrFailureType::InconsistentParameters, std::move(msg)};
    }
    static SskrFailure MixedShareSets(std::string msg) {
        return {SskrFailureType::MixedShareSets, std::move(msg)};
    }
    static SskrFailure ChecksumMismatch(std::string msg) {
        return {SskrFailureType::ChecksumMismatch, std::move(msg)};
    }
    static SskrFailure TruncatedShare(std::string msg) {
        return {SskrFailureType::TruncatedShare, std::move(msg)};
    }
    static SskrFailure MalformedShare(std::string msg) {
        return {SskrFailureType::MalformedShare, std::move(msg)};
    }
    static SskrFailure RandomnessUnavailable(std::string msg) {
        return {SskrFailureType::RandomnessUnavailable, std::move(msg)};
    }
    static SskrFailure SecureMemory(std::string msg) {
        return {SskrFailureType::SecureMemory, std::move(msg)};
    }
    static SskrFailure FromSodiumFailure(const SodiumFailure& sf) {
        return SecureMemory(sf.message);
    }
};
[[nodiscard]] constexpr std::string_view ToString(const SskrFailureType type) noexcept {
    switch (type) {
        case SskrFailureType::InvalidParameters: return "InvalidParameters";
        case SskrFailureType::InsufficientShares: return "InsufficientShares";
        case SskrFailureType::DuplicateShare: return "DuplicateShare";
        case SskrFailureType::InconsistentParameters: return "InconsistentParameters";
        case SskrFailureType::MixedShareSets: return "MixedShareSets";
        case SskrFailureType::ChecksumMismatch: return "ChecksumMismatch";
        case SskrFailureType::TruncatedShare: return "TruncatedShare";
        case SskrFailureType::MalformedShare: return "MalformedShare";
        case SskrFailureType::RandomnessUnavailable: return "RandomnessUnavailable";
        case SskrFailureType::SecureMemory: return "SecureMemory";
    }
    return "Unknown";
}
}
