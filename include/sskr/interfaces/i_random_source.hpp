#pragma once
#include "sskr/core/result.hpp"
#include "sskr/core/failures.hpp"
#include <cstdint>
#include <span>
namespace sskr::interfaces {
/**
 * @brief Source of the randomness consumed by a split
 *
 * Implementations must either fill the whole buffer or fail with
 * SskrFailureType::RandomnessUnavailable. Zero-filling on failure is never
 * acceptable. One instance serves one call at a time.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;
    [[nodiscard]] virtual Result<Unit, SskrFailure> FillRandom(std::span<uint8_t> buffer) = 0;
};
}
