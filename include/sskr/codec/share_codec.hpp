#pragma once
#include "sskr/core/result.hpp"
#include "sskr/core/failures.hpp"
#include "sskr/core/constants.hpp"
#include "sskr/configuration/sskr_config.hpp"
#include "sskr/models/share.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sskr::codec {

/**
 * @brief Binary share format
 *
 *     byte 0-1  identifier, big-endian
 *     byte 2    (group_threshold - 1) << 4 | (group_count - 1)
 *     byte 3    group_index << 4 | (member_threshold - 1)
 *     byte 4    reserved << 4 | member_index
 *     byte 5..  value
 */
class ShareCodec {
public:
    static constexpr size_t METADATA_SIZE = Constants::METADATA_SIZE;

    [[nodiscard]] static Result<std::vector<uint8_t>, SskrFailure> Encode(
        const models::Share& share);

    [[nodiscard]] static Result<models::Share, SskrFailure> Decode(
        std::span<const uint8_t> bytes,
        configuration::SskrConfig config = configuration::SskrConfig::Default());

    [[nodiscard]] static constexpr size_t EncodedLength(const size_t secret_length) noexcept {
        return METADATA_SIZE + secret_length;
    }

private:
    ShareCodec() = delete;
};

}
