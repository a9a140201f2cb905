#pragma once
#include <cstdint>
#include <vector>

namespace sskr::models {

/**
 * @brief One member share of a two-level split
 *
 * Indexes are zero-based. Thresholds and counts are the real values
 * (1..16); the wire format stores them minus one.
 */
struct Share {
    uint16_t identifier = 0;
    uint8_t group_threshold = 0;
    uint8_t group_count = 0;
    uint8_t group_index = 0;
    uint8_t member_threshold = 0;
    uint8_t member_index = 0;
    std::vector<uint8_t> value;
};

}
