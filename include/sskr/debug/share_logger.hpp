#pragma once

/**
 * @file share_logger.hpp
 * @brief Debug logging for split and recombine internals.
 *
 * SECURITY WARNING: This module prints group secrets and recovered secrets
 * to stdout. Only enable SSKR_DEBUG_SHARES to check share generation against
 * another SSKR implementation. NEVER enable in production builds.
 *
 * Enable via CMake: -DSSKR_DEBUG_SHARES=ON
 */

#include "sskr/models/recovery_stage.hpp"
#include "sskr/models/split_spec.hpp"

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>

namespace sskr::debug {

using models::RecoveryStage;

#ifdef SSKR_DEBUG_SHARES

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

#define SSKR_LOG_BYTES(operation, name, data) \
    do { \
        fprintf(stdout, "[SSKR-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            ::sskr::debug::ToHex(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define SSKR_LOG_BYTES_IDX(operation, name, index, data) \
    do { \
        fprintf(stdout, "[SSKR-DEBUG] %s %s[%u]: %s\n", \
            operation, \
            name, \
            static_cast<uint32_t>(index), \
            ::sskr::debug::ToHex(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define SSKR_LOG_VALUE(operation, name, value) \
    do { \
        fprintf(stdout, "[SSKR-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define SSKR_LOG_MSG(operation, message) \
    do { \
        fprintf(stdout, "[SSKR-DEBUG] %s %s\n", operation, message); \
        fflush(stdout); \
    } while(0)

#define SSKR_LOG_SECTION(section_name) \
    do { \
        fprintf(stdout, "[SSKR-DEBUG] ========== %s ==========\n", section_name); \
        fflush(stdout); \
    } while(0)

inline void LogSplitStart(
    uint16_t identifier,
    const models::SplitSpec& spec,
    size_t secret_length) {

    SSKR_LOG_SECTION("SPLIT");
    SSKR_LOG_VALUE("SPLIT", "identifier", identifier);
    SSKR_LOG_MSG("SPLIT", spec.ToString().c_str());
    SSKR_LOG_VALUE("SPLIT", "secret_length", secret_length);
}

inline void LogGroupSecret(uint8_t group_index, std::span<const uint8_t> group_secret) {
    SSKR_LOG_BYTES_IDX("SPLIT", "group_secret", group_index, group_secret);
}

inline void LogRecoveryStage(RecoveryStage stage) {
    SSKR_LOG_MSG("RECOVER", models::StageToString(stage));
}

inline void LogRecoveredGroup(uint8_t group_index, std::span<const uint8_t> group_secret) {
    SSKR_LOG_BYTES_IDX("RECOVER", "group_secret", group_index, group_secret);
}

inline void LogRecoveredSecret(std::span<const uint8_t> secret) {
    SSKR_LOG_BYTES("RECOVER", "master_secret", secret);
}

#else // !SSKR_DEBUG_SHARES

inline void LogSplitStart(uint16_t, const models::SplitSpec&, size_t) {}
inline void LogGroupSecret(uint8_t, std::span<const uint8_t>) {}
inline void LogRecoveryStage(RecoveryStage) {}
inline void LogRecoveredGroup(uint8_t, std::span<const uint8_t>) {}
inline void LogRecoveredSecret(std::span<const uint8_t>) {}

#endif // SSKR_DEBUG_SHARES

} // namespace sskr::debug
