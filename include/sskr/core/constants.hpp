#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace sskr {
struct Constants {
    static constexpr size_t MIN_SECRET_LENGTH = 16;
    static constexpr size_t MAX_SECRET_LENGTH = 32;
    static constexpr size_t DIGEST_LENGTH = 4;
    static constexpr size_t IDENTIFIER_SIZE = 2;
    static constexpr size_t METADATA_SIZE = 5;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
};
struct ShamirConstants {
    static constexpr uint8_t MAX_SHARE_COUNT = 16;
    static constexpr uint8_t SECRET_INDEX = 255;
    static constexpr uint8_t DIGEST_INDEX = 254;
};
struct GroupConstants {
    static constexpr uint8_t MAX_GROUP_COUNT = 16;
    static constexpr uint8_t MAX_MEMBER_COUNT = 16;
    static constexpr uint8_t NIBBLE_MASK = 0x0F;
    static constexpr uint8_t NIBBLE_SHIFT = 4;
};
struct Gf256Constants {
    static constexpr uint16_t REDUCING_POLYNOMIAL = 0x11B;
    static constexpr uint8_t GENERATOR = 0x03;
    static constexpr size_t MULTIPLICATIVE_ORDER = 255;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view RANDOM_SOURCE_UNAVAILABLE = "Random source unavailable";
    static constexpr std::string_view DIGEST_VERIFICATION_FAILED = "Share digest verification failed";
    static constexpr std::string_view NO_SHARES = "No shares provided";
};
}
