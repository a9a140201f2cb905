#include "sskr/crypto/sodium_random_source.hpp"
#include "sskr/crypto/sodium_interop.hpp"
#include <sodium.h>
#include <string>

namespace sskr::crypto {

Result<Unit, SskrFailure> SodiumRandomSource::FillRandom(std::span<uint8_t> buffer) {
    if (auto init_result = SodiumInterop::Initialize(); init_result.IsErr()) {
        return Result<Unit, SskrFailure>::Err(
            SskrFailure::RandomnessUnavailable(
                std::string(ErrorMessages::RANDOM_SOURCE_UNAVAILABLE) + ": " +
                init_result.UnwrapErr().message));
    }
    if (!buffer.empty()) {
        randombytes_buf(buffer.data(), buffer.size());
    }
    return Result<Unit, SskrFailure>::Ok(unit);
}

}
