#pragma once

#include "sskr/core/result.hpp"
#include "sskr/core/failures.hpp"

#include <span>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace sskr::crypto {

/**
 * @brief RAII wrapper for libsodium guarded memory
 *
 * Holds one secret-length buffer (a group secret, a digest point, the
 * recovered master secret) for the duration of a split or recombine call.
 * The memory is allocated with sodium_malloc, so it sits between guard
 * pages, is locked in RAM and is zeroed when freed.
 *
 * Move-only. The destructor always frees.
 *
 * Example:
 * @code
 * auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
 * handle.Write(group_secret);
 * auto view = handle.View();   // valid while handle is alive and not moved
 * @endcode
 */
class SecureMemoryHandle {
public:
    /**
     * @brief Allocate secure memory
     *
     * Requires SodiumInterop::Initialize() to have succeeded.
     */
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /**
     * @brief Copy data into the handle
     *
     * Bytes past the end of @p data are zeroed.
     */
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /**
     * @brief Copy the first @p size bytes out into a new vector
     */
    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes(size_t size) const;

    /// Read-only view of the whole allocation; empty if the handle is invalid.
    [[nodiscard]] std::span<const uint8_t> View() const noexcept {
        return {static_cast<const uint8_t*>(ptr_), size_};
    }

    /// Writable view of the whole allocation; empty if the handle is invalid.
    [[nodiscard]] std::span<uint8_t> MutableView() noexcept {
        return {static_cast<uint8_t*>(ptr_), size_};
    }

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void* ptr_;
    size_t size_;
};

} // namespace sskr::crypto
