#pragma once

#include "vaultline/core/result.hpp"
#include "vaultline/core/failures.hpp"

#include <span>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace vaultline::crypto {

/**
 * @brief RAII owner of a sodium_malloc allocation
 *
 * Holds key material for the duration of a single cipher call. The memory is
 * guard-paged, locked in RAM and zeroed by sodium_free on destruction.
 * Move-only.
 *
 * Example:
 * @code
 * auto handle = SecureMemoryHandle::Allocate(kCipherKeyBytes);
 * if (handle.IsOk()) {
 *     auto key = std::move(handle).Unwrap();
 *     key.Write(caller_key);
 *     key.WithReadAccess([](std::span<const uint8_t> bytes) { ... });
 * }
 * @endcode
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /**
     * @brief Copy data into the secure region
     *
     * Bytes beyond data.size() are zeroed.
     */
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /**
     * @brief Run func over a read-only view of the secure region
     *
     * Avoids copying the secret out of guarded memory.
     */
    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }

        std::span<const uint8_t> secure_span(
            static_cast<const uint8_t*>(ptr_),
            size_);

        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
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

    void Release() noexcept;

    void* ptr_;
    size_t size_;
};

} // namespace vaultline::crypto
