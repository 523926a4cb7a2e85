#pragma once

#include "vaultline/core/result.hpp"
#include "vaultline/core/failures.hpp"
#include "vaultline/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vaultline::crypto {

class SecureMemoryHandle;

/**
 * @brief Interop layer for libsodium
 *
 * Wraps initialization, wiping, randomness, base64 and guarded allocation.
 * Every entry point reports failures through Result.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Must succeed before any other call.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Overwrite a buffer with zeros in a way the compiler cannot elide
     *
     * Small buffers go through a volatile loop, large ones through sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /// Zeroes a string in place with sodium_memzero; usable before Initialize().
    static void SecureWipe(std::string& text) noexcept;

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static void FillRandom(std::span<uint8_t> buffer);

    // ========================================================================
    // Base64 (standard alphabet, padded)
    // ========================================================================

    static std::string ToBase64(std::span<const uint8_t> data);

    /**
     * @brief Decode standard base64 into a byte vector
     *
     * Rejects any character outside the alphabet, including whitespace.
     */
    static Result<std::vector<uint8_t>, SodiumFailure> FromBase64(std::string_view encoded);

    /**
     * @brief Decode base64 straight into guarded memory
     *
     * The intermediate buffer is wiped before returning; intended for key material.
     */
    static Result<SecureMemoryHandle, SodiumFailure> FromBase64Secure(std::string_view encoded);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guard-paged, mlock'ed memory through sodium_malloc
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    /// Zeroes and releases memory returned by AllocateSecure.
    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace vaultline::crypto
