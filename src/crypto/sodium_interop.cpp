#include "vaultline/crypto/sodium_interop.hpp"
#include "vaultline/crypto/sodium_secure_memory_handle.hpp"

#include <format>

namespace vaultline::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > kMaxWipeBufferBytes) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                std::format("Buffer size {} exceeds maximum {}",
                    buffer.size(), kMaxWipeBufferBytes)));
    }

    if (buffer.size() <= kSmallBufferThreshold) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

void SodiumInterop::SecureWipe(std::string& text) noexcept {
    sodium_memzero(text.data(), text.size());
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

void SodiumInterop::FillRandom(std::span<uint8_t> buffer) {
    randombytes_buf(buffer.data(), buffer.size());
}

// ============================================================================
// Base64
// ============================================================================

std::string SodiumInterop::ToBase64(std::span<const uint8_t> data) {
    const size_t encoded_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string encoded(encoded_len, '\0');
    sodium_bin2base64(encoded.data(), encoded_len, data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);
    // encoded_len counts the terminating NUL written by libsodium
    encoded.resize(encoded_len - 1);
    return encoded;
}

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::FromBase64(std::string_view encoded) {
    std::vector<uint8_t> decoded(encoded.size() / 4 * 3 + 3);
    size_t decoded_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(decoded.data(), decoded.size(), encoded.data(), encoded.size(),
                          nullptr, &decoded_len, &end, sodium_base64_VARIANT_ORIGINAL) != 0
        || end != encoded.data() + encoded.size()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::DecodingFailed(std::string(ErrorMessages::INVALID_BASE64)));
    }
    decoded.resize(decoded_len);
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(decoded));
}

Result<SecureMemoryHandle, SodiumFailure> SodiumInterop::FromBase64Secure(std::string_view encoded) {
    auto decoded_result = FromBase64(encoded);
    if (decoded_result.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            std::move(decoded_result).UnwrapErr());
    }
    auto decoded = std::move(decoded_result).Unwrap();
    if (decoded.empty()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::DecodingFailed("Decoded secret is empty"));
    }

    auto handle_result = SecureMemoryHandle::Allocate(decoded.size());
    if (handle_result.IsErr()) {
        (void)SecureWipe(std::span<uint8_t>(decoded));
        return handle_result;
    }
    auto handle = std::move(handle_result).Unwrap();
    auto write_result = handle.Write(decoded);
    (void)SecureWipe(std::span<uint8_t>(decoded));
    if (write_result.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            std::move(write_result).UnwrapErr());
    }
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(std::move(handle));
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace vaultline::crypto
