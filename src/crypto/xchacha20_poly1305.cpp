#include "vaultline/crypto/xchacha20_poly1305.hpp"
#include "vaultline/crypto/sodium_interop.hpp"
#include "vaultline/core/constants.hpp"
#include <sodium.h>
#include <format>
namespace vaultline::crypto {
namespace {
    static_assert(crypto_aead_xchacha20poly1305_ietf_KEYBYTES == kCipherKeyBytes);
    static_assert(crypto_aead_xchacha20poly1305_ietf_NPUBBYTES == kCipherNonceBytes);
    static_assert(crypto_aead_xchacha20poly1305_ietf_ABYTES == kCipherTagBytes);

    Result<Unit, CipherFailure> ValidateParameters(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != kCipherKeyBytes) {
            return Result<Unit, CipherFailure>::Err(
                CipherFailure::InvalidKeyLength(
                    std::format("XChaCha20-Poly1305 key must be {} bytes, got {}",
                        kCipherKeyBytes, key.size())));
        }
        if (nonce.size() != kCipherNonceBytes) {
            return Result<Unit, CipherFailure>::Err(
                CipherFailure::MalformedBlob(
                    std::format("XChaCha20-Poly1305 nonce must be {} bytes, got {}",
                        kCipherNonceBytes, nonce.size())));
        }
        if (!SodiumInterop::IsInitialized()) {
            return Result<Unit, CipherFailure>::Err(
                CipherFailure::CryptoUnavailable(std::string(ErrorMessages::NOT_INITIALIZED)));
        }
        return Result<Unit, CipherFailure>::Ok(unit);
    }
}
Result<std::vector<uint8_t>, CipherFailure>
XChaCha20Poly1305::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    auto validation = ValidateParameters(key, nonce);
    if (validation.IsErr()) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(
            std::move(validation).UnwrapErr());
    }
    if (plaintext.size() > kMaxPayloadBytes) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(
            CipherFailure::MalformedPayload(
                std::format("Plaintext of {} bytes exceeds maximum {}",
                    plaintext.size(), kMaxPayloadBytes)));
    }
    std::vector<uint8_t> output(plaintext.size() + kCipherTagBytes);
    unsigned long long output_len = 0;
    if (crypto_aead_xchacha20poly1305_ietf_encrypt(
            output.data(), &output_len,
            plaintext.data(), plaintext.size(),
            associated_data.empty() ? nullptr : associated_data.data(),
            associated_data.size(),
            nullptr,
            nonce.data(), key.data()) != 0) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return Result<std::vector<uint8_t>, CipherFailure>::Err(
            CipherFailure::CryptoUnavailable("XChaCha20-Poly1305 encryption failed"));
    }
    output.resize(static_cast<size_t>(output_len));
    return Result<std::vector<uint8_t>, CipherFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, CipherFailure>
XChaCha20Poly1305::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    auto validation = ValidateParameters(key, nonce);
    if (validation.IsErr()) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(
            std::move(validation).UnwrapErr());
    }
    if (ciphertext_with_tag.size() < kCipherTagBytes) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(
            CipherFailure::MalformedBlob(
                std::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                    ciphertext_with_tag.size(), kCipherTagBytes)));
    }
    std::vector<uint8_t> output(ciphertext_with_tag.size() - kCipherTagBytes);
    unsigned long long output_len = 0;
    if (crypto_aead_xchacha20poly1305_ietf_decrypt(
            output.data(), &output_len,
            nullptr,
            ciphertext_with_tag.data(), ciphertext_with_tag.size(),
            associated_data.empty() ? nullptr : associated_data.data(),
            associated_data.size(),
            nonce.data(), key.data()) != 0) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return Result<std::vector<uint8_t>, CipherFailure>::Err(
            CipherFailure::AuthenticationFailure(std::string(ErrorMessages::AUTHENTICATION_FAILED)));
    }
    output.resize(static_cast<size_t>(output_len));
    return Result<std::vector<uint8_t>, CipherFailure>::Ok(std::move(output));
}
}
