#include "vaultline/crypto/credential_cipher.hpp"
#include "vaultline/crypto/xchacha20_poly1305.hpp"
#include "vaultline/crypto/sodium_interop.hpp"
#include "vaultline/crypto/sodium_secure_memory_handle.hpp"
#include "vaultline/core/constants.hpp"
#include "vaultline/debug/trace_logger.hpp"
#include <array>
#include <format>
#include <vector>

namespace vaultline::crypto {
    using utilities::PayloadCodec;

    namespace {
        Result<SecureMemoryHandle, CipherFailure> AcquireKey(std::span<const uint8_t> key) {
            if (key.size() != kCipherKeyBytes) {
                return Result<SecureMemoryHandle, CipherFailure>::Err(
                    CipherFailure::InvalidKeyLength(
                        std::format("Cipher key must be {} bytes, got {}", kCipherKeyBytes, key.size())));
            }
            auto init_result = SodiumInterop::Initialize();
            if (init_result.IsErr()) {
                return Result<SecureMemoryHandle, CipherFailure>::Err(
                    CipherFailure::FromSodiumFailure(init_result.UnwrapErr()));
            }
            auto handle_result = SecureMemoryHandle::Allocate(kCipherKeyBytes);
            if (handle_result.IsErr()) {
                return Result<SecureMemoryHandle, CipherFailure>::Err(
                    CipherFailure::FromSodiumFailure(handle_result.UnwrapErr()));
            }
            auto handle = std::move(handle_result).Unwrap();
            auto write_result = handle.Write(key);
            if (write_result.IsErr()) {
                return Result<SecureMemoryHandle, CipherFailure>::Err(
                    CipherFailure::FromSodiumFailure(write_result.UnwrapErr()));
            }
            return Result<SecureMemoryHandle, CipherFailure>::Ok(std::move(handle));
        }

        template<typename T>
        Result<T, CipherFailure> Flatten(Result<Result<T, CipherFailure>, SodiumFailure> nested) {
            if (nested.IsErr()) {
                return Result<T, CipherFailure>::Err(
                    CipherFailure::FromSodiumFailure(nested.UnwrapErr()));
            }
            return std::move(nested).Unwrap();
        }
    }

    Result<std::string, CipherFailure>
    CredentialCipher::Encrypt(const CredentialPayload &payload, std::span<const uint8_t> key) {
        auto key_result = AcquireKey(key);
        if (key_result.IsErr()) {
            debug::LogCipherRejected("encrypt", key_result.UnwrapErr().type);
            return Result<std::string, CipherFailure>::Err(std::move(key_result).UnwrapErr());
        }
        const SecureMemoryHandle key_handle = std::move(key_result).Unwrap();

        auto encode_result = PayloadCodec::Encode(payload);
        if (encode_result.IsErr()) {
            debug::LogCipherRejected("encrypt", encode_result.UnwrapErr().type);
            return Result<std::string, CipherFailure>::Err(std::move(encode_result).UnwrapErr());
        }
        std::vector<uint8_t> plaintext = std::move(encode_result).Unwrap();

        std::array<uint8_t, kCipherNonceBytes> nonce{};
        SodiumInterop::FillRandom(nonce);

        auto sealed = Flatten(key_handle.WithReadAccess([&](std::span<const uint8_t> key_bytes) {
            return XChaCha20Poly1305::Encrypt(key_bytes, nonce, plaintext);
        }));
        (void) SodiumInterop::SecureWipe(std::span<uint8_t>(plaintext));
        if (sealed.IsErr()) {
            debug::LogCipherRejected("encrypt", sealed.UnwrapErr().type);
            return Result<std::string, CipherFailure>::Err(std::move(sealed).UnwrapErr());
        }
        std::vector<uint8_t> ciphertext = std::move(sealed).Unwrap();

        std::vector<uint8_t> blob;
        blob.reserve(nonce.size() + ciphertext.size());
        blob.insert(blob.end(), nonce.begin(), nonce.end());
        blob.insert(blob.end(), ciphertext.begin(), ciphertext.end());
        std::string encoded = SodiumInterop::ToBase64(blob);

        debug::LogCipherOperation("encrypt", payload.size(), blob.size());
        (void) SodiumInterop::SecureWipe(std::span<uint8_t>(ciphertext));
        (void) SodiumInterop::SecureWipe(std::span<uint8_t>(blob));
        return Result<std::string, CipherFailure>::Ok(std::move(encoded));
    }

    Result<CredentialPayload, CipherFailure>
    CredentialCipher::Decrypt(std::string_view blob, std::span<const uint8_t> key) {
        auto key_result = AcquireKey(key);
        if (key_result.IsErr()) {
            debug::LogCipherRejected("decrypt", key_result.UnwrapErr().type);
            return Result<CredentialPayload, CipherFailure>::Err(std::move(key_result).UnwrapErr());
        }
        const SecureMemoryHandle key_handle = std::move(key_result).Unwrap();

        // Every 4 base64 characters decode to at most 3 bytes
        if (blob.size() / 4 * 3 > kMaxBlobBytes + 3) {
            debug::LogCipherRejected("decrypt", CipherFailureType::MalformedBlob);
            return Result<CredentialPayload, CipherFailure>::Err(
                CipherFailure::MalformedBlob(
                    std::format("{}: {} encoded characters", ErrorMessages::BLOB_TOO_LONG, blob.size())));
        }

        auto decoded_result = SodiumInterop::FromBase64(blob).MapErr([](SodiumFailure failure) {
            return CipherFailure::DecodingError(std::move(failure.message));
        });
        if (decoded_result.IsErr()) {
            debug::LogCipherRejected("decrypt", CipherFailureType::DecodingError);
            return Result<CredentialPayload, CipherFailure>::Err(std::move(decoded_result).UnwrapErr());
        }
        std::vector<uint8_t> raw = std::move(decoded_result).Unwrap();
        if (raw.size() < kMinimumBlobBytes) {
            debug::LogCipherRejected("decrypt", CipherFailureType::MalformedBlob);
            return Result<CredentialPayload, CipherFailure>::Err(
                CipherFailure::MalformedBlob(
                    std::format("{}: {} bytes (minimum {})",
                        ErrorMessages::BLOB_TOO_SHORT, raw.size(), kMinimumBlobBytes)));
        }

        if (raw.size() > kMaxBlobBytes) {
            debug::LogCipherRejected("decrypt", CipherFailureType::MalformedBlob);
            return Result<CredentialPayload, CipherFailure>::Err(
                CipherFailure::MalformedBlob(
                    std::format("{}: {} bytes (maximum {})",
                        ErrorMessages::BLOB_TOO_LONG, raw.size(), kMaxBlobBytes)));
        }

        const std::span<const uint8_t> raw_view(raw);
        const auto nonce = raw_view.first(kCipherNonceBytes);
        const auto sealed = raw_view.subspan(kCipherNonceBytes);

        auto opened = Flatten(key_handle.WithReadAccess([&](std::span<const uint8_t> key_bytes) {
            return XChaCha20Poly1305::Decrypt(key_bytes, nonce, sealed);
        }));
        if (opened.IsErr()) {
            debug::LogCipherRejected("decrypt", opened.UnwrapErr().type);
            return Result<CredentialPayload, CipherFailure>::Err(std::move(opened).UnwrapErr());
        }
        std::vector<uint8_t> plaintext = std::move(opened).Unwrap();

        auto payload_result = PayloadCodec::Decode(plaintext);
        (void) SodiumInterop::SecureWipe(std::span<uint8_t>(plaintext));
        if (payload_result.IsErr()) {
            debug::LogCipherRejected("decrypt", payload_result.UnwrapErr().type);
            return payload_result;
        }
        debug::LogCipherOperation("decrypt", payload_result.Unwrap().size(), raw.size());
        return payload_result;
    }

    void SodiumRandomSource::Fill(std::span<uint8_t> buffer) {
        SodiumInterop::FillRandom(buffer);
    }

    Result<std::string, CipherFailure> GenerateEncodedKey() {
        auto init_result = SodiumInterop::Initialize();
        if (init_result.IsErr()) {
            return Result<std::string, CipherFailure>::Err(
                CipherFailure::FromSodiumFailure(init_result.UnwrapErr()));
        }
        SodiumRandomSource source;
        return GenerateEncodedKey(source);
    }

    Result<std::string, CipherFailure> GenerateEncodedKey(interfaces::IRandomSource &random_source) {
        auto init_result = SodiumInterop::Initialize();
        if (init_result.IsErr()) {
            return Result<std::string, CipherFailure>::Err(
                CipherFailure::FromSodiumFailure(init_result.UnwrapErr()));
        }
        std::array<uint8_t, kCipherKeyBytes> key{};
        random_source.Fill(key);
        std::string encoded = SodiumInterop::ToBase64(key);
        (void) SodiumInterop::SecureWipe(std::span<uint8_t>(key));
        return Result<std::string, CipherFailure>::Ok(std::move(encoded));
    }
}
