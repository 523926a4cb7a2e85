#pragma once
#include "vaultline/core/result.hpp"
#include "vaultline/core/failures.hpp"
#include "vaultline/interfaces/i_random_source.hpp"
#include "vaultline/utilities/payload_codec.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
namespace vaultline::crypto {

/**
 * @brief At-rest encryption of credential payloads
 *
 * Blob format: base64(nonce[24] ‖ ciphertext ‖ tag[16]) using
 * XChaCha20-Poly1305-IETF with no associated data. There is no version byte.
 *
 * Stateless. The key is copied into guarded memory for the duration of the
 * call only; serialized plaintext is wiped before return.
 */
class CredentialCipher {
public:
    [[nodiscard]] static Result<std::string, CipherFailure>
    Encrypt(const CredentialPayload& payload, std::span<const uint8_t> key);

    /**
     * @brief Recover a payload from a blob
     *
     * A wrong key and a tampered blob both yield AuthenticationFailure.
     */
    [[nodiscard]] static Result<CredentialPayload, CipherFailure>
    Decrypt(std::string_view blob, std::span<const uint8_t> key);
private:
    CredentialCipher() = delete;
};

/// Libsodium CSPRNG as an IRandomSource.
class SodiumRandomSource final : public interfaces::IRandomSource {
public:
    void Fill(std::span<uint8_t> buffer) override;
};

/// 32 random bytes, base64-encoded, for provisioning a new cipher key.
[[nodiscard]] Result<std::string, CipherFailure> GenerateEncodedKey();

[[nodiscard]] Result<std::string, CipherFailure>
GenerateEncodedKey(interfaces::IRandomSource& random_source);

}
