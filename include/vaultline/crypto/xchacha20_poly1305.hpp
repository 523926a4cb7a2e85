#pragma once
#include "vaultline/core/result.hpp"
#include "vaultline/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace vaultline::crypto {

/**
 * XChaCha20-Poly1305 (IETF) authenticated encryption.
 *
 * Stateless primitive over libsodium. The 24-byte nonce is large enough that
 * random generation per call is safe; the caller still owns uniqueness.
 *
 * Output layout of Encrypt is ciphertext ‖ tag (16 bytes). Decrypt reports
 * every verification failure as AuthenticationFailure and never returns
 * partial plaintext.
 */
class XChaCha20Poly1305 {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, CipherFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, CipherFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    XChaCha20Poly1305() = delete;
};
}
