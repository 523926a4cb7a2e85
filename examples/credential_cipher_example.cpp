/**
 * @file credential_cipher_example.cpp
 * @brief Provisions a cipher key and round-trips a credential payload
 *
 * Prints a fresh base64 key suitable for VAULTLINE_ENCRYPTION_KEY, then
 * encrypts and decrypts a sample payload with it.
 */

#include "vaultline/crypto/credential_cipher.hpp"
#include "vaultline/crypto/sodium_interop.hpp"

#include <iostream>

using namespace vaultline;
using namespace vaultline::crypto;

int main() {
    std::cout << "=== vaultline - Credential Cipher Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Generating a new cipher key..." << std::endl;
    auto key_result = GenerateEncodedKey();
    if (key_result.IsErr()) {
        std::cerr << "Failed to generate key: "
                  << key_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::string encoded_key = std::move(key_result).Unwrap();
    std::cout << "   export VAULTLINE_ENCRYPTION_KEY=" << encoded_key << std::endl;
    std::cout << std::endl;

    auto decoded = SodiumInterop::FromBase64(encoded_key);
    SodiumInterop::SecureWipe(encoded_key);
    if (decoded.IsErr()) {
        std::cerr << "Failed to decode key: " << decoded.UnwrapErr().message << std::endl;
        return 1;
    }
    std::vector<uint8_t> key = std::move(decoded).Unwrap();

    std::cout << "2. Encrypting a credential payload..." << std::endl;
    const CredentialPayload payload{
        {"username", "a@b.com"},
        {"password", "secret123"},
    };
    auto blob_result = CredentialCipher::Encrypt(payload, key);
    if (blob_result.IsErr()) {
        std::cerr << "Encryption failed: " << blob_result.UnwrapErr().message << std::endl;
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(key));
        return 1;
    }
    const std::string blob = std::move(blob_result).Unwrap();
    std::cout << "   Blob: " << blob << std::endl;
    std::cout << std::endl;

    std::cout << "3. Decrypting..." << std::endl;
    auto payload_result = CredentialCipher::Decrypt(blob, key);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(key));
    if (payload_result.IsErr()) {
        std::cerr << "Decryption failed: " << payload_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   Recovered " << payload_result.Unwrap().size() << " entries, "
              << (payload_result.Unwrap() == payload ? "matching" : "NOT matching")
              << " the original" << std::endl;
    return 0;
}
