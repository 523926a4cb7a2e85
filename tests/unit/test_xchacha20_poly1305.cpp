#include <catch2/catch_test_macros.hpp>
#include "vaultline/crypto/xchacha20_poly1305.hpp"
#include "vaultline/crypto/sodium_interop.hpp"
#include "vaultline/core/constants.hpp"
using namespace vaultline;
using namespace vaultline::crypto;
TEST_CASE("XChaCha20-Poly1305 - Basic encryption and decryption", "[xchacha20][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Encrypt and decrypt round-trip") {
        std::vector<uint8_t> key(kCipherKeyBytes, 0xAA);
        std::vector<uint8_t> nonce(kCipherNonceBytes, 0xBB);
        std::vector<uint8_t> plaintext = {'H', 'e', 'l', 'l', 'o', ' ', 'W', 'o', 'r', 'l', 'd', '!'};
        auto encrypt_result = XChaCha20Poly1305::Encrypt(key, nonce, plaintext);
        REQUIRE(encrypt_result.IsOk());
        auto ciphertext_with_tag = encrypt_result.Unwrap();
        REQUIRE(ciphertext_with_tag.size() == plaintext.size() + kCipherTagBytes);
        auto decrypt_result = XChaCha20Poly1305::Decrypt(key, nonce, ciphertext_with_tag);
        REQUIRE(decrypt_result.IsOk());
        REQUIRE(decrypt_result.Unwrap() == plaintext);
    }
    SECTION("Empty plaintext yields a bare tag") {
        std::vector<uint8_t> key(kCipherKeyBytes, 0x11);
        std::vector<uint8_t> nonce(kCipherNonceBytes, 0x22);
        std::vector<uint8_t> plaintext;
        auto encrypt_result = XChaCha20Poly1305::Encrypt(key, nonce, plaintext);
        REQUIRE(encrypt_result.IsOk());
        auto ciphertext = encrypt_result.Unwrap();
        REQUIRE(ciphertext.size() == kCipherTagBytes);
        auto decrypt_result = XChaCha20Poly1305::Decrypt(key, nonce, ciphertext);
        REQUIRE(decrypt_result.IsOk());
        REQUIRE(decrypt_result.Unwrap().empty());
    }
    SECTION("Associated data is authenticated") {
        std::vector<uint8_t> key(kCipherKeyBytes, 0x33);
        std::vector<uint8_t> nonce(kCipherNonceBytes, 0x44);
        std::vector<uint8_t> plaintext(100, 0x55);
        std::vector<uint8_t> ad = {'c', 't', 'x'};
        std::vector<uint8_t> other_ad = {'c', 't', 'y'};
        auto ciphertext = XChaCha20Poly1305::Encrypt(key, nonce, plaintext, ad).Unwrap();
        REQUIRE(XChaCha20Poly1305::Decrypt(key, nonce, ciphertext, ad).IsOk());
        auto result = XChaCha20Poly1305::Decrypt(key, nonce, ciphertext, other_ad);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CipherFailureType::AuthenticationFailure);
    }
}
TEST_CASE("XChaCha20-Poly1305 - Parameter validation", "[xchacha20][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> nonce(kCipherNonceBytes, 0x01);
    std::vector<uint8_t> plaintext = {1, 2, 3};
    SECTION("Short key") {
        std::vector<uint8_t> key(kCipherKeyBytes - 1, 0x01);
        auto result = XChaCha20Poly1305::Encrypt(key, nonce, plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CipherFailureType::InvalidKeyLength);
    }
    SECTION("Wrong nonce size") {
        std::vector<uint8_t> key(kCipherKeyBytes, 0x01);
        std::vector<uint8_t> short_nonce(12, 0x01);
        auto result = XChaCha20Poly1305::Encrypt(key, short_nonce, plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CipherFailureType::MalformedBlob);
    }
    SECTION("Ciphertext shorter than tag") {
        std::vector<uint8_t> key(kCipherKeyBytes, 0x01);
        std::vector<uint8_t> ciphertext(kCipherTagBytes - 1, 0x00);
        auto result = XChaCha20Poly1305::Decrypt(key, nonce, ciphertext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CipherFailureType::MalformedBlob);
    }
}
