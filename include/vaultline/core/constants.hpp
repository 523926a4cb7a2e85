#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace vaultline {

inline constexpr size_t kUuidBytes = 16;
inline constexpr size_t kUuidHexDigits = 32;
inline constexpr size_t kCanonicalUuidLength = 36;
inline constexpr size_t kCanonicalHyphenOffsets[] = {8, 13, 18, 23};

inline constexpr size_t kCipherKeyBytes = 32;
inline constexpr size_t kCipherNonceBytes = 24;
inline constexpr size_t kCipherTagBytes = 16;
inline constexpr size_t kMinimumBlobBytes = kCipherNonceBytes + kCipherTagBytes;
inline constexpr size_t kMaxPayloadBytes = 10 * 1024 * 1024;
inline constexpr size_t kMaxBlobBytes = kMaxPayloadBytes + kMinimumBlobBytes;

inline constexpr size_t kSmallBufferThreshold = 1024;
inline constexpr size_t kMaxWipeBufferBytes = 1'000'000'000;

inline constexpr std::string_view kDefaultKeyEnvironmentVariable = "VAULTLINE_ENCRYPTION_KEY";

struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view INVALID_BASE64 = "Input is not valid base64";
    static constexpr std::string_view CANDIDATE_EMPTY = "Identifier candidate is empty";
    static constexpr std::string_view CANDIDATE_TOO_LONG = "Identifier candidate exceeds 36 characters";
    static constexpr std::string_view CANDIDATE_BAD_CHARACTER = "Identifier candidate contains a non-hex character";
    static constexpr std::string_view CANDIDATE_BAD_HYPHENS = "36-character identifier must use 8-4-4-4-12 hyphen placement";
    static constexpr std::string_view CANDIDATE_NO_DIGITS = "Identifier candidate contains no hex digits";
    static constexpr std::string_view CANDIDATE_TOO_MANY_DIGITS = "Identifier candidate exceeds 32 hex digits";
    static constexpr std::string_view AUTHENTICATION_FAILED = "Credential blob failed authentication";
    static constexpr std::string_view BLOB_TOO_SHORT = "Credential blob shorter than nonce and tag";
    static constexpr std::string_view BLOB_TOO_LONG = "Credential blob exceeds the maximum payload size";
};

}
