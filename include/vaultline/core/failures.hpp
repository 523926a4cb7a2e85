#pragma once
#include <string>
#include <string_view>
namespace vaultline {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooLarge,
    AllocationFailed,
    BufferTooSmall,
    InvalidOperation,
    DecodingFailed
};
enum class ResolverFailureType {
    InvalidCandidate,
    UnsupportedStorageEncoding,
    StorageIntegrityViolation,
    StorageFailure
};
enum class CipherFailureType {
    InvalidKeyLength,
    DecodingError,
    MalformedBlob,
    AuthenticationFailure,
    MalformedPayload,
    CryptoUnavailable,
    KeyUnavailable
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
    static SodiumFailure DecodingFailed(std::string msg) {
        return {SodiumFailureType::DecodingFailed, std::move(msg)};
    }
};
class ResolverFailure {
public:
    ResolverFailureType type;
    std::string message;
    ResolverFailure(const ResolverFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ResolverFailure InvalidCandidate(std::string msg) {
        return {ResolverFailureType::InvalidCandidate, std::move(msg)};
    }
    static ResolverFailure UnsupportedStorageEncoding(std::string msg) {
        return {ResolverFailureType::UnsupportedStorageEncoding, std::move(msg)};
    }
    static ResolverFailure StorageIntegrityViolation(std::string msg) {
        return {ResolverFailureType::StorageIntegrityViolation, std::move(msg)};
    }
    static ResolverFailure StorageFailure(std::string msg) {
        return {ResolverFailureType::StorageFailure, std::move(msg)};
    }
};
class CipherFailure {
public:
    CipherFailureType type;
    std::string message;
    CipherFailure(const CipherFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static CipherFailure InvalidKeyLength(std::string msg) {
        return {CipherFailureType::InvalidKeyLength, std::move(msg)};
    }
    static CipherFailure DecodingError(std::string msg) {
        return {CipherFailureType::DecodingError, std::move(msg)};
    }
    static CipherFailure MalformedBlob(std::string msg) {
        return {CipherFailureType::MalformedBlob, std::move(msg)};
    }
    static CipherFailure AuthenticationFailure(std::string msg) {
        return {CipherFailureType::AuthenticationFailure, std::move(msg)};
    }
    static CipherFailure MalformedPayload(std::string msg) {
        return {CipherFailureType::MalformedPayload, std::move(msg)};
    }
    static CipherFailure CryptoUnavailable(std::string msg) {
        return {CipherFailureType::CryptoUnavailable, std::move(msg)};
    }
    static CipherFailure KeyUnavailable(std::string msg) {
        return {CipherFailureType::KeyUnavailable, std::move(msg)};
    }
    static CipherFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::InitializationFailed) {
            return CryptoUnavailable(sf.message);
        }
        return KeyUnavailable(sf.message);
    }
};

[[nodiscard]] constexpr std::string_view ToString(const ResolverFailureType type) noexcept {
    switch (type) {
        case ResolverFailureType::InvalidCandidate: return "InvalidCandidate";
        case ResolverFailureType::UnsupportedStorageEncoding: return "UnsupportedStorageEncoding";
        case ResolverFailureType::StorageIntegrityViolation: return "StorageIntegrityViolation";
        case ResolverFailureType::StorageFailure: return "StorageFailure";
    }
    return "Unknown";
}

[[nodiscard]] constexpr std::string_view ToString(const CipherFailureType type) noexcept {
    switch (type) {
        case CipherFailureType::InvalidKeyLength: return "InvalidKeyLength";
        case CipherFailureType::DecodingError: return "DecodingError";
        case CipherFailureType::MalformedBlob: return "MalformedBlob";
        case CipherFailureType::AuthenticationFailure: return "AuthenticationFailure";
        case CipherFailureType::MalformedPayload: return "MalformedPayload";
        case CipherFailureType::CryptoUnavailable: return "CryptoUnavailable";
        case CipherFailureType::KeyUnavailable: return "KeyUnavailable";
    }
    return "Unknown";
}
}
