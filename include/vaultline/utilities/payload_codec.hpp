#pragma once
#include "vaultline/core/result.hpp"
#include "vaultline/core/failures.hpp"
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>
namespace vaultline {
/// Flat credential data: string keys to string values, no nesting.
using CredentialPayload = std::map<std::string, std::string>;
}
namespace vaultline::utilities {
/**
 * Converts a CredentialPayload to and from its flat byte form
 * (protobuf CredentialRecord, deterministic ordering).
 */
class PayloadCodec {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, CipherFailure>
    Encode(const CredentialPayload& payload);

    /// Rejects bytes that are not a CredentialRecord or that repeat a key.
    [[nodiscard]] static Result<CredentialPayload, CipherFailure>
    Decode(std::span<const uint8_t> bytes);

    /// Overwrites every key and value, then clears the map.
    static void Wipe(CredentialPayload& payload);
private:
    PayloadCodec() = delete;
};
}
