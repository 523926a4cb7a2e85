#include "vaultline/utilities/payload_codec.hpp"
#include "vaultline/crypto/sodium_interop.hpp"
#include "vaultline/core/constants.hpp"
#include "credential/credential_record.pb.h"
#include <format>

namespace vaultline::utilities {
    using crypto::SodiumInterop;

    namespace {
        void WipeRecord(proto::credential::CredentialRecord &record) {
            for (auto &entry : *record.mutable_entries()) {
                SodiumInterop::SecureWipe(*entry.mutable_key());
                SodiumInterop::SecureWipe(*entry.mutable_value());
            }
            record.Clear();
        }
    }

    Result<std::vector<uint8_t>, CipherFailure>
    PayloadCodec::Encode(const CredentialPayload &payload) {
        proto::credential::CredentialRecord record;
        try {
            // std::map iteration is already ascending by key
            for (const auto &[key, value] : payload) {
                auto *entry = record.add_entries();
                entry->set_key(key);
                entry->set_value(value);
            }
            const size_t size = record.ByteSizeLong();
            if (size > kMaxPayloadBytes) {
                WipeRecord(record);
                return Result<std::vector<uint8_t>, CipherFailure>::Err(
                    CipherFailure::MalformedPayload(
                        std::format("Serialized payload of {} bytes exceeds maximum {}",
                                    size, kMaxPayloadBytes)));
            }
            std::vector<uint8_t> bytes(size);
            if (size > 0 && !record.SerializeToArray(bytes.data(), static_cast<int>(size))) {
                WipeRecord(record);
                return Result<std::vector<uint8_t>, CipherFailure>::Err(
                    CipherFailure::MalformedPayload("Failed to serialize CredentialRecord"));
            }
            WipeRecord(record);
            return Result<std::vector<uint8_t>, CipherFailure>::Ok(std::move(bytes));
        } catch (const std::exception &ex) {
            WipeRecord(record);
            return Result<std::vector<uint8_t>, CipherFailure>::Err(
                CipherFailure::MalformedPayload(
                    std::format("Exception during payload serialization: {}", ex.what())));
        }
    }

    Result<CredentialPayload, CipherFailure>
    PayloadCodec::Decode(std::span<const uint8_t> bytes) {
        proto::credential::CredentialRecord record;
        CredentialPayload payload;
        try {
            if (!record.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
                WipeRecord(record);
                return Result<CredentialPayload, CipherFailure>::Err(
                    CipherFailure::MalformedPayload("Failed to parse CredentialRecord"));
            }
            for (auto &entry : *record.mutable_entries()) {
                auto [it, inserted] = payload.try_emplace(entry.key(), entry.value());
                if (!inserted) {
                    WipeRecord(record);
                    Wipe(payload);
                    return Result<CredentialPayload, CipherFailure>::Err(
                        CipherFailure::MalformedPayload("CredentialRecord repeats a key"));
                }
            }
            WipeRecord(record);
            return Result<CredentialPayload, CipherFailure>::Ok(std::move(payload));
        } catch (const std::exception &ex) {
            WipeRecord(record);
            Wipe(payload);
            return Result<CredentialPayload, CipherFailure>::Err(
                CipherFailure::MalformedPayload(
                    std::format("Exception during payload parsing: {}", ex.what())));
        }
    }

    void PayloadCodec::Wipe(CredentialPayload &payload) {
        while (!payload.empty()) {
            auto node = payload.extract(payload.begin());
            SodiumInterop::SecureWipe(node.key());
            SodiumInterop::SecureWipe(node.mapped());
        }
    }
}
