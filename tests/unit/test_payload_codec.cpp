#include <catch2/catch_test_macros.hpp>
#include "vaultline/utilities/payload_codec.hpp"
#include "vaultline/crypto/sodium_interop.hpp"
#include "credential/credential_record.pb.h"
using namespace vaultline;
using namespace vaultline::utilities;
using vaultline::crypto::SodiumInterop;
namespace {
    std::vector<uint8_t> Serialize(const proto::credential::CredentialRecord& record) {
        std::vector<uint8_t> bytes(record.ByteSizeLong());
        REQUIRE(record.SerializeToArray(bytes.data(), static_cast<int>(bytes.size())));
        return bytes;
    }
}
TEST_CASE("PayloadCodec - Encode and decode", "[payload][codec]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Two-entry credential survives") {
        const CredentialPayload payload{{"username", "a@b.com"}, {"password", "secret123"}};
        auto bytes = PayloadCodec::Encode(payload);
        REQUIRE(bytes.IsOk());
        auto decoded = PayloadCodec::Decode(bytes.Unwrap());
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap() == payload);
    }
    SECTION("Empty payload encodes to zero bytes") {
        auto bytes = PayloadCodec::Encode(CredentialPayload{});
        REQUIRE(bytes.IsOk());
        REQUIRE(bytes.Unwrap().empty());
        auto decoded = PayloadCodec::Decode(bytes.Unwrap());
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap().empty());
    }
    SECTION("Encoding is deterministic regardless of insertion order") {
        CredentialPayload first;
        first["b"] = "2";
        first["a"] = "1";
        CredentialPayload second;
        second["a"] = "1";
        second["b"] = "2";
        REQUIRE(PayloadCodec::Encode(first).Unwrap() == PayloadCodec::Encode(second).Unwrap());
    }
    SECTION("Entries are written in ascending key order") {
        const CredentialPayload payload{{"zeta", "z"}, {"alpha", "a"}, {"mid", "m"}};
        const auto bytes = PayloadCodec::Encode(payload).Unwrap();
        proto::credential::CredentialRecord record;
        REQUIRE(record.ParseFromArray(bytes.data(), static_cast<int>(bytes.size())));
        REQUIRE(record.entries_size() == 3);
        REQUIRE(record.entries(0).key() == "alpha");
        REQUIRE(record.entries(1).key() == "mid");
        REQUIRE(record.entries(2).key() == "zeta");
    }
    SECTION("Empty strings and binary-safe values are preserved") {
        const CredentialPayload payload{{"", ""}, {"token", std::string("a\0b", 3)}};
        auto decoded = PayloadCodec::Decode(PayloadCodec::Encode(payload).Unwrap());
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap() == payload);
    }
}
TEST_CASE("PayloadCodec - Rejects malformed records", "[payload][codec]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Garbage bytes") {
        const std::vector<uint8_t> garbage = {0xFF, 0xFF, 0xFF, 0xFF, 0x0F};
        auto result = PayloadCodec::Decode(garbage);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CipherFailureType::MalformedPayload);
    }
    SECTION("Repeated key") {
        proto::credential::CredentialRecord record;
        auto* first = record.add_entries();
        first->set_key("password");
        first->set_value("one");
        auto* second = record.add_entries();
        second->set_key("password");
        second->set_value("two");
        auto result = PayloadCodec::Decode(Serialize(record));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CipherFailureType::MalformedPayload);
    }
}
TEST_CASE("PayloadCodec - Wipe clears the map", "[payload][codec][security]") {
    CredentialPayload payload{{"username", "a@b.com"}, {"password", "secret123"}};
    PayloadCodec::Wipe(payload);
    REQUIRE(payload.empty());
    PayloadCodec::Wipe(payload);
    REQUIRE(payload.empty());
}
