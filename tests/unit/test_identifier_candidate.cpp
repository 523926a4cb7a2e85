#include <catch2/catch_test_macros.hpp>
#include "vaultline/resolution/identifier_candidate.hpp"
#include <string>
using namespace vaultline;
using namespace vaultline::resolution;
namespace {
    ResolverFailureType RejectionOf(std::string_view raw) {
        auto result = IdentifierCandidate::Parse(raw);
        REQUIRE(result.IsErr());
        return result.UnwrapErr().type;
    }
}
TEST_CASE("IdentifierCandidate - Normalization", "[candidate][resolution]") {
    SECTION("Canonical identifier is full") {
        auto result = IdentifierCandidate::Parse("550E8400-E29B-41D4-A716-446655440000");
        REQUIRE(result.IsOk());
        const auto& candidate = result.Unwrap();
        REQUIRE(candidate.NormalizedHex() == "550e8400e29b41d4a716446655440000");
        REQUIRE(candidate.Length() == 32);
        REQUIRE(candidate.IsFull());
    }
    SECTION("Bare 32 hex digits are full") {
        auto result = IdentifierCandidate::Parse("550e8400e29b41d4a716446655440000");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().IsFull());
    }
    SECTION("Short prefix") {
        auto result = IdentifierCandidate::Parse("550E8400");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().NormalizedHex() == "550e8400");
        REQUIRE_FALSE(result.Unwrap().IsFull());
    }
    SECTION("Hyphens anywhere in a prefix are dropped") {
        auto result = IdentifierCandidate::Parse("5-50e-84");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().NormalizedHex() == "550e84");
    }
    SECTION("Single digit is a valid prefix") {
        auto result = IdentifierCandidate::Parse("a");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().Length() == 1);
    }
    SECTION("31 digits is still a prefix") {
        auto result = IdentifierCandidate::Parse(std::string(31, 'f'));
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.Unwrap().IsFull());
    }
}
TEST_CASE("IdentifierCandidate - Rejections", "[candidate][resolution]") {
    SECTION("Empty") {
        REQUIRE(RejectionOf("") == ResolverFailureType::InvalidCandidate);
    }
    SECTION("Longer than 36 characters") {
        REQUIRE(RejectionOf(std::string(37, 'a')) == ResolverFailureType::InvalidCandidate);
    }
    SECTION("Non-hex character") {
        REQUIRE(RejectionOf("zz") == ResolverFailureType::InvalidCandidate);
        REQUIRE(RejectionOf("550g") == ResolverFailureType::InvalidCandidate);
        REQUIRE(RejectionOf("550e 8400") == ResolverFailureType::InvalidCandidate);
        REQUIRE(RejectionOf("550e%") == ResolverFailureType::InvalidCandidate);
    }
    SECTION("Hyphens only") {
        REQUIRE(RejectionOf("---") == ResolverFailureType::InvalidCandidate);
    }
    SECTION("36 characters with misplaced hyphens") {
        REQUIRE(RejectionOf("550e84-00e29b-41d4-a716-446655440000") == ResolverFailureType::InvalidCandidate);
    }
    SECTION("33 to 36 hex digits") {
        REQUIRE(RejectionOf(std::string(33, 'a')) == ResolverFailureType::InvalidCandidate);
        REQUIRE(RejectionOf(std::string(36, 'a')) == ResolverFailureType::InvalidCandidate);
    }
}
