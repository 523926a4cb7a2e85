#include "vaultline/resolution/identifier_candidate.hpp"
#include "vaultline/resolution/uuid.hpp"
#include "vaultline/core/constants.hpp"

namespace vaultline::resolution {

Result<IdentifierCandidate, ResolverFailure> IdentifierCandidate::Parse(std::string_view raw) {
    if (raw.empty()) {
        return Result<IdentifierCandidate, ResolverFailure>::Err(
            ResolverFailure::InvalidCandidate(std::string(ErrorMessages::CANDIDATE_EMPTY)));
    }
    if (raw.size() > kCanonicalUuidLength) {
        return Result<IdentifierCandidate, ResolverFailure>::Err(
            ResolverFailure::InvalidCandidate(std::string(ErrorMessages::CANDIDATE_TOO_LONG)));
    }
    for (const char c : raw) {
        if (c != '-' && !HexNibble(c).has_value()) {
            return Result<IdentifierCandidate, ResolverFailure>::Err(
                ResolverFailure::InvalidCandidate(std::string(ErrorMessages::CANDIDATE_BAD_CHARACTER)));
        }
    }
    if (raw.size() == kCanonicalUuidLength && !ParseUuid(raw).has_value()) {
        return Result<IdentifierCandidate, ResolverFailure>::Err(
            ResolverFailure::InvalidCandidate(std::string(ErrorMessages::CANDIDATE_BAD_HYPHENS)));
    }

    std::string hex = StripHyphensLower(raw);
    if (hex.empty()) {
        return Result<IdentifierCandidate, ResolverFailure>::Err(
            ResolverFailure::InvalidCandidate(std::string(ErrorMessages::CANDIDATE_NO_DIGITS)));
    }
    if (hex.size() > kUuidHexDigits) {
        return Result<IdentifierCandidate, ResolverFailure>::Err(
            ResolverFailure::InvalidCandidate(std::string(ErrorMessages::CANDIDATE_TOO_MANY_DIGITS)));
    }
    return Result<IdentifierCandidate, ResolverFailure>::Ok(IdentifierCandidate(std::move(hex)));
}

bool IdentifierCandidate::IsFull() const noexcept {
    return hex_.size() == kUuidHexDigits;
}

}
