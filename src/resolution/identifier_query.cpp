#include "vaultline/resolution/identifier_query.hpp"
#include "vaultline/core/constants.hpp"
#include <algorithm>
#include <format>

namespace vaultline::resolution {
namespace {
    Result<Unit, ResolverFailure> ValidatePrefixHex(std::string_view hex) {
        if (hex.empty() || hex.size() >= kUuidHexDigits) {
            return Result<Unit, ResolverFailure>::Err(
                ResolverFailure::InvalidCandidate(
                    std::format("Identifier prefix must be 1-{} hex digits, got {}",
                        kUuidHexDigits - 1, hex.size())));
        }
        for (const char c : hex) {
            if (!HexNibble(c).has_value()) {
                return Result<Unit, ResolverFailure>::Err(
                    ResolverFailure::InvalidCandidate(
                        std::string(ErrorMessages::CANDIDATE_BAD_CHARACTER)));
            }
        }
        return Result<Unit, ResolverFailure>::Ok(unit);
    }
}

bool BinaryExact::Matches(std::span<const uint8_t> stored) const noexcept {
    return stored.size() == bytes.size()
           && std::equal(bytes.begin(), bytes.end(), stored.begin());
}

bool TextExact::Matches(std::string_view stored) const {
    return StripHyphensLower(stored) == StripHyphensLower(canonical);
}

Result<BinaryPrefix, ResolverFailure> BinaryPrefix::FromHex(std::string_view hex) {
    auto validation = ValidatePrefixHex(hex);
    if (validation.IsErr()) {
        return Result<BinaryPrefix, ResolverFailure>::Err(std::move(validation).UnwrapErr());
    }
    std::vector<uint8_t> whole_bytes;
    whole_bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        const uint8_t high = HexNibble(hex[i]).value_or(0);
        const uint8_t low = HexNibble(hex[i + 1]).value_or(0);
        whole_bytes.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    std::optional<uint8_t> trailing;
    if (hex.size() % 2 == 1) {
        trailing = HexNibble(hex.back()).value_or(0);
    }
    return Result<BinaryPrefix, ResolverFailure>::Ok(BinaryPrefix(std::move(whole_bytes), trailing));
}

bool BinaryPrefix::Matches(std::span<const uint8_t> stored) const noexcept {
    const size_t needed = whole_bytes_.size() + (trailing_nibble_.has_value() ? 1 : 0);
    if (stored.size() < needed) {
        return false;
    }
    if (!std::equal(whole_bytes_.begin(), whole_bytes_.end(), stored.begin())) {
        return false;
    }
    if (trailing_nibble_.has_value()) {
        return (stored[whole_bytes_.size()] >> 4) == *trailing_nibble_;
    }
    return true;
}

UuidBytes BinaryPrefix::LowerBound() const noexcept {
    UuidBytes bound{};
    std::copy(whole_bytes_.begin(), whole_bytes_.end(), bound.begin());
    if (trailing_nibble_.has_value()) {
        bound[whole_bytes_.size()] = static_cast<uint8_t>(*trailing_nibble_ << 4);
    }
    return bound;
}

UuidBytes BinaryPrefix::UpperBound() const noexcept {
    UuidBytes bound;
    bound.fill(0xFF);
    std::copy(whole_bytes_.begin(), whole_bytes_.end(), bound.begin());
    if (trailing_nibble_.has_value()) {
        bound[whole_bytes_.size()] = static_cast<uint8_t>((*trailing_nibble_ << 4) | 0x0F);
    }
    return bound;
}

Result<TextPrefix, ResolverFailure> TextPrefix::FromHex(std::string_view hex) {
    auto validation = ValidatePrefixHex(hex);
    if (validation.IsErr()) {
        return Result<TextPrefix, ResolverFailure>::Err(std::move(validation).UnwrapErr());
    }
    return Result<TextPrefix, ResolverFailure>::Ok(TextPrefix(StripHyphensLower(hex)));
}

bool TextPrefix::Matches(std::string_view stored) const {
    const std::string normalized = StripHyphensLower(stored);
    return normalized.size() >= hex_.size()
           && std::equal(hex_.begin(), hex_.end(), normalized.begin());
}

std::string TextPrefix::HyphenatedPrefix() const {
    std::string hyphenated;
    hyphenated.reserve(hex_.size() + 4);
    for (size_t i = 0; i < hex_.size(); ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            hyphenated.push_back('-');
        }
        hyphenated.push_back(hex_[i]);
    }
    return hyphenated;
}

}
