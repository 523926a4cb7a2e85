#pragma once
#include "vaultline/core/result.hpp"
#include "vaultline/core/failures.hpp"
#include <cstddef>
#include <string>
#include <string_view>
namespace vaultline::resolution {

/**
 * @brief Validated, normalized identifier input
 *
 * Accepts 1-36 characters from [0-9a-fA-F-]. A 36-character input must use
 * canonical 8-4-4-4-12 hyphen placement; shorter inputs may contain hyphens
 * anywhere. Normalization strips hyphens and lower-cases, leaving 1-32 hex
 * digits. Exactly 32 digits is a full identifier, anything shorter a prefix.
 */
class IdentifierCandidate {
public:
    [[nodiscard]] static Result<IdentifierCandidate, ResolverFailure> Parse(std::string_view raw);

    [[nodiscard]] const std::string& NormalizedHex() const noexcept { return hex_; }

    [[nodiscard]] size_t Length() const noexcept { return hex_.size(); }

    [[nodiscard]] bool IsFull() const noexcept;

private:
    explicit IdentifierCandidate(std::string hex) : hex_(std::move(hex)) {}

    std::string hex_;
};

}
