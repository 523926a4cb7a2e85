#pragma once
#include "vaultline/core/result.hpp"
#include "vaultline/core/failures.hpp"
#include "vaultline/resolution/uuid.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
namespace vaultline::resolution {

// ============================================================================
// Exact match keys
// ============================================================================

/// Byte equality against a BINARY_UUID column.
struct BinaryExact {
    UuidBytes bytes{};

    [[nodiscard]] bool Matches(std::span<const uint8_t> stored) const noexcept;
};

/// Case-insensitive equality against a TEXT_UUID column.
struct TextExact {
    /// Lower-case canonical hyphenated form.
    std::string canonical;

    [[nodiscard]] bool Matches(std::string_view stored) const;
};

using ExactIdentifier = std::variant<BinaryExact, TextExact>;

// ============================================================================
// Prefix match keys
// ============================================================================

/**
 * @brief Leading-bytes match against a BINARY_UUID column
 *
 * An odd number of hex digits leaves a trailing high nibble that is compared
 * against the upper four bits of the next stored byte.
 */
class BinaryPrefix {
public:
    /// Fails with InvalidCandidate unless hex is 1-31 hex digits, either case.
    [[nodiscard]] static Result<BinaryPrefix, ResolverFailure> FromHex(std::string_view hex);

    [[nodiscard]] std::span<const uint8_t> WholeBytes() const noexcept { return whole_bytes_; }

    [[nodiscard]] std::optional<uint8_t> TrailingNibble() const noexcept { return trailing_nibble_; }

    [[nodiscard]] size_t HexLength() const noexcept {
        return whole_bytes_.size() * 2 + (trailing_nibble_.has_value() ? 1 : 0);
    }

    [[nodiscard]] bool Matches(std::span<const uint8_t> stored) const noexcept;

    /// Smallest 16-byte value carrying this prefix (inclusive).
    [[nodiscard]] UuidBytes LowerBound() const noexcept;

    /// Largest 16-byte value carrying this prefix (inclusive).
    [[nodiscard]] UuidBytes UpperBound() const noexcept;

private:
    BinaryPrefix(std::vector<uint8_t> whole_bytes, std::optional<uint8_t> trailing_nibble)
        : whole_bytes_(std::move(whole_bytes)), trailing_nibble_(trailing_nibble) {}

    std::vector<uint8_t> whole_bytes_;
    std::optional<uint8_t> trailing_nibble_;
};

/**
 * @brief Case-insensitive string prefix against a TEXT_UUID column
 *
 * Stored values are compared with their hyphens removed.
 */
class TextPrefix {
public:
    /// Fails with InvalidCandidate unless hex is 1-31 hex digits; stored lower-cased.
    [[nodiscard]] static Result<TextPrefix, ResolverFailure> FromHex(std::string_view hex);

    [[nodiscard]] const std::string& Hex() const noexcept { return hex_; }

    [[nodiscard]] bool Matches(std::string_view stored) const;

    /// The prefix re-hyphenated at canonical offsets, for LIKE 'x%' against canonical columns.
    [[nodiscard]] std::string HyphenatedPrefix() const;

private:
    explicit TextPrefix(std::string hex) : hex_(std::move(hex)) {}

    std::string hex_;
};

using IdentifierPrefix = std::variant<BinaryPrefix, TextPrefix>;

}
