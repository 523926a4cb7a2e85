#pragma once
#include "vaultline/core/constants.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
namespace vaultline::resolution {

using UuidBytes = std::array<uint8_t, kUuidBytes>;

/// Value of a single hex digit, either case.
[[nodiscard]] constexpr std::optional<uint8_t> HexNibble(const char c) noexcept {
    if (c >= '0' && c <= '9') {
        return static_cast<uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f') {
        return static_cast<uint8_t>(c - 'a' + 10);
    }
    if (c >= 'A' && c <= 'F') {
        return static_cast<uint8_t>(c - 'A' + 10);
    }
    return std::nullopt;
}

[[nodiscard]] std::string ToHex(std::span<const uint8_t> bytes);

/// Lower-cases hex digits and drops hyphens. Other characters are kept as-is.
[[nodiscard]] std::string StripHyphensLower(std::string_view text);

/**
 * @brief Parse a UUID in canonical 8-4-4-4-12 form or as 32 bare hex digits
 *
 * Either case is accepted. Returns nullopt on any other shape.
 */
[[nodiscard]] std::optional<UuidBytes> ParseUuid(std::string_view text);

/// Lower-case canonical hyphenated rendering.
[[nodiscard]] std::string FormatCanonicalUuid(std::span<const uint8_t, kUuidBytes> bytes);

}
