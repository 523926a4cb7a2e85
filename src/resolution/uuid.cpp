#include "vaultline/resolution/uuid.hpp"
#include <algorithm>

namespace vaultline::resolution {
    namespace {
        constexpr char kHexDigits[] = "0123456789abcdef";

        bool IsCanonicalHyphenOffset(const size_t index) {
            return std::find(std::begin(kCanonicalHyphenOffsets),
                             std::end(kCanonicalHyphenOffsets), index)
                   != std::end(kCanonicalHyphenOffsets);
        }
    }

    std::string ToHex(std::span<const uint8_t> bytes) {
        std::string hex;
        hex.reserve(bytes.size() * 2);
        for (const auto byte : bytes) {
            hex.push_back(kHexDigits[(byte >> 4) & 0x0F]);
            hex.push_back(kHexDigits[byte & 0x0F]);
        }
        return hex;
    }

    std::string StripHyphensLower(std::string_view text) {
        std::string out;
        out.reserve(text.size());
        for (const char c : text) {
            if (c == '-') {
                continue;
            }
            out.push_back(c >= 'A' && c <= 'F' ? static_cast<char>(c - 'A' + 'a') : c);
        }
        return out;
    }

    std::optional<UuidBytes> ParseUuid(std::string_view text) {
        if (text.size() == kCanonicalUuidLength) {
            for (size_t i = 0; i < text.size(); ++i) {
                if ((text[i] == '-') != IsCanonicalHyphenOffset(i)) {
                    return std::nullopt;
                }
            }
        } else if (text.size() != kUuidHexDigits) {
            return std::nullopt;
        }

        UuidBytes bytes{};
        size_t digit = 0;
        for (const char c : text) {
            if (c == '-') {
                continue;
            }
            const auto nibble = HexNibble(c);
            if (!nibble.has_value()) {
                return std::nullopt;
            }
            auto &target = bytes[digit / 2];
            target = digit % 2 == 0
                         ? static_cast<uint8_t>(*nibble << 4)
                         : static_cast<uint8_t>(target | *nibble);
            ++digit;
        }
        if (digit != kUuidHexDigits) {
            return std::nullopt;
        }
        return bytes;
    }

    std::string FormatCanonicalUuid(std::span<const uint8_t, kUuidBytes> bytes) {
        const std::string hex = ToHex(bytes);
        std::string canonical;
        canonical.reserve(kCanonicalUuidLength);
        for (size_t i = 0; i < hex.size(); ++i) {
            if (i == 8 || i == 12 || i == 16 || i == 20) {
                canonical.push_back('-');
            }
            canonical.push_back(hex[i]);
        }
        return canonical;
    }
}
