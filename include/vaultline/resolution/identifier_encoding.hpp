#pragma once
#include <cstdint>
#include <string_view>
namespace vaultline {

/// Physical storage representation of an entity type's identifier column.
enum class IdentifierEncoding : uint8_t {
    /// 16 raw bytes
    BinaryUuid = 0,
    /// 36-character canonical hyphenated string, case-insensitive
    TextUuid = 1,
    Unsupported = 2
};

[[nodiscard]] constexpr std::string_view ToString(const IdentifierEncoding encoding) noexcept {
    switch (encoding) {
        case IdentifierEncoding::BinaryUuid: return "BINARY_UUID";
        case IdentifierEncoding::TextUuid: return "TEXT_UUID";
        case IdentifierEncoding::Unsupported: return "UNSUPPORTED";
    }
    return "UNSUPPORTED";
}

}
