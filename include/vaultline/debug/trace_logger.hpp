#pragma once

/**
 * @file trace_logger.hpp
 * @brief Debug tracing for resolver and cipher calls.
 *
 * Lines go to stdout prefixed with [VAULTLINE-DEBUG]. Only sizes, counts,
 * encodings, entity type names and failure kinds are ever written; key bytes,
 * plaintext and identifier values are not.
 *
 * Enable via CMake: -DVAULTLINE_DEBUG_TRACE=ON
 */

#include "vaultline/core/failures.hpp"

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

namespace vaultline::debug {

#ifdef VAULTLINE_DEBUG_TRACE

#define VAULTLINE_LOG_MSG(component, message) \
    do { \
        fprintf(stdout, "[VAULTLINE-DEBUG] %s %s\n", component, message); \
        fflush(stdout); \
    } while(0)

#define VAULTLINE_LOG_VALUE(component, name, value) \
    do { \
        fprintf(stdout, "[VAULTLINE-DEBUG] %s %s: %s\n", \
            component, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define VAULTLINE_LOG_SECTION(component, section_name) \
    do { \
        fprintf(stdout, "[VAULTLINE-DEBUG] %s ========== %s ==========\n", \
            component, \
            section_name); \
        fflush(stdout); \
    } while(0)

// ============================================================================
// Identifier resolution
// ============================================================================

inline void LogResolutionStart(
    std::string_view entity_type,
    std::string_view encoding,
    size_t normalized_length,
    bool exact) {

    const std::string header = "RESOLVE " + std::string(entity_type);
    VAULTLINE_LOG_SECTION("RESOLVER", header.c_str());
    VAULTLINE_LOG_MSG("RESOLVER", (std::string("encoding: ") + std::string(encoding)).c_str());
    VAULTLINE_LOG_VALUE("RESOLVER", "candidate_hex_digits", normalized_length);
    VAULTLINE_LOG_MSG("RESOLVER", exact ? "query: EXACT" : "query: PREFIX");
}

inline void LogResolution(std::string_view outcome, size_t match_count) {
    VAULTLINE_LOG_MSG("RESOLVER", (std::string("outcome: ") + std::string(outcome)).c_str());
    VAULTLINE_LOG_VALUE("RESOLVER", "match_count", match_count);
}

inline void LogResolutionRejected(ResolverFailureType type) {
    VAULTLINE_LOG_MSG("RESOLVER", (std::string("rejected: ") + std::string(ToString(type))).c_str());
}

// ============================================================================
// Credential cipher
// ============================================================================

inline void LogCipherOperation(const char* operation, size_t entry_count, size_t blob_bytes) {
    VAULTLINE_LOG_MSG("CIPHER", operation);
    VAULTLINE_LOG_VALUE("CIPHER", "entry_count", entry_count);
    VAULTLINE_LOG_VALUE("CIPHER", "blob_bytes", blob_bytes);
}

inline void LogCipherRejected(const char* operation, CipherFailureType type) {
    const std::string line = std::string(operation) + " rejected: " + std::string(ToString(type));
    VAULTLINE_LOG_MSG("CIPHER", line.c_str());
}

#else // !VAULTLINE_DEBUG_TRACE

#define VAULTLINE_LOG_MSG(component, message) ((void)0)
#define VAULTLINE_LOG_VALUE(component, name, value) ((void)0)
#define VAULTLINE_LOG_SECTION(component, section_name) ((void)0)

inline void LogResolutionStart(std::string_view, std::string_view, size_t, bool) {}
inline void LogResolution(std::string_view, size_t) {}
inline void LogResolutionRejected(ResolverFailureType) {}
inline void LogCipherOperation(const char*, size_t, size_t) {}
inline void LogCipherRejected(const char*, CipherFailureType) {}

#endif // VAULTLINE_DEBUG_TRACE

} // namespace vaultline::debug
