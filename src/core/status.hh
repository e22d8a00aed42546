#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace suitegen {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : std::uint8_t {
    OK = 0,
    PARSE_ERROR = 1,              // Malformed interface schema
    DEPENDENCY_CYCLE = 2,         // No valid initialization order exists
    AMBIGUOUS_SEED = 3,           // Seed references an unbound or unknown name
    EXHAUSTED_NONCE_SEARCH = 4,   // Every nonce produced an on-curve address
    INVALID_SEED = 5,             // Seed too long or too many seeds
    UNKNOWN_INSTRUCTION = 6,      // Execution order names an undeclared instruction
    MISSING_ACCOUNT_BINDING = 7,  // Seed references something the instruction does not declare
    UNSUPPORTED_TYPE = 8,         // No synthesis policy for a data type
    RESOURCE_EXHAUSTED = 9,       // Persistence ceiling or compute budget exceeded
};

[[nodiscard]] constexpr std::string_view error_code_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "ok";
        case ErrorCode::PARSE_ERROR: return "parse_error";
        case ErrorCode::DEPENDENCY_CYCLE: return "dependency_cycle";
        case ErrorCode::AMBIGUOUS_SEED: return "ambiguous_seed";
        case ErrorCode::EXHAUSTED_NONCE_SEARCH: return "exhausted_nonce_search";
        case ErrorCode::INVALID_SEED: return "invalid_seed";
        case ErrorCode::UNKNOWN_INSTRUCTION: return "unknown_instruction";
        case ErrorCode::MISSING_ACCOUNT_BINDING: return "missing_account_binding";
        case ErrorCode::UNSUPPORTED_TYPE: return "unsupported_type";
        case ErrorCode::RESOURCE_EXHAUSTED: return "resource_exhausted";
    }
    return "unknown";
}

// ============================================================================
// Failure - terminal error with the offending names
// ============================================================================

struct Failure {
    ErrorCode code = ErrorCode::OK;
    std::vector<std::string> names;
    std::string detail;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const Failure&) const = default;
};

}  // namespace suitegen
