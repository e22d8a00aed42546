#pragma once

#include "core/types.hh"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace suitegen {

// ============================================================================
// Data Types
// ============================================================================

enum class DataKind : std::uint8_t {
    STRING = 0,
    UNSIGNED_INTEGER = 1,
    SIGNED_INTEGER = 2,
    BOOLEAN = 3,
    PUBLIC_KEY = 4,
    COMPOSITE = 5,
    UNSUPPORTED = 6,      // Parsed but no synthesis policy (e.g. f32)
};

enum class CompositeKind : std::uint8_t {
    NONE = 0,
    VEC = 1,
    OPTION = 2,
    ARRAY = 3,
    STRUCT = 4,
    ENUM = 5,
    BYTES = 6,
};

[[nodiscard]] std::string_view data_kind_name(DataKind kind);

struct DataType {
    DataKind kind = DataKind::UNSUPPORTED;
    std::uint16_t width_bits = 0;             // Integers only: 8, 16, 32, 64, 128
    CompositeKind composite = CompositeKind::NONE;
    std::string name;                         // Canonical text, e.g. "u64", "Vec<u8>", "Mood"
    std::vector<std::string> variants;        // Enum variants, declared order
    std::uint32_t array_length = 0;

    [[nodiscard]] bool is_integer() const {
        return kind == DataKind::UNSIGNED_INTEGER || kind == DataKind::SIGNED_INTEGER;
    }

    [[nodiscard]] static DataType string_type();
    [[nodiscard]] static DataType unsigned_int(std::uint16_t width);
    [[nodiscard]] static DataType signed_int(std::uint16_t width);
    [[nodiscard]] static DataType boolean();
    [[nodiscard]] static DataType public_key();

    bool operator==(const DataType&) const = default;
};

// ============================================================================
// Argument Constraints
// ============================================================================

// Constraints are declared independently. The only implication drawn is
// that a minimum of at least 1 rules out zero.
struct ArgumentConstraints {
    std::optional<std::int64_t> min;
    std::optional<std::int64_t> max;
    bool nonzero = false;
    std::optional<std::uint32_t> min_length;
    std::optional<std::uint32_t> max_length;

    // Constraint key ("min", "max", "nonzero", "empty", "maxLength",
    // "minLength", "enum", "overflow", "negative") -> declared error name or literal message
    std::map<std::string, std::string> errors;

    [[nodiscard]] bool has_value_bounds() const {
        return min.has_value() || max.has_value() || nonzero;
    }

    // Zero is out of range under an explicit nonzero flag or a minimum of at least 1
    [[nodiscard]] bool disallows_zero() const {
        return nonzero || (min && *min >= 1);
    }

    bool operator==(const ArgumentConstraints&) const = default;
};

struct ArgumentSpec {
    std::string name;
    DataType type;
    ArgumentConstraints constraints;
    std::vector<std::string> docs;
};

// ============================================================================
// Derived Address Specification
// ============================================================================

enum class SeedKind : std::uint8_t {
    LITERAL = 0,
    ARGUMENT = 1,
    ACCOUNT = 2,
};

[[nodiscard]] std::string_view seed_kind_name(SeedKind kind);

struct SeedSource {
    SeedKind kind = SeedKind::LITERAL;
    bytes_t literal;          // LITERAL only
    std::string path;         // ARGUMENT / ACCOUNT: name, optionally dotted ("vault.owner")

    // First path segment: the argument or account the seed depends on
    [[nodiscard]] std::string root() const;

    [[nodiscard]] static SeedSource from_literal(std::string_view text);
    [[nodiscard]] static SeedSource from_argument(std::string name);
    [[nodiscard]] static SeedSource from_account(std::string name);
};

struct DerivedAddressSpec {
    std::vector<SeedSource> seeds;
    std::optional<Pubkey> owning_program;     // Absent: the program under test
};

// ============================================================================
// Accounts and Instructions
// ============================================================================

struct AccountUsage {
    std::string name;
    std::string canonical_key;                // Exact declared name; graph merge key
    bool is_mut = false;
    bool is_signer = false;
    bool is_optional = false;
    std::vector<std::string> docs;
    std::vector<std::string> relations;       // has_one style: must precede this account
    std::optional<DerivedAddressSpec> derived;
    std::optional<Pubkey> fixed_address;      // Well-known accounts (system program, ...)

    [[nodiscard]] bool is_derived() const { return derived.has_value(); }
};

struct InstructionSpec {
    std::string name;
    std::vector<ArgumentSpec> args;
    std::vector<AccountUsage> accounts;
    std::vector<std::string> docs;

    [[nodiscard]] const ArgumentSpec* find_argument(std::string_view arg_name) const;
    [[nodiscard]] const AccountUsage* find_account(std::string_view account_name) const;
};

// ============================================================================
// Declared Errors and Types
// ============================================================================

struct ErrorSpec {
    std::uint32_t code = 0;
    std::string name;
    std::string message;
};

struct TypeDefinition {
    std::string name;
    CompositeKind kind = CompositeKind::STRUCT;   // STRUCT or ENUM
    std::vector<std::string> members;             // Field names or variant names
};

// ============================================================================
// Interface Model
// ============================================================================

struct InterfaceModel {
    std::string program_name;
    std::string version;
    std::optional<Pubkey> program_id;
    std::vector<InstructionSpec> instructions;
    std::vector<TypeDefinition> types;
    std::vector<ErrorSpec> errors;
    hash_t source_digest{};

    [[nodiscard]] const InstructionSpec* find_instruction(std::string_view name) const;
    [[nodiscard]] const ErrorSpec* find_error(std::string_view name) const;
    [[nodiscard]] const TypeDefinition* find_type(std::string_view name) const;

    [[nodiscard]] std::vector<std::string> instruction_names() const;
};

}  // namespace suitegen
