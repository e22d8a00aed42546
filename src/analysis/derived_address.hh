#pragma once

#include "analysis/context.hh"
#include "core/status.hh"
#include "core/types.hh"
#include "model/interface.hh"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace suitegen {

// ============================================================================
// Resolver Configuration
// ============================================================================

struct ResolverConfig {
    // Integer seeds are fixed-width in this byte order (to_le_bytes by default)
    ByteOrder integer_byte_order = ByteOrder::LITTLE;
};

// ============================================================================
// Seeds-Only Inspection
// ============================================================================

// Names visible to a derived-address spec during inspection
struct SeedScope {
    std::vector<std::string> arguments;
    std::vector<std::string> accounts;

    [[nodiscard]] static SeedScope of(const InstructionSpec& instruction);

    [[nodiscard]] bool has_argument(std::string_view name) const;
    [[nodiscard]] bool has_account(std::string_view name) const;
};

struct SeedReference {
    SeedKind kind = SeedKind::ACCOUNT;
    std::string path;         // As written ("vault.owner")
    std::string root;         // First segment ("vault")
};

struct SeedInspection {
    std::vector<SeedReference> account_refs;    // Seed order, duplicates kept
    std::vector<SeedReference> argument_refs;
    std::vector<SeedReference> unbound;         // Roots absent from the scope

    [[nodiscard]] bool fully_bound() const { return unbound.empty(); }
};

// Report what a derived-address spec references without computing anything
[[nodiscard]] SeedInspection inspect_seeds(const DerivedAddressSpec& spec, const SeedScope& scope);

// ============================================================================
// Address Derivation
// ============================================================================

struct DerivationResult {
    std::optional<DerivedAddress> derived;
    Failure failure;
    std::uint32_t attempts = 0;       // Hash evaluations performed

    [[nodiscard]] bool ok() const { return derived.has_value(); }
};

struct SeedBytesResult {
    std::vector<bytes_t> seeds;
    Failure failure;

    [[nodiscard]] bool ok() const { return failure.code == ErrorCode::OK; }
};

// Single candidate: SHA-256(seeds || program || marker). Seeds include the
// nonce byte when the caller wants one. Fails with INVALID_SEED when the
// seed limits are violated or the candidate lies on the ed25519 curve.
[[nodiscard]] DerivationResult create_program_address(std::span<const bytes_t> seeds,
                                                      const Pubkey& program);

// Nonce search from 255 down to 0; first off-curve candidate wins.
[[nodiscard]] DerivationResult find_program_address(std::span<const bytes_t> seeds,
                                                    const Pubkey& program);

// ============================================================================
// Derived Address Resolver
// ============================================================================

class DerivedAddressResolver {
public:
    explicit DerivedAddressResolver(ResolverConfig config = {});

    // Turn every seed into bytes using the bindings. Unbound names fail with
    // AMBIGUOUS_SEED; values that cannot be encoded fail with INVALID_SEED.
    [[nodiscard]] SeedBytesResult seed_bytes(const DerivedAddressSpec& spec,
                                             const InstructionSpec& instruction,
                                             const BindingEnvironment& env) const;

    // seed_bytes followed by find_program_address against the owning program
    // (or `program_id` when the spec names none)
    [[nodiscard]] DerivationResult resolve(const DerivedAddressSpec& spec,
                                           const InstructionSpec& instruction,
                                           const BindingEnvironment& env,
                                           const Pubkey& program_id) const;

    // Encode one argument value per its declared type
    [[nodiscard]] std::optional<bytes_t> encode_argument(const DataType& type,
                                                         const ArgumentValue& value) const;

    [[nodiscard]] const ResolverConfig& config() const { return config_; }

private:
    ResolverConfig config_;
};

}  // namespace suitegen
