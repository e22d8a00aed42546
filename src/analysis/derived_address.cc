#include "derived_address.hh"
#include "core/logging.hh"
#include "crypto/curve.hh"
#include "crypto/hash.hh"
#include <algorithm>
#include <limits>

namespace suitegen {

namespace {

Failure make_failure(ErrorCode code, std::string name, std::string detail) {
    Failure f;
    f.code = code;
    f.names.push_back(std::move(name));
    f.detail = std::move(detail);
    return f;
}

// Seed count includes the nonce byte appended by the search
Failure check_seed_limits(std::span<const bytes_t> seeds, std::size_t extra) {
    if (seeds.size() + extra > MAX_SEEDS) {
        return make_failure(ErrorCode::INVALID_SEED, "seeds",
                            "too many seeds: " + std::to_string(seeds.size() + extra) +
                                " (max " + std::to_string(MAX_SEEDS) + ")");
    }
    for (std::size_t i = 0; i < seeds.size(); ++i) {
        if (seeds[i].size() > MAX_SEED_LENGTH) {
            return make_failure(ErrorCode::INVALID_SEED, "seed[" + std::to_string(i) + "]",
                                "seed is " + std::to_string(seeds[i].size()) + " bytes (max " +
                                    std::to_string(MAX_SEED_LENGTH) + ")");
        }
    }
    return {};
}

Pubkey hash_candidate(std::span<const bytes_t> seeds, const std::uint8_t* nonce,
                      const Pubkey& program) {
    Sha256Hasher hasher;
    for (const auto& seed : seeds) {
        hasher.update(std::span<const std::uint8_t>(seed));
    }
    if (nonce) {
        hasher.update(nonce, 1);
    }
    hasher.update(std::span<const std::uint8_t>(program.bytes));
    hasher.update(DERIVED_ADDRESS_MARKER);

    Pubkey candidate;
    candidate.bytes = hasher.finalize();
    return candidate;
}

bool fits_unsigned(std::uint64_t value, std::uint16_t width) {
    if (width >= 64) return true;
    return value < (std::uint64_t{1} << width);
}

bool fits_signed(std::int64_t value, std::uint16_t width) {
    if (width >= 64) return true;
    std::int64_t bound = std::int64_t{1} << (width - 1);
    return value >= -bound && value < bound;
}

bool contains(const std::vector<std::string>& names, std::string_view name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

}  // namespace

// ============================================================================
// Seeds-Only Inspection
// ============================================================================

SeedScope SeedScope::of(const InstructionSpec& instruction) {
    SeedScope scope;
    for (const auto& arg : instruction.args) {
        scope.arguments.push_back(arg.name);
    }
    for (const auto& acc : instruction.accounts) {
        scope.accounts.push_back(acc.canonical_key);
    }
    return scope;
}

bool SeedScope::has_argument(std::string_view name) const {
    return contains(arguments, name);
}

bool SeedScope::has_account(std::string_view name) const {
    return contains(accounts, name);
}

SeedInspection inspect_seeds(const DerivedAddressSpec& spec, const SeedScope& scope) {
    SeedInspection inspection;
    for (const auto& seed : spec.seeds) {
        if (seed.kind == SeedKind::LITERAL) continue;

        SeedReference ref{seed.kind, seed.path, seed.root()};
        bool bound = seed.kind == SeedKind::ARGUMENT ? scope.has_argument(ref.root)
                                                     : scope.has_account(ref.root);
        if (!bound) {
            inspection.unbound.push_back(ref);
        }
        if (seed.kind == SeedKind::ARGUMENT) {
            inspection.argument_refs.push_back(std::move(ref));
        } else {
            inspection.account_refs.push_back(std::move(ref));
        }
    }
    return inspection;
}

// ============================================================================
// Address Derivation
// ============================================================================

DerivationResult create_program_address(std::span<const bytes_t> seeds, const Pubkey& program) {
    DerivationResult result;
    result.failure = check_seed_limits(seeds, 0);
    if (result.failure.code != ErrorCode::OK) {
        return result;
    }

    Pubkey candidate = hash_candidate(seeds, nullptr, program);
    result.attempts = 1;
    if (is_on_ed25519_curve(candidate)) {
        result.failure = make_failure(ErrorCode::INVALID_SEED, candidate.to_base58(),
                                      "candidate address lies on the ed25519 curve");
        return result;
    }
    result.derived = DerivedAddress{candidate, 0};
    return result;
}

DerivationResult find_program_address(std::span<const bytes_t> seeds, const Pubkey& program) {
    DerivationResult result;
    result.failure = check_seed_limits(seeds, 1);
    if (result.failure.code != ErrorCode::OK) {
        return result;
    }

    for (int n = MAX_NONCE; n >= 0; --n) {
        auto nonce = static_cast<std::uint8_t>(n);
        Pubkey candidate = hash_candidate(seeds, &nonce, program);
        ++result.attempts;
        if (!is_on_ed25519_curve(candidate)) {
            result.derived = DerivedAddress{candidate, nonce};
            SUITEGEN_LOG_TRACE(log::resolver) << "Derived " << candidate.to_base58() << " with nonce "
                                              << n << " after " << result.attempts << " attempts";
            return result;
        }
    }

    result.failure = make_failure(ErrorCode::EXHAUSTED_NONCE_SEARCH, program.to_base58(),
                                  "every nonce produced an on-curve address");
    log::resolver.error() << "Nonce search exhausted for program " << program.to_base58();
    return result;
}

// ============================================================================
// DerivedAddressResolver
// ============================================================================

DerivedAddressResolver::DerivedAddressResolver(ResolverConfig config) : config_(config) {}

std::optional<bytes_t> DerivedAddressResolver::encode_argument(const DataType& type,
                                                               const ArgumentValue& value) const {
    switch (type.kind) {
        case DataKind::STRING:
            if (value.kind != DataKind::STRING) return std::nullopt;
            return bytes_t(value.text.begin(), value.text.end());

        case DataKind::UNSIGNED_INTEGER: {
            std::uint64_t v = 0;
            if (value.kind == DataKind::UNSIGNED_INTEGER) {
                v = value.unsigned_value;
            } else if (value.kind == DataKind::SIGNED_INTEGER && value.signed_value >= 0) {
                v = static_cast<std::uint64_t>(value.signed_value);
            } else {
                return std::nullopt;
            }
            if (!fits_unsigned(v, type.width_bits)) return std::nullopt;
            return encode_unsigned(v, type.width_bits, config_.integer_byte_order);
        }

        case DataKind::SIGNED_INTEGER: {
            std::int64_t v = 0;
            if (value.kind == DataKind::SIGNED_INTEGER) {
                v = value.signed_value;
            } else if (value.kind == DataKind::UNSIGNED_INTEGER &&
                       value.unsigned_value <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                v = static_cast<std::int64_t>(value.unsigned_value);
            } else {
                return std::nullopt;
            }
            if (!fits_signed(v, type.width_bits)) return std::nullopt;
            return encode_signed(v, type.width_bits, config_.integer_byte_order);
        }

        case DataKind::BOOLEAN:
            if (value.kind != DataKind::BOOLEAN) return std::nullopt;
            return bytes_t{static_cast<std::uint8_t>(value.flag ? 1 : 0)};

        case DataKind::PUBLIC_KEY:
            if (value.kind == DataKind::PUBLIC_KEY) {
                return bytes_t(value.key.begin(), value.key.end());
            }
            if (value.kind == DataKind::STRING) {
                auto key = Pubkey::from_base58(value.text);
                if (!key) return std::nullopt;
                return bytes_t(key->begin(), key->end());
            }
            return std::nullopt;

        case DataKind::COMPOSITE:
            if (value.kind != DataKind::COMPOSITE) return std::nullopt;
            return value.raw;

        case DataKind::UNSUPPORTED:
            return std::nullopt;
    }
    return std::nullopt;
}

SeedBytesResult DerivedAddressResolver::seed_bytes(const DerivedAddressSpec& spec,
                                                   const InstructionSpec& instruction,
                                                   const BindingEnvironment& env) const {
    SeedBytesResult result;
    result.seeds.reserve(spec.seeds.size());

    for (const auto& seed : spec.seeds) {
        switch (seed.kind) {
            case SeedKind::LITERAL:
                result.seeds.push_back(seed.literal);
                break;

            case SeedKind::ARGUMENT: {
                const ArgumentValue* value = env.find_argument(instruction.name, seed.path);
                if (!value) {
                    result.seeds.clear();
                    result.failure = make_failure(ErrorCode::AMBIGUOUS_SEED, seed.path,
                                                  "argument seed has no bound value in " + instruction.name);
                    return result;
                }
                // A dotted path binds a field whose type the schema does not describe
                const ArgumentSpec* declared = instruction.find_argument(seed.path);
                DataType type;
                if (declared) {
                    type = declared->type;
                } else {
                    type.kind = value->kind;
                    type.width_bits = 64;
                }
                auto encoded = encode_argument(type, *value);
                if (!encoded) {
                    result.seeds.clear();
                    result.failure = make_failure(ErrorCode::INVALID_SEED, seed.path,
                                                  "bound value cannot be encoded as " +
                                                      (type.name.empty() ? std::string(data_kind_name(type.kind))
                                                                         : type.name));
                    return result;
                }
                result.seeds.push_back(std::move(*encoded));
                break;
            }

            case SeedKind::ACCOUNT: {
                auto key = env.find_account(seed.path);
                if (!key) {
                    result.seeds.clear();
                    result.failure = make_failure(ErrorCode::AMBIGUOUS_SEED, seed.path,
                                                  "account seed has no bound public key in " + instruction.name);
                    return result;
                }
                result.seeds.emplace_back(key->begin(), key->end());
                break;
            }
        }
    }
    return result;
}

DerivationResult DerivedAddressResolver::resolve(const DerivedAddressSpec& spec,
                                                 const InstructionSpec& instruction,
                                                 const BindingEnvironment& env,
                                                 const Pubkey& program_id) const {
    DerivationResult result;
    auto bytes = seed_bytes(spec, instruction, env);
    if (!bytes.ok()) {
        result.failure = std::move(bytes.failure);
        return result;
    }

    const Pubkey& program = spec.owning_program ? *spec.owning_program : program_id;
    result = find_program_address(bytes.seeds, program);
    if (!result.ok()) {
        log::resolver.warn() << "Derivation failed in " << instruction.name << ": "
                             << result.failure.to_string();
    }
    return result;
}

}  // namespace suitegen
