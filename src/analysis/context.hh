#pragma once

#include "core/types.hh"
#include "model/interface.hh"
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace suitegen {

// ============================================================================
// Argument Value - concrete binding for an argument seed
// ============================================================================

struct ArgumentValue {
    DataKind kind = DataKind::STRING;
    std::string text;
    std::uint64_t unsigned_value = 0;
    std::int64_t signed_value = 0;
    bool flag = false;
    Pubkey key;
    bytes_t raw;              // Composite arguments: serialized bytes used verbatim

    [[nodiscard]] static ArgumentValue from_string(std::string value);
    [[nodiscard]] static ArgumentValue from_unsigned(std::uint64_t value);
    [[nodiscard]] static ArgumentValue from_signed(std::int64_t value);
    [[nodiscard]] static ArgumentValue from_bool(bool value);
    [[nodiscard]] static ArgumentValue from_pubkey(const Pubkey& value);
    [[nodiscard]] static ArgumentValue from_bytes(bytes_t value);

    // Human-readable rendering used in derived-address plans
    [[nodiscard]] std::string to_string() const;
};

// ============================================================================
// Binding Environment - argument values and account keys available to seeds
// ============================================================================

// Names may be dotted ("vault.owner") to bind a field of an account or
// argument directly. Instruction-scoped argument bindings take precedence
// over global ones.
class BindingEnvironment {
public:
    void bind_argument(const std::string& name, ArgumentValue value);
    void bind_argument(const std::string& instruction, const std::string& name, ArgumentValue value);
    void bind_account(const std::string& name, const Pubkey& key);
    void unbind_account(std::string_view name);

    [[nodiscard]] const ArgumentValue* find_argument(std::string_view instruction,
                                                     std::string_view name) const;
    [[nodiscard]] std::optional<Pubkey> find_account(std::string_view name) const;

    [[nodiscard]] bool has_account(std::string_view name) const;
    [[nodiscard]] std::size_t account_count() const { return accounts_.size(); }
    [[nodiscard]] const std::map<std::string, Pubkey, std::less<>>& accounts() const { return accounts_; }

    void clear();

private:
    std::map<std::string, ArgumentValue, std::less<>> arguments_;
    std::map<std::pair<std::string, std::string>, ArgumentValue> scoped_arguments_;
    std::map<std::string, Pubkey, std::less<>> accounts_;
};

// ============================================================================
// Derived Address
// ============================================================================

struct DerivedAddress {
    Pubkey address;
    nonce_t nonce = 0;

    bool operator==(const DerivedAddress&) const = default;
};

// ============================================================================
// Suite Context - explicit registry passed by reference through assembly
// ============================================================================

class SuiteContext {
public:
    explicit SuiteContext(std::string label);

    [[nodiscard]] const std::string& label() const { return label_; }

    [[nodiscard]] BindingEnvironment& bindings() { return bindings_; }
    [[nodiscard]] const BindingEnvironment& bindings() const { return bindings_; }

    // Register a keypair-backed account (signer, wallet, well-known program)
    void register_account(const std::string& name, const Pubkey& key);

    // Record a resolved derived address; it also becomes bindable as an account seed
    void register_derived(const std::string& account, const DerivedAddress& derived);

    [[nodiscard]] std::optional<DerivedAddress> find_derived(std::string_view account) const;
    [[nodiscard]] const std::map<std::string, DerivedAddress, std::less<>>& derived_addresses() const {
        return derived_;
    }

    // Forget derived addresses. Their names fall back to the registered
    // account key, or become unbound when there is none.
    void clear_derived();

private:
    std::string label_;
    BindingEnvironment bindings_;
    std::map<std::string, Pubkey, std::less<>> accounts_;
    std::map<std::string, DerivedAddress, std::less<>> derived_;
};

}  // namespace suitegen
