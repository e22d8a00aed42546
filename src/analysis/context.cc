#include "context.hh"
#include "core/logging.hh"

namespace suitegen {

// ============================================================================
// ArgumentValue
// ============================================================================

ArgumentValue ArgumentValue::from_string(std::string value) {
    ArgumentValue v;
    v.kind = DataKind::STRING;
    v.text = std::move(value);
    return v;
}

ArgumentValue ArgumentValue::from_unsigned(std::uint64_t value) {
    ArgumentValue v;
    v.kind = DataKind::UNSIGNED_INTEGER;
    v.unsigned_value = value;
    return v;
}

ArgumentValue ArgumentValue::from_signed(std::int64_t value) {
    ArgumentValue v;
    v.kind = DataKind::SIGNED_INTEGER;
    v.signed_value = value;
    return v;
}

ArgumentValue ArgumentValue::from_bool(bool value) {
    ArgumentValue v;
    v.kind = DataKind::BOOLEAN;
    v.flag = value;
    return v;
}

ArgumentValue ArgumentValue::from_pubkey(const Pubkey& value) {
    ArgumentValue v;
    v.kind = DataKind::PUBLIC_KEY;
    v.key = value;
    return v;
}

ArgumentValue ArgumentValue::from_bytes(bytes_t value) {
    ArgumentValue v;
    v.kind = DataKind::COMPOSITE;
    v.raw = std::move(value);
    return v;
}

std::string ArgumentValue::to_string() const {
    switch (kind) {
        case DataKind::STRING: return text;
        case DataKind::UNSIGNED_INTEGER: return std::to_string(unsigned_value);
        case DataKind::SIGNED_INTEGER: return std::to_string(signed_value);
        case DataKind::BOOLEAN: return flag ? "true" : "false";
        case DataKind::PUBLIC_KEY: return key.to_base58();
        case DataKind::COMPOSITE:
        case DataKind::UNSUPPORTED:
            return "0x" + bytes_to_hex(raw);
    }
    return {};
}

// ============================================================================
// BindingEnvironment
// ============================================================================

void BindingEnvironment::bind_argument(const std::string& name, ArgumentValue value) {
    arguments_.insert_or_assign(name, std::move(value));
}

void BindingEnvironment::bind_argument(const std::string& instruction, const std::string& name,
                                       ArgumentValue value) {
    scoped_arguments_.insert_or_assign(std::make_pair(instruction, name), std::move(value));
}

void BindingEnvironment::bind_account(const std::string& name, const Pubkey& key) {
    accounts_.insert_or_assign(name, key);
}

void BindingEnvironment::unbind_account(std::string_view name) {
    auto it = accounts_.find(name);
    if (it != accounts_.end()) {
        accounts_.erase(it);
    }
}

const ArgumentValue* BindingEnvironment::find_argument(std::string_view instruction,
                                                       std::string_view name) const {
    if (!scoped_arguments_.empty()) {
        auto scoped = scoped_arguments_.find(std::make_pair(std::string(instruction), std::string(name)));
        if (scoped != scoped_arguments_.end()) {
            return &scoped->second;
        }
    }
    auto it = arguments_.find(name);
    return it == arguments_.end() ? nullptr : &it->second;
}

std::optional<Pubkey> BindingEnvironment::find_account(std::string_view name) const {
    auto it = accounts_.find(name);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool BindingEnvironment::has_account(std::string_view name) const {
    return accounts_.find(name) != accounts_.end();
}

void BindingEnvironment::clear() {
    arguments_.clear();
    scoped_arguments_.clear();
    accounts_.clear();
}

// ============================================================================
// SuiteContext
// ============================================================================

SuiteContext::SuiteContext(std::string label) : label_(std::move(label)) {}

void SuiteContext::register_account(const std::string& name, const Pubkey& key) {
    accounts_.insert_or_assign(name, key);
    bindings_.bind_account(name, key);
    SUITEGEN_LOG_DEBUG(log::analysis) << "[" << label_ << "] account " << name << " = "
                                      << key.to_base58();
}

void SuiteContext::register_derived(const std::string& account, const DerivedAddress& derived) {
    derived_.insert_or_assign(account, derived);
    bindings_.bind_account(account, derived.address);
    SUITEGEN_LOG_DEBUG(log::analysis) << "[" << label_ << "] derived " << account << " = "
                                      << derived.address.to_base58() << " nonce "
                                      << static_cast<int>(derived.nonce);
}

std::optional<DerivedAddress> SuiteContext::find_derived(std::string_view account) const {
    auto it = derived_.find(account);
    if (it == derived_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void SuiteContext::clear_derived() {
    for (const auto& [name, derived] : derived_) {
        auto it = accounts_.find(name);
        if (it != accounts_.end()) {
            bindings_.bind_account(name, it->second);
        } else {
            bindings_.unbind_account(name);
        }
    }
    derived_.clear();
}

}  // namespace suitegen
