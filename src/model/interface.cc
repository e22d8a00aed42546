#include "interface.hh"
#include <algorithm>

namespace suitegen {

std::string_view data_kind_name(DataKind kind) {
    switch (kind) {
        case DataKind::STRING: return "string";
        case DataKind::UNSIGNED_INTEGER: return "unsigned_integer";
        case DataKind::SIGNED_INTEGER: return "signed_integer";
        case DataKind::BOOLEAN: return "boolean";
        case DataKind::PUBLIC_KEY: return "public_key";
        case DataKind::COMPOSITE: return "composite";
        case DataKind::UNSUPPORTED: return "unsupported";
    }
    return "unknown";
}

std::string_view seed_kind_name(SeedKind kind) {
    switch (kind) {
        case SeedKind::LITERAL: return "literal";
        case SeedKind::ARGUMENT: return "arg";
        case SeedKind::ACCOUNT: return "account";
    }
    return "unknown";
}

// ============================================================================
// DataType Factories
// ============================================================================

DataType DataType::string_type() {
    DataType t;
    t.kind = DataKind::STRING;
    t.name = "string";
    return t;
}

DataType DataType::unsigned_int(std::uint16_t width) {
    DataType t;
    t.kind = DataKind::UNSIGNED_INTEGER;
    t.width_bits = width;
    t.name = "u" + std::to_string(width);
    return t;
}

DataType DataType::signed_int(std::uint16_t width) {
    DataType t;
    t.kind = DataKind::SIGNED_INTEGER;
    t.width_bits = width;
    t.name = "i" + std::to_string(width);
    return t;
}

DataType DataType::boolean() {
    DataType t;
    t.kind = DataKind::BOOLEAN;
    t.name = "bool";
    return t;
}

DataType DataType::public_key() {
    DataType t;
    t.kind = DataKind::PUBLIC_KEY;
    t.name = "pubkey";
    return t;
}

// ============================================================================
// SeedSource
// ============================================================================

std::string SeedSource::root() const {
    auto pos = path.find('.');
    return pos == std::string::npos ? path : path.substr(0, pos);
}

SeedSource SeedSource::from_literal(std::string_view text) {
    SeedSource seed;
    seed.kind = SeedKind::LITERAL;
    seed.literal.assign(text.begin(), text.end());
    return seed;
}

SeedSource SeedSource::from_argument(std::string name) {
    SeedSource seed;
    seed.kind = SeedKind::ARGUMENT;
    seed.path = std::move(name);
    return seed;
}

SeedSource SeedSource::from_account(std::string name) {
    SeedSource seed;
    seed.kind = SeedKind::ACCOUNT;
    seed.path = std::move(name);
    return seed;
}

// ============================================================================
// Lookups
// ============================================================================

const ArgumentSpec* InstructionSpec::find_argument(std::string_view arg_name) const {
    auto it = std::find_if(args.begin(), args.end(),
                           [arg_name](const ArgumentSpec& a) { return a.name == arg_name; });
    return it == args.end() ? nullptr : &*it;
}

const AccountUsage* InstructionSpec::find_account(std::string_view account_name) const {
    auto it = std::find_if(accounts.begin(), accounts.end(),
                           [account_name](const AccountUsage& a) { return a.name == account_name; });
    return it == accounts.end() ? nullptr : &*it;
}

const InstructionSpec* InterfaceModel::find_instruction(std::string_view name) const {
    auto it = std::find_if(instructions.begin(), instructions.end(),
                           [name](const InstructionSpec& i) { return i.name == name; });
    return it == instructions.end() ? nullptr : &*it;
}

const ErrorSpec* InterfaceModel::find_error(std::string_view name) const {
    auto it = std::find_if(errors.begin(), errors.end(),
                           [name](const ErrorSpec& e) { return e.name == name; });
    return it == errors.end() ? nullptr : &*it;
}

const TypeDefinition* InterfaceModel::find_type(std::string_view name) const {
    auto it = std::find_if(types.begin(), types.end(),
                           [name](const TypeDefinition& t) { return t.name == name; });
    return it == types.end() ? nullptr : &*it;
}

std::vector<std::string> InterfaceModel::instruction_names() const {
    std::vector<std::string> names;
    names.reserve(instructions.size());
    for (const auto& instruction : instructions) {
        names.push_back(instruction.name);
    }
    return names;
}

}  // namespace suitegen
