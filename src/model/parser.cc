#include "parser.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <charconv>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace suitegen {

namespace {

using rapidjson::Value;

// Raised while walking the document; converted to a Failure at the boundary
class SchemaError : public std::runtime_error {
public:
    SchemaError(std::string where, const std::string& what)
        : std::runtime_error(what), where_(std::move(where)) {}

    [[nodiscard]] const std::string& where() const { return where_; }

private:
    std::string where_;
};

const Value* member(const Value& obj, const char* key) {
    if (!obj.IsObject()) return nullptr;
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || it->value.IsNull()) return nullptr;
    return &it->value;
}

// First present key among the aliases
const Value* member_any(const Value& obj, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (const Value* v = member(obj, key)) return v;
    }
    return nullptr;
}

std::string require_string(const Value& obj, const char* key, const std::string& where) {
    const Value* v = member(obj, key);
    if (!v || !v->IsString()) {
        throw SchemaError(where, std::string("missing or non-string \"") + key + "\"");
    }
    std::string s(v->GetString(), v->GetStringLength());
    if (s.empty()) {
        throw SchemaError(where, std::string("empty \"") + key + "\"");
    }
    return s;
}

bool read_flag(const Value& obj, std::initializer_list<const char*> keys, const std::string& where) {
    const Value* v = member_any(obj, keys);
    if (!v) return false;
    if (!v->IsBool()) {
        throw SchemaError(where, std::string("flag \"") + *keys.begin() + "\" is not a boolean");
    }
    return v->GetBool();
}

std::vector<std::string> read_docs(const Value& obj) {
    std::vector<std::string> docs;
    const Value* v = member(obj, "docs");
    if (!v) return docs;
    if (v->IsString()) {
        docs.emplace_back(v->GetString(), v->GetStringLength());
    } else if (v->IsArray()) {
        for (const auto& line : v->GetArray()) {
            if (line.IsString()) docs.emplace_back(line.GetString(), line.GetStringLength());
        }
    }
    return docs;
}

std::optional<Pubkey> read_pubkey(const Value& v, const std::string& where) {
    if (!v.IsString()) {
        throw SchemaError(where, "public key is not a string");
    }
    auto key = Pubkey::from_base58(std::string_view(v.GetString(), v.GetStringLength()));
    if (!key) {
        throw SchemaError(where, std::string("invalid base58 public key \"") + v.GetString() + "\"");
    }
    return key;
}

// Numeric bound given either as a JSON integer or as a decimal string
std::int64_t read_bound(const Value& v, const std::string& where) {
    if (v.IsInt64()) return v.GetInt64();
    if (v.IsUint64()) {
        throw SchemaError(where, "bound exceeds signed 64-bit range");
    }
    if (v.IsString()) {
        std::int64_t out = 0;
        const char* begin = v.GetString();
        const char* end = begin + v.GetStringLength();
        auto [ptr, ec] = std::from_chars(begin, end, out);
        if (ec == std::errc() && ptr == end) return out;
    }
    throw SchemaError(where, "bound is not an integer");
}

std::uint32_t read_length(const Value& v, const std::string& where) {
    if (!v.IsUint()) {
        throw SchemaError(where, "length is not a non-negative integer");
    }
    return v.GetUint();
}

// ============================================================================
// Types
// ============================================================================

std::vector<TypeDefinition> read_types(const Value& root) {
    std::vector<TypeDefinition> types;
    const Value* list = member(root, "types");
    if (!list) return types;
    if (!list->IsArray()) throw SchemaError("types", "not an array");

    for (const auto& entry : list->GetArray()) {
        TypeDefinition def;
        def.name = require_string(entry, "name", "types");
        std::string where = "types." + def.name;

        const Value* body = member(entry, "type");
        const Value& shape = body ? *body : entry;
        const Value* kind = member(shape, "kind");
        std::string kind_text = kind && kind->IsString() ? kind->GetString() : "struct";

        if (kind_text == "enum") {
            def.kind = CompositeKind::ENUM;
            const Value* variants = member(shape, "variants");
            if (!variants || !variants->IsArray()) throw SchemaError(where, "enum without variants");
            for (const auto& variant : variants->GetArray()) {
                if (variant.IsString()) {
                    def.members.emplace_back(variant.GetString(), variant.GetStringLength());
                } else {
                    def.members.push_back(require_string(variant, "name", where));
                }
            }
        } else if (kind_text == "struct") {
            def.kind = CompositeKind::STRUCT;
            if (const Value* fields = member(shape, "fields"); fields && fields->IsArray()) {
                for (const auto& field : fields->GetArray()) {
                    if (field.IsString()) {
                        def.members.emplace_back(field.GetString(), field.GetStringLength());
                    } else {
                        def.members.push_back(require_string(field, "name", where));
                    }
                }
            }
        } else {
            throw SchemaError(where, "unknown type kind \"" + kind_text + "\"");
        }
        types.push_back(std::move(def));
    }
    return types;
}

DataType read_type(const Value& v, const std::vector<TypeDefinition>& types, const std::string& where) {
    if (v.IsString()) {
        auto parsed = parse_type_name(std::string_view(v.GetString(), v.GetStringLength()));
        if (!parsed) throw SchemaError(where, "empty type name");
        return *parsed;
    }
    if (!v.IsObject()) throw SchemaError(where, "type is neither a name nor an object");

    DataType t;
    t.kind = DataKind::COMPOSITE;

    if (const Value* inner = member(v, "vec")) {
        DataType element = read_type(*inner, types, where);
        t.composite = element.kind == DataKind::UNSIGNED_INTEGER && element.width_bits == 8
                          ? CompositeKind::BYTES
                          : CompositeKind::VEC;
        t.name = "Vec<" + element.name + ">";
        return t;
    }
    if (const Value* inner = member(v, "option")) {
        DataType element = read_type(*inner, types, where);
        t.composite = CompositeKind::OPTION;
        t.name = "Option<" + element.name + ">";
        return t;
    }
    if (const Value* inner = member(v, "array")) {
        if (!inner->IsArray() || inner->Size() != 2 || !(*inner)[1].IsUint()) {
            throw SchemaError(where, "array type must be [element, length]");
        }
        DataType element = read_type((*inner)[0u], types, where);
        t.composite = CompositeKind::ARRAY;
        t.array_length = (*inner)[1].GetUint();
        t.name = "[" + element.name + "; " + std::to_string(t.array_length) + "]";
        return t;
    }
    if (const Value* inner = member(v, "defined")) {
        std::string name;
        if (inner->IsString()) {
            name.assign(inner->GetString(), inner->GetStringLength());
        } else {
            name = require_string(*inner, "name", where);
        }
        t.name = name;
        t.composite = CompositeKind::STRUCT;
        for (const auto& def : types) {
            if (def.name != name) continue;
            t.composite = def.kind;
            if (def.kind == CompositeKind::ENUM) t.variants = def.members;
            return t;
        }
        throw SchemaError(where, "undefined type \"" + name + "\"");
    }
    throw SchemaError(where, "unrecognized type object");
}

// ============================================================================
// Arguments and Constraints
// ============================================================================

ArgumentConstraints read_constraints(const Value& v, const std::string& where) {
    ArgumentConstraints c;
    if (!v.IsObject()) throw SchemaError(where, "constraints is not an object");

    if (const Value* x = member(v, "min")) c.min = read_bound(*x, where + ".min");
    if (const Value* x = member(v, "max")) c.max = read_bound(*x, where + ".max");
    if (const Value* x = member(v, "nonzero")) {
        if (!x->IsBool()) throw SchemaError(where, "nonzero is not a boolean");
        c.nonzero = x->GetBool();
    }
    if (const Value* x = member_any(v, {"minLength", "min_length"})) {
        c.min_length = read_length(*x, where + ".minLength");
    }
    if (const Value* x = member_any(v, {"maxLength", "max_length"})) {
        c.max_length = read_length(*x, where + ".maxLength");
    }
    if (c.min && c.max && *c.min > *c.max) {
        throw SchemaError(where, "min exceeds max");
    }
    if (c.min_length && c.max_length && *c.min_length > *c.max_length) {
        throw SchemaError(where, "minLength exceeds maxLength");
    }

    if (const Value* errors = member(v, "errors")) {
        if (!errors->IsObject()) throw SchemaError(where, "errors is not an object");
        for (auto it = errors->MemberBegin(); it != errors->MemberEnd(); ++it) {
            if (!it->value.IsString()) throw SchemaError(where, "error reference is not a string");
            c.errors.emplace(std::string(it->name.GetString(), it->name.GetStringLength()),
                             std::string(it->value.GetString(), it->value.GetStringLength()));
        }
    }
    return c;
}

// Declared value bounds must be representable in the argument's integer type
void check_integer_bounds(const DataType& type, const ArgumentConstraints& c, const std::string& where) {
    std::int64_t lo = std::numeric_limits<std::int64_t>::min();
    std::int64_t hi = std::numeric_limits<std::int64_t>::max();
    if (type.kind == DataKind::UNSIGNED_INTEGER) {
        lo = 0;
        if (type.width_bits < 64) hi = (std::int64_t{1} << type.width_bits) - 1;
    } else if (type.width_bits < 64) {
        lo = -(std::int64_t{1} << (type.width_bits - 1));
        hi = (std::int64_t{1} << (type.width_bits - 1)) - 1;
    }

    auto check = [&](const std::optional<std::int64_t>& bound, const char* key) {
        if (bound && (*bound < lo || *bound > hi)) {
            throw SchemaError(where + "." + key,
                              "bound " + std::to_string(*bound) + " is outside the range of " + type.name);
        }
    };
    check(c.min, "min");
    check(c.max, "max");
}

ArgumentSpec read_argument(const Value& v, const std::vector<TypeDefinition>& types,
                           const std::string& instruction) {
    ArgumentSpec arg;
    arg.name = require_string(v, "name", instruction + ".args");
    std::string where = instruction + ".args." + arg.name;

    const Value* type = member_any(v, {"dataType", "type"});
    if (!type) throw SchemaError(where, "missing type");
    arg.type = read_type(*type, types, where);

    if (const Value* c = member(v, "constraints")) {
        arg.constraints = read_constraints(*c, where + ".constraints");
        if (arg.type.is_integer()) {
            check_integer_bounds(arg.type, arg.constraints, where + ".constraints");
        }
    }
    arg.docs = read_docs(v);
    return arg;
}

// ============================================================================
// Accounts and Derived Addresses
// ============================================================================

SeedSource read_seed(const Value& v, const std::string& where) {
    std::string kind = require_string(v, "kind", where);

    if (kind == "literal" || kind == "const") {
        const Value* value = member(v, "value");
        if (!value) throw SchemaError(where, "literal seed without value");
        if (value->IsString()) {
            return SeedSource::from_literal(std::string_view(value->GetString(), value->GetStringLength()));
        }
        if (value->IsArray()) {
            SeedSource seed;
            seed.kind = SeedKind::LITERAL;
            for (const auto& b : value->GetArray()) {
                if (!b.IsUint() || b.GetUint() > 0xFF) throw SchemaError(where, "literal byte out of range");
                seed.literal.push_back(static_cast<std::uint8_t>(b.GetUint()));
            }
            return seed;
        }
        throw SchemaError(where, "literal value must be a string or byte array");
    }
    if (kind == "arg") {
        return SeedSource::from_argument(require_string(v, "path", where));
    }
    if (kind == "account") {
        return SeedSource::from_account(require_string(v, "path", where));
    }
    throw SchemaError(where, "unknown seed kind \"" + kind + "\"");
}

DerivedAddressSpec read_derived(const Value& v, const std::string& where) {
    DerivedAddressSpec spec;
    const Value* seeds = member(v, "seeds");
    if (!seeds || !seeds->IsArray()) throw SchemaError(where, "derived address without seeds array");
    for (const auto& seed : seeds->GetArray()) {
        spec.seeds.push_back(read_seed(seed, where + ".seeds"));
    }

    if (const Value* program = member_any(v, {"owningProgram", "program"})) {
        // Anchor nests the program id as {"kind": "const", "value": ...}
        if (program->IsObject()) {
            const Value* value = member(*program, "value");
            if (!value) throw SchemaError(where, "owning program without value");
            if (value->IsArray()) {
                SeedSource bytes = read_seed(*program, where + ".program");
                auto key = Pubkey::from_bytes(bytes.literal);
                if (!key) throw SchemaError(where, "owning program is not 32 bytes");
                spec.owning_program = *key;
            } else {
                spec.owning_program = read_pubkey(*value, where + ".program");
            }
        } else {
            spec.owning_program = read_pubkey(*program, where + ".program");
        }
    }
    return spec;
}

AccountUsage read_account(const Value& v, const std::string& instruction) {
    AccountUsage acc;
    acc.name = require_string(v, "name", instruction + ".accounts");
    acc.canonical_key = acc.name;
    std::string where = instruction + ".accounts." + acc.name;

    acc.is_mut = read_flag(v, {"isMut", "writable"}, where);
    acc.is_signer = read_flag(v, {"isSigner", "signer"}, where);
    acc.is_optional = read_flag(v, {"isOptional", "optional"}, where);
    acc.docs = read_docs(v);

    if (const Value* rel = member(v, "relations")) {
        if (!rel->IsArray()) throw SchemaError(where, "relations is not an array");
        for (const auto& r : rel->GetArray()) {
            if (!r.IsString()) throw SchemaError(where, "relation is not a string");
            acc.relations.emplace_back(r.GetString(), r.GetStringLength());
        }
    }
    if (const Value* d = member_any(v, {"derivedAddress", "pda"})) {
        acc.derived = read_derived(*d, where);
    }
    if (const Value* a = member(v, "address")) {
        acc.fixed_address = read_pubkey(*a, where + ".address");
    }
    return acc;
}

InstructionSpec read_instruction(const Value& v, const std::vector<TypeDefinition>& types) {
    InstructionSpec instruction;
    instruction.name = require_string(v, "name", "instructions");
    const std::string& where = instruction.name;
    instruction.docs = read_docs(v);

    if (const Value* args = member(v, "args")) {
        if (!args->IsArray()) throw SchemaError(where, "args is not an array");
        std::unordered_set<std::string> seen;
        for (const auto& a : args->GetArray()) {
            auto arg = read_argument(a, types, where);
            if (!seen.insert(arg.name).second) {
                throw SchemaError(where, "duplicate argument \"" + arg.name + "\"");
            }
            instruction.args.push_back(std::move(arg));
        }
    }

    if (const Value* accounts = member(v, "accounts")) {
        if (!accounts->IsArray()) throw SchemaError(where, "accounts is not an array");
        std::unordered_set<std::string> seen;
        for (const auto& a : accounts->GetArray()) {
            auto acc = read_account(a, where);
            if (!seen.insert(acc.name).second) {
                throw SchemaError(where, "duplicate account \"" + acc.name + "\"");
            }
            instruction.accounts.push_back(std::move(acc));
        }
    }
    return instruction;
}

std::vector<ErrorSpec> read_errors(const Value& root) {
    std::vector<ErrorSpec> errors;
    const Value* list = member(root, "errors");
    if (!list) return errors;
    if (!list->IsArray()) throw SchemaError("errors", "not an array");

    for (const auto& e : list->GetArray()) {
        ErrorSpec spec;
        spec.name = require_string(e, "name", "errors");
        const Value* code = member(e, "code");
        if (!code || !code->IsUint()) throw SchemaError("errors." + spec.name, "missing numeric code");
        spec.code = code->GetUint();
        if (const Value* msg = member_any(e, {"message", "msg"}); msg && msg->IsString()) {
            spec.message.assign(msg->GetString(), msg->GetStringLength());
        }
        errors.push_back(std::move(spec));
    }
    return errors;
}

InterfaceModel read_model(const Value& root) {
    if (!root.IsObject()) throw SchemaError("$", "schema root is not an object");

    InterfaceModel model;
    const Value* metadata = member(root, "metadata");

    if (const Value* name = member(root, "name"); name && name->IsString()) {
        model.program_name.assign(name->GetString(), name->GetStringLength());
    } else if (metadata) {
        model.program_name = require_string(*metadata, "name", "metadata");
    } else {
        throw SchemaError("$", "missing program name");
    }

    if (const Value* version = member(root, "version"); version && version->IsString()) {
        model.version = version->GetString();
    } else if (metadata) {
        if (const Value* mv = member(*metadata, "version"); mv && mv->IsString()) {
            model.version = mv->GetString();
        }
    }

    if (const Value* id = member_any(root, {"programId", "address"})) {
        model.program_id = read_pubkey(*id, "programId");
    }

    model.types = read_types(root);
    model.errors = read_errors(root);

    const Value* instructions = member(root, "instructions");
    if (!instructions || !instructions->IsArray()) {
        throw SchemaError("$", "missing instructions array");
    }
    std::unordered_set<std::string> seen;
    for (const auto& entry : instructions->GetArray()) {
        auto instruction = read_instruction(entry, model.types);
        if (!seen.insert(instruction.name).second) {
            throw SchemaError("instructions", "duplicate instruction \"" + instruction.name + "\"");
        }
        model.instructions.push_back(std::move(instruction));
    }
    return model;
}

ParseResult parse_failure(std::string name, std::string detail) {
    ParseResult result;
    result.failure.code = ErrorCode::PARSE_ERROR;
    result.failure.names.push_back(std::move(name));
    result.failure.detail = std::move(detail);
    log::model.error() << "Schema rejected at " << result.failure.names.front() << ": "
                       << result.failure.detail;
    return result;
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

std::optional<DataType> parse_type_name(std::string_view text) {
    if (text.empty()) return std::nullopt;

    if (text == "string" || text == "String") return DataType::string_type();
    if (text == "bool") return DataType::boolean();
    if (text == "pubkey" || text == "publicKey" || text == "Pubkey") return DataType::public_key();

    if (text == "bytes") {
        DataType t;
        t.kind = DataKind::COMPOSITE;
        t.composite = CompositeKind::BYTES;
        t.name = "bytes";
        return t;
    }

    if (text.size() >= 2 && (text[0] == 'u' || text[0] == 'i')) {
        std::uint16_t width = 0;
        auto [ptr, ec] = std::from_chars(text.data() + 1, text.data() + text.size(), width);
        if (ec == std::errc() && ptr == text.data() + text.size() &&
            (width == 8 || width == 16 || width == 32 || width == 64 || width == 128)) {
            return text[0] == 'u' ? DataType::unsigned_int(width) : DataType::signed_int(width);
        }
    }

    DataType t;
    t.kind = DataKind::UNSUPPORTED;
    t.name = std::string(text);
    return t;
}

ParseResult parse_interface(std::string_view json_text) {
    rapidjson::Document doc;
    doc.Parse(json_text.data(), json_text.size());
    if (doc.HasParseError()) {
        return parse_failure("$", std::string("malformed JSON at offset ") +
                                      std::to_string(doc.GetErrorOffset()) + ": " +
                                      rapidjson::GetParseError_En(doc.GetParseError()));
    }

    ParseResult result;
    try {
        result.model = read_model(doc);
    } catch (const SchemaError& e) {
        return parse_failure(e.where(), e.what());
    }

    result.model->source_digest = sha256(json_text);

    SUITEGEN_LOG_DEBUG(log::model) << "Parsed schema " << result.model->program_name << " with "
                                   << result.model->instructions.size() << " instructions";
    return result;
}

ParseResult parse_interface_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return parse_failure(path, "cannot open schema file");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_interface(buffer.str());
}

}  // namespace suitegen
