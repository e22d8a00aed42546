#include <gtest/gtest.h>
#include "crypto/hash.hh"
#include "model/parser.hh"
#include "schemas.hh"
#include <cstdio>
#include <fstream>

using namespace suitegen;

namespace {

InterfaceModel parse_ok(std::string_view json) {
    auto result = parse_interface(json);
    EXPECT_TRUE(result.ok()) << result.failure.to_string();
    return result.ok() ? *result.model : InterfaceModel{};
}

Failure parse_fail(std::string_view json) {
    auto result = parse_interface(json);
    EXPECT_FALSE(result.ok());
    return result.failure;
}

}  // namespace

// ============================================================================
// Type Name Tests
// ============================================================================

TEST(TypeNameTest, Primitives) {
    EXPECT_EQ(parse_type_name("string")->kind, DataKind::STRING);
    EXPECT_EQ(parse_type_name("bool")->kind, DataKind::BOOLEAN);
    EXPECT_EQ(parse_type_name("pubkey")->kind, DataKind::PUBLIC_KEY);
    EXPECT_EQ(parse_type_name("publicKey")->kind, DataKind::PUBLIC_KEY);

    auto u64 = parse_type_name("u64");
    ASSERT_TRUE(u64.has_value());
    EXPECT_EQ(u64->kind, DataKind::UNSIGNED_INTEGER);
    EXPECT_EQ(u64->width_bits, 64);
    EXPECT_EQ(u64->name, "u64");

    auto i16 = parse_type_name("i16");
    ASSERT_TRUE(i16.has_value());
    EXPECT_EQ(i16->kind, DataKind::SIGNED_INTEGER);
    EXPECT_EQ(i16->width_bits, 16);
}

TEST(TypeNameTest, BytesIsComposite) {
    auto bytes = parse_type_name("bytes");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(bytes->kind, DataKind::COMPOSITE);
    EXPECT_EQ(bytes->composite, CompositeKind::BYTES);
}

TEST(TypeNameTest, UnknownNamesAreUnsupported) {
    EXPECT_EQ(parse_type_name("f64")->kind, DataKind::UNSUPPORTED);
    EXPECT_EQ(parse_type_name("u12")->kind, DataKind::UNSUPPORTED);
    EXPECT_EQ(parse_type_name("Widget")->name, "Widget");
    EXPECT_FALSE(parse_type_name("").has_value());
}

// ============================================================================
// Schema Parsing Tests
// ============================================================================

TEST(ParserTest, JournalSchema) {
    auto model = parse_ok(fixtures::JOURNAL_SCHEMA);

    EXPECT_EQ(model.program_name, "journal");
    EXPECT_EQ(model.version, "0.1.0");
    ASSERT_TRUE(model.program_id.has_value());
    EXPECT_EQ(model.program_id->to_base58(), fixtures::PROGRAM_ID);

    ASSERT_EQ(model.instructions.size(), 2);
    EXPECT_EQ(model.instruction_names(), (std::vector<std::string>{"create_entry", "update_entry"}));

    const InstructionSpec* create = model.find_instruction("create_entry");
    ASSERT_NE(create, nullptr);
    ASSERT_EQ(create->args.size(), 2);
    EXPECT_EQ(create->args[0].name, "title");
    EXPECT_EQ(create->args[0].type.kind, DataKind::STRING);
    ASSERT_EQ(create->accounts.size(), 3);

    const AccountUsage* entry = create->find_account("journal_entry");
    ASSERT_NE(entry, nullptr);
    EXPECT_TRUE(entry->is_mut);
    EXPECT_FALSE(entry->is_signer);
    EXPECT_TRUE(entry->is_derived());
    EXPECT_EQ(entry->canonical_key, "journal_entry");
    ASSERT_EQ(entry->derived->seeds.size(), 2);
    EXPECT_EQ(entry->derived->seeds[0].kind, SeedKind::ARGUMENT);
    EXPECT_EQ(entry->derived->seeds[0].path, "title");
    EXPECT_EQ(entry->derived->seeds[1].kind, SeedKind::ACCOUNT);
    EXPECT_EQ(entry->derived->seeds[1].path, "owner");
    EXPECT_FALSE(entry->derived->owning_program.has_value());

    const AccountUsage* owner = create->find_account("owner");
    ASSERT_NE(owner, nullptr);
    EXPECT_TRUE(owner->is_signer);
    EXPECT_FALSE(owner->is_derived());

    const AccountUsage* system = create->find_account("system_program");
    ASSERT_NE(system, nullptr);
    ASSERT_TRUE(system->fixed_address.has_value());
    EXPECT_TRUE(system->fixed_address->is_zero());
}

TEST(ParserTest, AnchorAliases) {
    auto model = parse_ok(fixtures::COUNTER_SCHEMA);

    EXPECT_EQ(model.program_name, "counter");
    EXPECT_EQ(model.version, "1.2.0");
    ASSERT_TRUE(model.program_id.has_value());

    const InstructionSpec* init = model.find_instruction("initialize");
    ASSERT_NE(init, nullptr);
    const AccountUsage* counter = init->find_account("counter");
    ASSERT_NE(counter, nullptr);
    EXPECT_TRUE(counter->is_mut);
    ASSERT_TRUE(counter->is_derived());
    EXPECT_EQ(counter->derived->seeds[0].kind, SeedKind::LITERAL);
    EXPECT_EQ(std::string(counter->derived->seeds[0].literal.begin(), counter->derived->seeds[0].literal.end()),
              "counter");

    const AccountUsage* authority = init->find_account("authority");
    ASSERT_NE(authority, nullptr);
    EXPECT_TRUE(authority->is_signer);
    EXPECT_TRUE(authority->is_mut);
}

TEST(ParserTest, ConstraintsAndErrors) {
    auto model = parse_ok(fixtures::COUNTER_SCHEMA);

    ASSERT_EQ(model.errors.size(), 2);
    const ErrorSpec* zero = model.find_error("ZeroAmount");
    ASSERT_NE(zero, nullptr);
    EXPECT_EQ(zero->code, 6000);
    EXPECT_EQ(zero->message, "Amount must be greater than zero");
    EXPECT_EQ(model.find_error("Missing"), nullptr);

    const ArgumentSpec* value = model.find_instruction("set")->find_argument("value");
    ASSERT_NE(value, nullptr);
    ASSERT_TRUE(value->constraints.min.has_value());
    EXPECT_EQ(*value->constraints.min, 1);
    EXPECT_FALSE(value->constraints.max.has_value());
    EXPECT_TRUE(value->constraints.nonzero);
}

TEST(ParserTest, ComplexTypes) {
    auto model = parse_ok(R"({
      "name": "shapes",
      "types": [
        {"name": "Mood", "type": {"kind": "enum", "variants": [{"name": "Happy"}, {"name": "Sad"}]}},
        {"name": "Point", "type": {"kind": "struct", "fields": [{"name": "x", "type": "i32"}]}}
      ],
      "instructions": [{
        "name": "draw",
        "args": [
          {"name": "mood", "type": {"defined": "Mood"}},
          {"name": "origin", "type": {"defined": {"name": "Point"}}},
          {"name": "data", "type": {"vec": "u8"}},
          {"name": "points", "type": {"vec": {"defined": "Point"}}},
          {"name": "label", "type": {"option": "string"}},
          {"name": "grid", "type": {"array": ["u8", 4]}}
        ],
        "accounts": []
      }]
    })");

    ASSERT_EQ(model.types.size(), 2);
    const TypeDefinition* mood_type = model.find_type("Mood");
    ASSERT_NE(mood_type, nullptr);
    EXPECT_EQ(mood_type->kind, CompositeKind::ENUM);

    const InstructionSpec* draw = model.find_instruction("draw");
    ASSERT_NE(draw, nullptr);

    const DataType& mood = draw->find_argument("mood")->type;
    EXPECT_EQ(mood.kind, DataKind::COMPOSITE);
    EXPECT_EQ(mood.composite, CompositeKind::ENUM);
    EXPECT_EQ(mood.variants, (std::vector<std::string>{"Happy", "Sad"}));

    EXPECT_EQ(draw->find_argument("origin")->type.composite, CompositeKind::STRUCT);
    EXPECT_EQ(draw->find_argument("data")->type.composite, CompositeKind::BYTES);
    EXPECT_EQ(draw->find_argument("points")->type.composite, CompositeKind::VEC);
    EXPECT_EQ(draw->find_argument("points")->type.name, "Vec<Point>");
    EXPECT_EQ(draw->find_argument("label")->type.composite, CompositeKind::OPTION);

    const DataType& grid = draw->find_argument("grid")->type;
    EXPECT_EQ(grid.composite, CompositeKind::ARRAY);
    EXPECT_EQ(grid.array_length, 4);
    EXPECT_EQ(grid.name, "[u8; 4]");
}

TEST(ParserTest, OwningProgramForms) {
    auto model = parse_ok(R"({
      "name": "owners",
      "instructions": [{
        "name": "link",
        "accounts": [
          {"name": "a", "pda": {"seeds": [{"kind": "const", "value": [1, 2, 3]}],
                                 "program": "BPFLoaderUpgradeab1e11111111111111111111111"}},
          {"name": "b", "pda": {"seeds": [{"kind": "const", "value": "b"}],
                                 "program": {"kind": "const",
                                             "value": "BPFLoaderUpgradeab1e11111111111111111111111"}}}
        ]
      }]
    })");

    const InstructionSpec* link = model.find_instruction("link");
    ASSERT_NE(link, nullptr);
    const AccountUsage* a = link->find_account("a");
    ASSERT_TRUE(a->derived->owning_program.has_value());
    EXPECT_EQ(a->derived->owning_program->to_base58(), "BPFLoaderUpgradeab1e11111111111111111111111");
    EXPECT_EQ(a->derived->seeds[0].literal, (bytes_t{1, 2, 3}));

    const AccountUsage* b = link->find_account("b");
    EXPECT_EQ(b->derived->owning_program, a->derived->owning_program);
    EXPECT_FALSE(model.program_id.has_value());
}

TEST(ParserTest, DottedSeedPath) {
    auto model = parse_ok(R"({
      "name": "paths",
      "instructions": [{
        "name": "claim",
        "accounts": [
          {"name": "vault"},
          {"name": "ticket", "pda": {"seeds": [{"kind": "account", "path": "vault.owner"}]}}
        ]
      }]
    })");

    const SeedSource& seed = model.instructions[0].accounts[1].derived->seeds[0];
    EXPECT_EQ(seed.path, "vault.owner");
    EXPECT_EQ(seed.root(), "vault");
    EXPECT_EQ(seed_kind_name(seed.kind), "account");
}

TEST(ParserTest, SourceDigest) {
    auto model = parse_ok(fixtures::VAULT_SCHEMA);
    EXPECT_EQ(model.source_digest, sha256(std::string_view(fixtures::VAULT_SCHEMA)));
}

TEST(ParserTest, ParseFile) {
    std::string path = ::testing::TempDir() + "suitegen_parser_vault.json";
    {
        std::ofstream out(path);
        out << fixtures::VAULT_SCHEMA;
    }
    auto result = parse_interface_file(path);
    std::remove(path.c_str());

    ASSERT_TRUE(result.ok()) << result.failure.to_string();
    EXPECT_EQ(result.model->program_name, "vault");
}

// ============================================================================
// Rejection Tests
// ============================================================================

TEST(ParserTest, MalformedJson) {
    Failure failure = parse_fail("{\"name\": ");
    EXPECT_EQ(failure.code, ErrorCode::PARSE_ERROR);
    ASSERT_EQ(failure.names.size(), 1);
    EXPECT_EQ(failure.names[0], "$");
}

TEST(ParserTest, MissingFileIsParseError) {
    auto result = parse_interface_file("/nonexistent/suitegen/schema.json");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.failure.code, ErrorCode::PARSE_ERROR);
}

TEST(ParserTest, MissingInstructions) {
    EXPECT_EQ(parse_fail(R"({"name": "empty"})").code, ErrorCode::PARSE_ERROR);
    EXPECT_EQ(parse_fail(R"({"instructions": []})").code, ErrorCode::PARSE_ERROR);
    EXPECT_EQ(parse_fail("[]").code, ErrorCode::PARSE_ERROR);
}

TEST(ParserTest, DuplicateNames) {
    Failure duplicate_instruction = parse_fail(R"({
      "name": "dup",
      "instructions": [{"name": "a"}, {"name": "a"}]
    })");
    EXPECT_EQ(duplicate_instruction.code, ErrorCode::PARSE_ERROR);
    EXPECT_NE(duplicate_instruction.detail.find("duplicate instruction"), std::string::npos);

    Failure duplicate_account = parse_fail(R"({
      "name": "dup",
      "instructions": [{"name": "a", "accounts": [{"name": "x"}, {"name": "x"}]}]
    })");
    EXPECT_NE(duplicate_account.detail.find("duplicate account"), std::string::npos);

    Failure duplicate_arg = parse_fail(R"({
      "name": "dup",
      "instructions": [{"name": "a", "args": [{"name": "n", "type": "u8"}, {"name": "n", "type": "u8"}]}]
    })");
    EXPECT_NE(duplicate_arg.detail.find("duplicate argument"), std::string::npos);
    ASSERT_EQ(duplicate_arg.names.size(), 1);
    EXPECT_EQ(duplicate_arg.names[0], "a");
}

TEST(ParserTest, InvalidSeeds) {
    EXPECT_EQ(parse_fail(R"({
      "name": "bad",
      "instructions": [{"name": "a", "accounts": [{"name": "p", "pda": {"seeds": [{"kind": "magic"}]}}]}]
    })").code, ErrorCode::PARSE_ERROR);

    EXPECT_EQ(parse_fail(R"({
      "name": "bad",
      "instructions": [{"name": "a", "accounts": [{"name": "p", "pda": {"seeds": [{"kind": "const", "value": [256]}]}}]}]
    })").code, ErrorCode::PARSE_ERROR);

    EXPECT_EQ(parse_fail(R"({
      "name": "bad",
      "instructions": [{"name": "a", "accounts": [{"name": "p", "pda": {"seeds": [{"kind": "arg"}]}}]}]
    })").code, ErrorCode::PARSE_ERROR);
}

TEST(ParserTest, InvalidConstraints) {
    Failure inverted = parse_fail(R"({
      "name": "bad",
      "instructions": [{"name": "a", "args": [{"name": "n", "type": "u64", "constraints": {"min": 5, "max": 2}}]}]
    })");
    EXPECT_EQ(inverted.code, ErrorCode::PARSE_ERROR);
    ASSERT_EQ(inverted.names.size(), 1);
    EXPECT_EQ(inverted.names[0], "a.args.n.constraints");

    EXPECT_EQ(parse_fail(R"({
      "name": "bad",
      "instructions": [{"name": "a", "args": [{"name": "s", "type": "string", "constraints": {"maxLength": -1}}]}]
    })").code, ErrorCode::PARSE_ERROR);
}

TEST(ParserTest, BoundsMustFitIntegerType) {
    Failure too_large = parse_fail(R"({
      "name": "bad",
      "instructions": [{"name": "a", "args": [{"name": "n", "type": "u8", "constraints": {"min": 1000}}]}]
    })");
    EXPECT_EQ(too_large.code, ErrorCode::PARSE_ERROR);
    EXPECT_EQ(too_large.names, std::vector<std::string>{"a.args.n.constraints.min"});

    Failure below_zero = parse_fail(R"({
      "name": "bad",
      "instructions": [{"name": "a", "args": [{"name": "n", "type": "u32", "constraints": {"max": -1}}]}]
    })");
    EXPECT_EQ(below_zero.names, std::vector<std::string>{"a.args.n.constraints.max"});

    Failure signed_low = parse_fail(R"({
      "name": "bad",
      "instructions": [{"name": "a", "args": [{"name": "n", "type": "i8", "constraints": {"min": -129}}]}]
    })");
    EXPECT_EQ(signed_low.names, std::vector<std::string>{"a.args.n.constraints.min"});

    auto model = parse_ok(R"({
      "name": "edges",
      "instructions": [{"name": "a", "args": [
        {"name": "n", "type": "i8", "constraints": {"min": -128, "max": 127}},
        {"name": "m", "type": "u8", "constraints": {"min": 0, "max": 255}}
      ]}]
    })");
    ASSERT_EQ(model.instructions.size(), 1);
    ASSERT_EQ(model.instructions[0].args.size(), 2);
    EXPECT_EQ(*model.instructions[0].args[1].constraints.max, 255);
}

TEST(ParserTest, BoundAsDecimalString) {
    auto model = parse_ok(R"({
      "name": "bounds",
      "instructions": [{"name": "a", "args": [
        {"name": "n", "type": "i64", "constraints": {"min": "-5", "max": "9000000000"}}
      ]}]
    })");
    const auto& c = model.instructions[0].args[0].constraints;
    EXPECT_EQ(*c.min, -5);
    EXPECT_EQ(*c.max, 9000000000LL);
}

TEST(ParserTest, UndefinedTypeReference) {
    Failure failure = parse_fail(R"({
      "name": "bad",
      "instructions": [{"name": "a", "args": [{"name": "m", "type": {"defined": "Nope"}}]}]
    })");
    EXPECT_EQ(failure.code, ErrorCode::PARSE_ERROR);
    EXPECT_NE(failure.detail.find("Nope"), std::string::npos);
}

TEST(ParserTest, InvalidProgramId) {
    Failure failure = parse_fail(R"({"name": "bad", "programId": "not-base58!", "instructions": []})");
    EXPECT_EQ(failure.code, ErrorCode::PARSE_ERROR);
    ASSERT_EQ(failure.names.size(), 1);
    EXPECT_EQ(failure.names[0], "programId");
}

TEST(ParserTest, UnsupportedTypeParsesButIsMarked) {
    auto model = parse_ok(R"({
      "name": "floats",
      "instructions": [{"name": "a", "args": [{"name": "ratio", "type": "f32"}]}]
    })");
    EXPECT_EQ(model.instructions[0].args[0].type.kind, DataKind::UNSUPPORTED);
}
