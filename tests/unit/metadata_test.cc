#include <gtest/gtest.h>
#include "assembly/metadata.hh"
#include "assembly/persistence.hh"
#include "model/parser.hh"
#include "schemas.hh"

using namespace suitegen;

namespace {

InterfaceModel load(std::string_view json) {
    auto parsed = parse_interface(json);
    EXPECT_TRUE(parsed.ok()) << parsed.failure.to_string();
    return parsed.ok() ? *parsed.model : InterfaceModel{};
}

Pubkey key(std::string_view text) {
    return Pubkey::from_base58(text).value_or(Pubkey{});
}

const char* const AUTHORITY_KEY = "EKamZ4awaZEuwjukrpVuMeWNyZdRw5wbf6VRZ18P4CkU";

}  // namespace

// ============================================================================
// Counter Assembly
// ============================================================================

class CounterAssemblyTest : public ::testing::Test {
protected:
    void SetUp() override {
        model_ = load(fixtures::COUNTER_SCHEMA);
        context_.register_account("authority", key(AUTHORITY_KEY));
        context_.bindings().bind_argument("id", ArgumentValue::from_unsigned(42));
    }

    InterfaceModel model_;
    SuiteContext context_{"default"};
};

TEST_F(CounterAssemblyTest, AssemblesHeader) {
    auto result = MetadataAssembler(model_, context_).assemble();
    ASSERT_TRUE(result.ok()) << result.failure.to_string();
    const TestSuiteMetadata& m = *result.metadata;

    EXPECT_EQ(m.program_id, fixtures::PROGRAM_ID);
    EXPECT_EQ(m.program_name, "counter");
    EXPECT_EQ(m.label, "default");
    EXPECT_EQ(m.execution_order, (std::vector<std::string>{"initialize", "set"}));
    EXPECT_EQ(m.initialization_order, (std::vector<std::string>{"authority", "counter", "system_program"}));
}

TEST_F(CounterAssemblyTest, SetupSteps) {
    auto result = MetadataAssembler(model_, context_).assemble();
    ASSERT_TRUE(result.ok());
    const auto& steps = result.metadata->setup_steps;

    ASSERT_EQ(steps.size(), 3);
    EXPECT_EQ(steps[0], (SetupStep{SetupStepKind::CREATE_KEYPAIR, "authority", "Create keypair for authority", {}}));
    EXPECT_EQ(steps[1], (SetupStep{SetupStepKind::FUND_ACCOUNT, "authority",
                                   "Fund authority with SOL for transactions", {"authority"}}));
    EXPECT_EQ(steps[2], (SetupStep{SetupStepKind::INITIALIZE_DERIVED_ADDRESS, "counter",
                                   "Initialize counter derived address", {"authority"}}));
    EXPECT_TRUE(validate_setup_flow(steps));
    EXPECT_EQ(setup_step_kind_name(steps[2].kind), "InitializeDerivedAddress");
}

TEST_F(CounterAssemblyTest, ResolvesDerivedAddress) {
    auto result = MetadataAssembler(model_, context_).assemble();
    ASSERT_TRUE(result.ok());

    const InstructionPlan* init = result.metadata->find_instruction("initialize");
    ASSERT_NE(init, nullptr);
    EXPECT_EQ(init->account_order, (std::vector<std::string>{"authority", "counter", "system_program"}));
    ASSERT_EQ(init->derived_addresses.size(), 1);

    const DerivedAddressPlan& counter = init->derived_addresses[0];
    EXPECT_EQ(counter.account, "counter");
    EXPECT_EQ(counter.seeds, (std::vector<SeedComponent>{{SeedKind::LITERAL, "counter"}, {SeedKind::ARGUMENT, "id"}}));
    EXPECT_TRUE(counter.owning_program.empty());
    EXPECT_TRUE(counter.resolved);
    EXPECT_EQ(counter.address, "GC8jHYthxMQy9LSvUeSN8hkeDA2vNexKCnkCNFmFcWMG");
    EXPECT_EQ(counter.nonce, 254);

    // The resolved address is now part of the context
    auto registered = context_.find_derived("counter");
    ASSERT_TRUE(registered.has_value());
    EXPECT_EQ(registered->address.to_base58(), counter.address);
    EXPECT_TRUE(context_.bindings().has_account("counter"));

    const InstructionPlan* set = result.metadata->find_instruction("set");
    ASSERT_NE(set, nullptr);
    EXPECT_EQ(set->account_order, (std::vector<std::string>{"authority", "counter"}));
    EXPECT_TRUE(set->derived_addresses.empty());
    EXPECT_EQ(set->test_cases.size(), 5);
    EXPECT_EQ(result.metadata->test_case_count(), 8);
}

TEST_F(CounterAssemblyTest, UnboundSeedStaysSymbolic) {
    SuiteContext bare("bare");
    auto result = MetadataAssembler(model_, bare).assemble();
    ASSERT_TRUE(result.ok()) << result.failure.to_string();

    const DerivedAddressPlan& counter = result.metadata->find_instruction("initialize")->derived_addresses[0];
    EXPECT_FALSE(counter.resolved);
    EXPECT_TRUE(counter.address.empty());
    EXPECT_FALSE(bare.find_derived("counter").has_value());
}

TEST_F(CounterAssemblyTest, ResolutionCanBeDisabled) {
    AssemblyOptions options;
    options.resolve_derived_addresses = false;
    auto result = MetadataAssembler(model_, context_, options).assemble();
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result.metadata->instructions[0].derived_addresses[0].resolved);
    EXPECT_TRUE(context_.derived_addresses().empty());
}

TEST_F(CounterAssemblyTest, RepeatedAssemblyIsIdentical) {
    MetadataAssembler assembler(model_, context_);
    auto first = assembler.assemble();
    auto second = assembler.assemble();
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());

    EXPECT_EQ(*first.metadata, *second.metadata);
    EXPECT_EQ(serialize_metadata(*first.metadata), serialize_metadata(*second.metadata));
}

// ============================================================================
// Repeated Assembly
// ============================================================================

namespace {

// "entry" is seeded by "vault", which only a later instruction derives
constexpr const char* VAULT_CHAIN_SCHEMA = R"({
  "name": "vault_chain",
  "programId": "Fg6PaFpoGXkYsidMpWTK6W2BeZ7FEfcYkg476zPFsLnS",
  "instructions": [
    {
      "name": "use_vault",
      "args": [],
      "accounts": [
        {"name": "entry", "isMut": true,
         "pda": {"seeds": [{"kind": "literal", "value": "entry"}, {"kind": "account", "path": "vault"}]}},
        {"name": "vault"}
      ]
    },
    {
      "name": "make_vault",
      "args": [],
      "accounts": [
        {"name": "vault", "isMut": true, "pda": {"seeds": [{"kind": "literal", "value": "vault"}]}}
      ]
    }
  ]
})";

const char* const VAULT_ADDRESS = "BtWhNzGgdC9aX14VfQtYQuiqvxidMSAzParX6UUXzgn2";

}  // namespace

TEST(RepeatedAssemblyTest, EarlierRunDoesNotFeedSeeds) {
    InterfaceModel model = load(VAULT_CHAIN_SCHEMA);
    SuiteContext context("default");
    MetadataAssembler assembler(model, context);

    auto first = assembler.assemble();
    auto second = assembler.assemble();
    ASSERT_TRUE(first.ok()) << first.failure.to_string();
    ASSERT_TRUE(second.ok()) << second.failure.to_string();

    const InstructionPlan* use_vault = first.metadata->find_instruction("use_vault");
    ASSERT_NE(use_vault, nullptr);
    ASSERT_EQ(use_vault->derived_addresses.size(), 1);
    EXPECT_EQ(use_vault->derived_addresses[0].account, "entry");
    EXPECT_FALSE(use_vault->derived_addresses[0].resolved);

    EXPECT_EQ(*first.metadata, *second.metadata);
    EXPECT_EQ(serialize_metadata(*first.metadata), serialize_metadata(*second.metadata));

    auto vault = context.find_derived("vault");
    ASSERT_TRUE(vault.has_value());
    EXPECT_EQ(vault->address.to_base58(), VAULT_ADDRESS);
}

TEST(RepeatedAssemblyTest, SameRunChainsDerivedSeeds) {
    InterfaceModel model = load(VAULT_CHAIN_SCHEMA);
    SuiteContext context("default");
    MetadataAssembler assembler(model, context);

    auto first = assembler.assemble({"make_vault", "use_vault"});
    auto second = assembler.assemble({"make_vault", "use_vault"});
    ASSERT_TRUE(first.ok()) << first.failure.to_string();
    ASSERT_TRUE(second.ok());

    const InstructionPlan* use_vault = first.metadata->find_instruction("use_vault");
    ASSERT_NE(use_vault, nullptr);
    EXPECT_TRUE(use_vault->derived_addresses[0].resolved);
    EXPECT_EQ(*first.metadata, *second.metadata);
}

TEST(RepeatedAssemblyTest, RegisteredAccountSurvivesDerivedOverride) {
    InterfaceModel model = load(VAULT_CHAIN_SCHEMA);
    SuiteContext context("default");
    context.register_account("vault", key(fixtures::VAULT_OWNER));
    MetadataAssembler assembler(model, context);

    auto first = assembler.assemble();
    ASSERT_TRUE(first.ok()) << first.failure.to_string();
    EXPECT_EQ(context.bindings().find_account("vault"), key(VAULT_ADDRESS));

    auto second = assembler.assemble();
    ASSERT_TRUE(second.ok());
    EXPECT_TRUE(first.metadata->instructions[0].derived_addresses[0].resolved);
    EXPECT_EQ(*first.metadata, *second.metadata);

    context.clear_derived();
    EXPECT_EQ(context.bindings().find_account("vault"), key(fixtures::VAULT_OWNER));
    EXPECT_FALSE(context.find_derived("vault").has_value());
}

TEST_F(CounterAssemblyTest, ExplicitExecutionOrder) {
    auto result = MetadataAssembler(model_, context_).assemble({"set"});
    ASSERT_TRUE(result.ok());
    const TestSuiteMetadata& m = *result.metadata;

    EXPECT_EQ(m.execution_order, std::vector<std::string>{"set"});
    EXPECT_EQ(m.initialization_order, (std::vector<std::string>{"authority", "counter"}));
    ASSERT_EQ(m.instructions.size(), 1);
    EXPECT_EQ(m.instructions[0].name, "set");

    // counter is not derived in "set", so only the signer needs setup
    ASSERT_EQ(m.setup_steps.size(), 2);
    EXPECT_EQ(m.setup_steps[1].kind, SetupStepKind::FUND_ACCOUNT);
}

TEST_F(CounterAssemblyTest, RepeatedNamesArePlannedOnce) {
    auto result = MetadataAssembler(model_, context_).assemble({"set", "set", "initialize"});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.metadata->execution_order.size(), 3);
    ASSERT_EQ(result.metadata->instructions.size(), 2);
    EXPECT_EQ(result.metadata->instructions[0].name, "set");
    EXPECT_EQ(result.metadata->instructions[1].name, "initialize");
}

TEST_F(CounterAssemblyTest, UnknownInstruction) {
    auto result = MetadataAssembler(model_, context_).assemble({"initialize", "bogus"});
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.failure.code, ErrorCode::UNKNOWN_INSTRUCTION);
    EXPECT_EQ(result.failure.names, std::vector<std::string>{"bogus"});
    EXPECT_TRUE(context_.derived_addresses().empty());
}

TEST_F(CounterAssemblyTest, HeaderAndInstructionsMatchFullAssembly) {
    MetadataAssembler assembler(model_, context_);
    auto full = assembler.assemble();
    ASSERT_TRUE(full.ok());

    auto header = assembler.assemble_header();
    ASSERT_TRUE(header.ok());
    EXPECT_TRUE(header.metadata->instructions.empty());

    TestSuiteMetadata rebuilt = *header.metadata;
    for (const auto& name : rebuilt.execution_order) {
        auto part = assembler.assemble_instruction(header, name);
        ASSERT_TRUE(part.ok()) << part.failure.to_string();
        rebuilt.instructions.push_back(*part.plan);
    }
    EXPECT_EQ(rebuilt, *full.metadata);

    auto unknown = assembler.assemble_instruction(header, "bogus");
    EXPECT_EQ(unknown.failure.code, ErrorCode::UNKNOWN_INSTRUCTION);
}

TEST_F(CounterAssemblyTest, DerivationAttemptsAreCounted) {
    MetadataAssembler assembler(model_, context_);
    auto header = assembler.assemble_header();
    ASSERT_TRUE(header.ok());

    auto init = assembler.assemble_instruction(header, "initialize");
    ASSERT_TRUE(init.ok());
    EXPECT_EQ(init.derivation_attempts, 2);

    auto set = assembler.assemble_instruction(header, "set");
    ASSERT_TRUE(set.ok());
    EXPECT_EQ(set.derivation_attempts, 0);
}

// ============================================================================
// Failures
// ============================================================================

TEST(MetadataAssemblerTest, UndeclaredSeedAccount) {
    auto model = load(R"({
      "name": "split",
      "programId": "Fg6PaFpoGXkYsidMpWTK6W2BeZ7FEfcYkg476zPFsLnS",
      "instructions": [
        {"name": "register", "accounts": [{"name": "wallet", "isSigner": true}]},
        {"name": "claim", "args": [], "accounts": [
          {"name": "receipt", "pda": {"seeds": [{"kind": "account", "path": "wallet"},
                                                 {"kind": "arg", "path": "amount"}]}}
        ]}
      ]
    })");
    SuiteContext context("default");
    auto result = MetadataAssembler(model, context).assemble();
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.failure.code, ErrorCode::MISSING_ACCOUNT_BINDING);
    EXPECT_EQ(result.failure.names, (std::vector<std::string>{"receipt.wallet", "receipt.amount"}));
}

TEST(MetadataAssemblerTest, CycleFailsAssembly) {
    auto model = load(R"({
      "name": "cyclic",
      "instructions": [{
        "name": "loop",
        "accounts": [
          {"name": "first", "pda": {"seeds": [{"kind": "account", "path": "second"}]}},
          {"name": "second", "pda": {"seeds": [{"kind": "account", "path": "first"}]}}
        ]
      }]
    })");
    SuiteContext context("default");
    auto result = MetadataAssembler(model, context).assemble();
    EXPECT_EQ(result.failure.code, ErrorCode::DEPENDENCY_CYCLE);
}

TEST(MetadataAssemblerTest, FailureLeavesContextUntouched) {
    auto model = load(R"({
      "name": "partial",
      "programId": "Fg6PaFpoGXkYsidMpWTK6W2BeZ7FEfcYkg476zPFsLnS",
      "instructions": [
        {"name": "first", "args": [{"name": "id", "type": "u64"}], "accounts": [
          {"name": "counter", "pda": {"seeds": [{"kind": "const", "value": "counter"}, {"kind": "arg", "path": "id"}]}}
        ]},
        {"name": "second", "args": [{"name": "ratio", "type": "f64"}], "accounts": []}
      ]
    })");
    SuiteContext context("default");
    context.bindings().bind_argument("id", ArgumentValue::from_unsigned(42));

    auto result = MetadataAssembler(model, context).assemble();
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.failure.code, ErrorCode::UNSUPPORTED_TYPE);
    EXPECT_EQ(result.failure.names, std::vector<std::string>{"second.ratio"});

    EXPECT_FALSE(context.find_derived("counter").has_value());
    EXPECT_FALSE(context.bindings().has_account("counter"));
    EXPECT_NE(context.bindings().find_argument("first", "id"), nullptr);
}

TEST(MetadataAssemblerTest, SeedTooLongIsFatal) {
    auto model = load(R"({
      "name": "long",
      "programId": "Fg6PaFpoGXkYsidMpWTK6W2BeZ7FEfcYkg476zPFsLnS",
      "instructions": [
        {"name": "make", "args": [{"name": "title", "type": "string"}], "accounts": [
          {"name": "entry", "pda": {"seeds": [{"kind": "arg", "path": "title"}]}}
        ]}
      ]
    })");
    SuiteContext context("default");
    context.bindings().bind_argument("title", ArgumentValue::from_string(std::string(40, 't')));

    auto result = MetadataAssembler(model, context).assemble();
    EXPECT_EQ(result.failure.code, ErrorCode::INVALID_SEED);
}

// ============================================================================
// Heuristics and Program Identity
// ============================================================================

TEST(MetadataAssemblerTest, HeuristicAliasResolvesWithMatchedKey) {
    auto model = load(R"({
      "name": "loose",
      "instructions": [{
        "name": "mint",
        "accounts": [
          {"name": "Mint_Authority", "isSigner": true},
          {"name": "receipt", "pda": {"seeds": [{"kind": "account", "path": "authority"}]}}
        ]
      }]
    })");
    Pubkey authority = key(AUTHORITY_KEY);
    Pubkey program = key(fixtures::PROGRAM_ID);

    SuiteContext context("default");
    context.register_account("Mint_Authority", authority);

    AssemblyOptions options;
    options.program_id = program;
    auto result = MetadataAssembler(model, context, options).assemble();
    ASSERT_TRUE(result.ok()) << result.failure.to_string();
    ASSERT_EQ(result.heuristic_matches.size(), 1);
    EXPECT_EQ(result.metadata->program_id, fixtures::PROGRAM_ID);

    auto expected = find_program_address(std::vector<bytes_t>{bytes_t(authority.begin(), authority.end())}, program);
    ASSERT_TRUE(expected.ok());

    const DerivedAddressPlan& receipt = result.metadata->instructions[0].derived_addresses[0];
    EXPECT_TRUE(receipt.resolved);
    EXPECT_EQ(receipt.address, expected.derived->address.to_base58());
    EXPECT_EQ(receipt.nonce, expected.derived->nonce);

    // The alias is local to assembly
    EXPECT_FALSE(context.bindings().has_account("authority"));
}

TEST(MetadataAssemblerTest, NoProgramIdLeavesPlansUnresolved) {
    auto model = load(R"({
      "name": "anonymous",
      "instructions": [{
        "name": "open",
        "accounts": [{"name": "vault", "pda": {"seeds": [{"kind": "const", "value": [1, 2, 3]}]}}]
      }]
    })");
    SuiteContext context("default");
    auto result = MetadataAssembler(model, context).assemble();
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.metadata->program_id.empty());

    const DerivedAddressPlan& vault = result.metadata->instructions[0].derived_addresses[0];
    EXPECT_FALSE(vault.resolved);
    ASSERT_EQ(vault.seeds.size(), 1);
    EXPECT_EQ(vault.seeds[0].value, "0x010203");
}

TEST(MetadataAssemblerTest, OwningProgramIsRecorded) {
    auto model = load(R"({
      "name": "foreign",
      "instructions": [{
        "name": "open",
        "accounts": [{"name": "vault", "pda": {
          "seeds": [{"kind": "const", "value": "vault"}],
          "program": "Fg6PaFpoGXkYsidMpWTK6W2BeZ7FEfcYkg476zPFsLnS"}}]
      }]
    })");
    SuiteContext context("default");
    auto result = MetadataAssembler(model, context).assemble();
    ASSERT_TRUE(result.ok());

    const DerivedAddressPlan& vault = result.metadata->instructions[0].derived_addresses[0];
    EXPECT_EQ(vault.owning_program, fixtures::PROGRAM_ID);
    EXPECT_TRUE(vault.resolved);
    EXPECT_EQ(vault.address, "BtWhNzGgdC9aX14VfQtYQuiqvxidMSAzParX6UUXzgn2");
    EXPECT_EQ(vault.nonce, 255);
}

// ============================================================================
// Setup Flow Validation
// ============================================================================

TEST(SetupFlowTest, DependencyAfterDependentIsInvalid) {
    std::vector<SetupStep> steps = {
        {SetupStepKind::INITIALIZE_DERIVED_ADDRESS, "vault", "Initialize vault derived address", {"owner"}},
        {SetupStepKind::CREATE_KEYPAIR, "owner", "Create keypair for owner", {}},
    };
    EXPECT_FALSE(validate_setup_flow(steps));

    std::swap(steps[0], steps[1]);
    EXPECT_TRUE(validate_setup_flow(steps));
}

TEST(SetupFlowTest, ExternalDependenciesAreIgnored) {
    std::vector<SetupStep> steps = {
        {SetupStepKind::INITIALIZE_DERIVED_ADDRESS, "vault", "Initialize vault derived address", {"mint"}},
    };
    EXPECT_TRUE(validate_setup_flow(steps));
    EXPECT_TRUE(validate_setup_flow({}));
}
