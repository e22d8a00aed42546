#pragma once

#include "analysis/context.hh"
#include "analysis/dependency_graph.hh"
#include "analysis/derived_address.hh"
#include "core/status.hh"
#include "model/interface.hh"
#include "synthesis/synthesizer.hh"
#include "synthesis/test_case.hh"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace suitegen {

// ============================================================================
// Setup Steps
// ============================================================================

enum class SetupStepKind : std::uint8_t {
    CREATE_KEYPAIR = 0,
    FUND_ACCOUNT = 1,
    INITIALIZE_DERIVED_ADDRESS = 2,
};

[[nodiscard]] std::string_view setup_step_kind_name(SetupStepKind kind);

struct SetupStep {
    SetupStepKind kind = SetupStepKind::CREATE_KEYPAIR;
    std::string account;
    std::string description;
    std::vector<std::string> depends_on;

    bool operator==(const SetupStep&) const = default;
};

// True when every dependency that has its own setup step is set up earlier
[[nodiscard]] bool validate_setup_flow(const std::vector<SetupStep>& steps);

// ============================================================================
// Derived Address Plans
// ============================================================================

struct SeedComponent {
    SeedKind kind = SeedKind::LITERAL;
    std::string value;        // Literal text (hex when not printable) or reference path

    bool operator==(const SeedComponent&) const = default;
};

struct DerivedAddressPlan {
    std::string account;
    std::vector<SeedComponent> seeds;
    std::string owning_program;       // Base58; empty means the program under test
    bool resolved = false;
    std::string address;              // Base58, set when resolved
    nonce_t nonce = 0;

    bool operator==(const DerivedAddressPlan&) const = default;
};

// ============================================================================
// Test Suite Metadata - flat, serializable output artifact
// ============================================================================

struct InstructionPlan {
    std::string name;
    std::vector<std::string> account_order;
    std::vector<DerivedAddressPlan> derived_addresses;
    std::vector<TestCase> test_cases;

    bool operator==(const InstructionPlan&) const = default;
};

struct TestSuiteMetadata {
    std::string program_id;           // Base58; empty when the schema declares none
    std::string program_name;
    std::string label;
    std::vector<std::string> execution_order;
    std::vector<std::string> initialization_order;
    std::vector<SetupStep> setup_steps;
    std::vector<InstructionPlan> instructions;

    [[nodiscard]] std::size_t test_case_count() const;
    [[nodiscard]] const InstructionPlan* find_instruction(std::string_view name) const;

    bool operator==(const TestSuiteMetadata&) const = default;
};

// ============================================================================
// Assembly
// ============================================================================

struct AssemblyOptions {
    GraphOptions graph;
    ResolverConfig resolver;
    SynthesisConfig synthesis;

    // Used when the schema declares no program id
    std::optional<Pubkey> program_id;

    // Compute concrete addresses for derived accounts whose seeds are all bound
    bool resolve_derived_addresses = true;
};

struct AssemblyResult {
    std::optional<TestSuiteMetadata> metadata;
    std::vector<HeuristicMatch> heuristic_matches;
    Failure failure;

    [[nodiscard]] bool ok() const { return metadata.has_value(); }
};

struct InstructionAssemblyResult {
    std::optional<InstructionPlan> plan;
    Failure failure;
    std::uint32_t derivation_attempts = 0;    // Hash evaluations spent on derived addresses

    [[nodiscard]] bool ok() const { return plan.has_value(); }
};

// Merges initialization order, setup steps, derived-address plans and test
// cases into TestSuiteMetadata. Assembling the header starts a run: derived
// addresses left in the context by an earlier run are dropped, and the run
// registers the ones it resolves. Repeated assembly against the same context
// yields identical output.
class MetadataAssembler {
public:
    MetadataAssembler(const InterfaceModel& model, SuiteContext& context, AssemblyOptions options = {});

    // Empty execution order means the schema's declared instruction order
    [[nodiscard]] AssemblyResult assemble(const std::vector<std::string>& execution_order = {}) const;

    // Header only: program identity, orders and setup steps, no instruction plans.
    // Used together with assemble_instruction to build the artifact in chunks.
    [[nodiscard]] AssemblyResult assemble_header(const std::vector<std::string>& execution_order = {}) const;

    // One instruction against a successful assemble_header result
    [[nodiscard]] InstructionAssemblyResult assemble_instruction(const AssemblyResult& header,
                                                                 std::string_view instruction_name) const;

    [[nodiscard]] const AssemblyOptions& options() const { return options_; }

private:
    const InterfaceModel& model_;
    SuiteContext& context_;
    AssemblyOptions options_;

    [[nodiscard]] std::optional<Pubkey> program_id() const;

    [[nodiscard]] Failure check_bindings(const InstructionSpec& instruction,
                                         const std::vector<HeuristicMatch>& matches) const;

    [[nodiscard]] std::vector<SetupStep> build_setup_steps(const std::vector<std::string>& order,
                                                           const std::vector<const InstructionSpec*>& chosen,
                                                           const InitOrderResult& graph) const;

    [[nodiscard]] DerivedAddressPlan plan_derived_address(const InstructionSpec& instruction,
                                                          const AccountUsage& account,
                                                          const BindingEnvironment& env,
                                                          std::uint32_t& attempts,
                                                          Failure& failure) const;
};

}  // namespace suitegen
