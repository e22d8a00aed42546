#include "metadata.hh"
#include "core/logging.hh"
#include <algorithm>
#include <set>
#include <unordered_set>

namespace suitegen {

namespace {

std::string render_literal(const bytes_t& literal) {
    bool printable = std::all_of(literal.begin(), literal.end(),
                                 [](std::uint8_t b) { return b >= 0x20 && b <= 0x7E; });
    if (printable) {
        return std::string(literal.begin(), literal.end());
    }
    return "0x" + bytes_to_hex(literal);
}

bool contains(const std::vector<std::string>& names, std::string_view name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

const HeuristicMatch* find_match(const std::vector<HeuristicMatch>& matches,
                                 std::string_view instruction, std::string_view reference) {
    for (const auto& m : matches) {
        if (m.instruction == instruction && m.reference == reference) return &m;
    }
    return nullptr;
}

}  // namespace

std::string_view setup_step_kind_name(SetupStepKind kind) {
    switch (kind) {
        case SetupStepKind::CREATE_KEYPAIR: return "CreateKeypair";
        case SetupStepKind::FUND_ACCOUNT: return "FundAccount";
        case SetupStepKind::INITIALIZE_DERIVED_ADDRESS: return "InitializeDerivedAddress";
    }
    return "Unknown";
}

bool validate_setup_flow(const std::vector<SetupStep>& steps) {
    std::unordered_set<std::string> with_steps;
    for (const auto& step : steps) {
        with_steps.insert(step.account);
    }

    std::unordered_set<std::string> satisfied;
    for (const auto& step : steps) {
        for (const auto& dep : step.depends_on) {
            if (with_steps.count(dep) && !satisfied.count(dep)) {
                return false;
            }
        }
        satisfied.insert(step.account);
    }
    return true;
}

// ============================================================================
// TestSuiteMetadata
// ============================================================================

std::size_t TestSuiteMetadata::test_case_count() const {
    std::size_t count = 0;
    for (const auto& plan : instructions) {
        count += plan.test_cases.size();
    }
    return count;
}

const InstructionPlan* TestSuiteMetadata::find_instruction(std::string_view name) const {
    auto it = std::find_if(instructions.begin(), instructions.end(),
                           [name](const InstructionPlan& p) { return p.name == name; });
    return it == instructions.end() ? nullptr : &*it;
}

// ============================================================================
// MetadataAssembler
// ============================================================================

MetadataAssembler::MetadataAssembler(const InterfaceModel& model, SuiteContext& context,
                                     AssemblyOptions options)
    : model_(model), context_(context), options_(std::move(options)) {}

std::optional<Pubkey> MetadataAssembler::program_id() const {
    if (model_.program_id) return model_.program_id;
    return options_.program_id;
}

Failure MetadataAssembler::check_bindings(const InstructionSpec& instruction,
                                          const std::vector<HeuristicMatch>& matches) const {
    Failure failure;
    SeedScope scope = SeedScope::of(instruction);

    for (const auto& account : instruction.accounts) {
        if (!account.derived) continue;
        auto inspection = inspect_seeds(*account.derived, scope);
        for (const auto& ref : inspection.unbound) {
            if (ref.kind == SeedKind::ACCOUNT) {
                const HeuristicMatch* m = find_match(matches, instruction.name, ref.root);
                if (m && scope.has_account(m->matched)) continue;
            }
            failure.names.push_back(account.canonical_key + "." + ref.path);
        }
    }

    if (!failure.names.empty()) {
        failure.code = ErrorCode::MISSING_ACCOUNT_BINDING;
        failure.detail = "derived-address seeds reference names not declared by " + instruction.name;
        log::assembly.error() << failure.to_string();
    }
    return failure;
}

std::vector<SetupStep> MetadataAssembler::build_setup_steps(
    const std::vector<std::string>& order, const std::vector<const InstructionSpec*>& chosen,
    const InitOrderResult& graph) const {
    // First usage of each account among the chosen instructions
    auto usage_of = [&](const std::string& name) -> const AccountUsage* {
        for (const auto* instruction : chosen) {
            if (const AccountUsage* acc = instruction->find_account(name)) return acc;
        }
        return nullptr;
    };

    std::vector<const AccountUsage*> signers;
    std::vector<const AccountUsage*> derived;
    for (const auto& name : order) {
        const AccountUsage* acc = usage_of(name);
        if (!acc) continue;
        if (acc->is_derived()) {
            derived.push_back(acc);
        } else if (acc->is_signer) {
            signers.push_back(acc);
        }
    }

    std::vector<SetupStep> steps;
    for (const auto* acc : signers) {
        steps.push_back(SetupStep{SetupStepKind::CREATE_KEYPAIR, acc->canonical_key,
                                  "Create keypair for " + acc->canonical_key, {}});
    }
    for (const auto* acc : signers) {
        steps.push_back(SetupStep{SetupStepKind::FUND_ACCOUNT, acc->canonical_key,
                                  "Fund " + acc->canonical_key + " with SOL for transactions",
                                  {acc->canonical_key}});
    }
    for (const auto* acc : derived) {
        std::vector<std::string> deps;
        for (auto& dep : graph.dependencies_of(acc->canonical_key)) {
            if (contains(order, dep)) deps.push_back(std::move(dep));
        }
        steps.push_back(SetupStep{SetupStepKind::INITIALIZE_DERIVED_ADDRESS, acc->canonical_key,
                                  "Initialize " + acc->canonical_key + " derived address",
                                  std::move(deps)});
    }
    return steps;
}

AssemblyResult MetadataAssembler::assemble_header(const std::vector<std::string>& execution_order) const {
    AssemblyResult result;

    std::vector<std::string> order = execution_order.empty() ? model_.instruction_names() : execution_order;

    std::vector<const InstructionSpec*> chosen;
    std::set<std::string> seen;
    for (const auto& name : order) {
        const InstructionSpec* instruction = model_.find_instruction(name);
        if (!instruction) {
            result.failure.code = ErrorCode::UNKNOWN_INSTRUCTION;
            result.failure.names = {name};
            result.failure.detail = "execution order names an instruction not declared by " +
                                    model_.program_name;
            log::assembly.error() << result.failure.to_string();
            return result;
        }
        if (seen.insert(name).second) {
            chosen.push_back(instruction);
        }
    }

    auto graph = DependencyGraphBuilder(model_, options_.graph).build();
    if (!graph.ok()) {
        result.failure = graph.failure;
        return result;
    }
    result.heuristic_matches = graph.heuristic_matches;

    for (const auto* instruction : chosen) {
        Failure failure = check_bindings(*instruction, graph.heuristic_matches);
        if (failure.code != ErrorCode::OK) {
            result.failure = std::move(failure);
            return result;
        }
    }

    std::unordered_set<std::string> used;
    for (const auto* instruction : chosen) {
        for (const auto& acc : instruction->accounts) {
            used.insert(acc.canonical_key);
        }
    }

    TestSuiteMetadata metadata;
    auto id = program_id();
    metadata.program_id = id ? id->to_base58() : std::string{};
    metadata.program_name = model_.program_name;
    metadata.label = context_.label();
    metadata.execution_order = std::move(order);
    for (const auto& name : graph.order) {
        if (used.count(name)) metadata.initialization_order.push_back(name);
    }
    metadata.setup_steps = build_setup_steps(metadata.initialization_order, chosen, graph);

    // A run resolves from explicit bindings only. Derived addresses registered
    // by an earlier run must not feed this run's seeds.
    context_.clear_derived();

    result.metadata = std::move(metadata);
    return result;
}

DerivedAddressPlan MetadataAssembler::plan_derived_address(const InstructionSpec& instruction,
                                                           const AccountUsage& account,
                                                           const BindingEnvironment& env,
                                                           std::uint32_t& attempts,
                                                           Failure& failure) const {
    const DerivedAddressSpec& spec = *account.derived;

    DerivedAddressPlan plan;
    plan.account = account.canonical_key;
    for (const auto& seed : spec.seeds) {
        plan.seeds.push_back(SeedComponent{
            seed.kind, seed.kind == SeedKind::LITERAL ? render_literal(seed.literal) : seed.path});
    }
    if (spec.owning_program) {
        plan.owning_program = spec.owning_program->to_base58();
    }

    auto id = program_id();
    if (!options_.resolve_derived_addresses || (!spec.owning_program && !id)) {
        return plan;
    }

    DerivedAddressResolver resolver(options_.resolver);
    auto derivation = resolver.resolve(spec, instruction, env, spec.owning_program ? *spec.owning_program : *id);
    attempts += derivation.attempts;

    if (derivation.ok()) {
        plan.resolved = true;
        plan.address = derivation.derived->address.to_base58();
        plan.nonce = derivation.derived->nonce;
        context_.register_derived(account.canonical_key, *derivation.derived);
    } else if (derivation.failure.code == ErrorCode::AMBIGUOUS_SEED) {
        // Seeds the context does not bind yet stay symbolic
        SUITEGEN_LOG_DEBUG(log::assembly) << "Leaving " << account.canonical_key << " unresolved: "
                                          << derivation.failure.detail;
    } else {
        failure = std::move(derivation.failure);
    }
    return plan;
}

InstructionAssemblyResult MetadataAssembler::assemble_instruction(const AssemblyResult& header,
                                                                  std::string_view instruction_name) const {
    InstructionAssemblyResult result;

    const InstructionSpec* instruction = model_.find_instruction(instruction_name);
    if (!instruction) {
        result.failure.code = ErrorCode::UNKNOWN_INSTRUCTION;
        result.failure.names = {std::string(instruction_name)};
        result.failure.detail = "instruction is not declared by " + model_.program_name;
        log::assembly.error() << result.failure.to_string();
        return result;
    }
    if (!header.metadata) {
        result.failure = header.failure;
        return result;
    }

    Failure failure = check_bindings(*instruction, header.heuristic_matches);
    if (failure.code != ErrorCode::OK) {
        result.failure = std::move(failure);
        return result;
    }

    InstructionPlan plan;
    plan.name = instruction->name;
    for (const auto& name : header.metadata->initialization_order) {
        if (instruction->find_account(name)) plan.account_order.push_back(name);
    }

    // Heuristically matched seed references see the matched account's key
    BindingEnvironment env = context_.bindings();
    for (const auto& m : header.heuristic_matches) {
        if (m.instruction != instruction->name) continue;
        if (auto key = env.find_account(m.matched)) env.bind_account(m.reference, *key);
    }

    for (const auto& name : plan.account_order) {
        const AccountUsage* account = instruction->find_account(name);
        if (!account->derived) continue;

        Failure derivation_failure;
        auto derived = plan_derived_address(*instruction, *account, env, result.derivation_attempts,
                                            derivation_failure);
        if (derivation_failure.code != ErrorCode::OK) {
            result.failure = std::move(derivation_failure);
            return result;
        }
        if (derived.resolved) {
            if (auto key = Pubkey::from_base58(derived.address)) env.bind_account(name, *key);
        }
        plan.derived_addresses.push_back(std::move(derived));
    }

    auto synthesis = TestCaseSynthesizer(model_, options_.synthesis).synthesize(*instruction);
    if (!synthesis.ok()) {
        result.failure = std::move(synthesis.failure);
        return result;
    }
    plan.test_cases = std::move(synthesis.cases);

    result.plan = std::move(plan);
    return result;
}

AssemblyResult MetadataAssembler::assemble(const std::vector<std::string>& execution_order) const {
    // All or nothing: a failure leaves the context as it was
    SuiteContext snapshot = context_;

    AssemblyResult header = assemble_header(execution_order);
    if (!header.ok()) {
        return header;
    }

    TestSuiteMetadata metadata = *header.metadata;
    std::set<std::string> planned;
    for (const auto& name : metadata.execution_order) {
        if (!planned.insert(name).second) continue;

        auto part = assemble_instruction(header, name);
        if (!part.ok()) {
            context_ = snapshot;
            AssemblyResult failed;
            failed.failure = std::move(part.failure);
            failed.heuristic_matches = std::move(header.heuristic_matches);
            return failed;
        }
        metadata.instructions.push_back(std::move(*part.plan));
    }

    log::assembly.info() << "Assembled " << metadata.instructions.size() << " instructions, "
                         << metadata.test_case_count() << " test cases for " << metadata.program_name
                         << " [" << metadata.label << "]";

    AssemblyResult result;
    result.metadata = std::move(metadata);
    result.heuristic_matches = std::move(header.heuristic_matches);
    return result;
}

}  // namespace suitegen
