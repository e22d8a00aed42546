#include "ledger_host.hh"
#include "core/logging.hh"
#include <algorithm>

namespace suitegen {

// ============================================================================
// ComputeBudget
// ============================================================================

ComputeBudget::ComputeBudget(std::uint64_t limit)
    : limit_(limit) {}

bool ComputeBudget::consume(std::uint64_t units) {
    if (exhausted_) {
        return false;
    }

    used_ += units;
    if (used_ > limit_) {
        exhausted_ = true;
        SUITEGEN_LOG_DEBUG(log::host) << "Compute budget exceeded: " << used_ << " used > " << limit_ << " limit";
        return false;
    }
    return true;
}

bool ComputeBudget::charge_instruction() {
    return consume(MeteringCosts::COST_INSTRUCTION);
}

bool ComputeBudget::charge_test_cases(std::size_t count) {
    return consume(MeteringCosts::COST_TEST_CASE * count);
}

bool ComputeBudget::charge_derivation(std::uint32_t attempts) {
    return consume(MeteringCosts::COST_NONCE_ATTEMPT * attempts);
}

bool ComputeBudget::charge_storage(std::size_t bytes) {
    return consume(MeteringCosts::COST_BYTE_STORED * bytes);
}

bool ComputeBudget::exhausted() const {
    return exhausted_;
}

std::uint64_t ComputeBudget::used() const {
    return used_;
}

std::uint64_t ComputeBudget::remaining() const {
    if (used_ >= limit_) {
        return 0;
    }
    return limit_ - used_;
}

std::uint64_t ComputeBudget::limit() const {
    return limit_;
}

void ComputeBudget::reset(std::uint64_t new_limit) {
    limit_ = new_limit;
    used_ = 0;
    exhausted_ = false;
}

// ============================================================================
// LedgerHost
// ============================================================================

namespace {

LedgerRunResult exhausted(std::string name, std::string detail) {
    LedgerRunResult result;
    result.failure.code = ErrorCode::RESOURCE_EXHAUSTED;
    result.failure.names.push_back(std::move(name));
    result.failure.detail = std::move(detail);
    log::host.error() << result.failure.to_string();
    return result;
}

}  // namespace

LedgerHost::LedgerHost(LedgerLimits limits, AssemblyOptions options)
    : limits_(limits), options_(std::move(options)) {}

std::optional<ProgramHistory> LedgerHost::find_history(std::string_view program_id) const {
    auto it = std::find_if(history_.begin(), history_.end(),
                           [program_id](const ProgramHistory& h) { return h.program_id == program_id; });
    if (it == history_.end()) {
        return std::nullopt;
    }
    return *it;
}

void LedgerHost::record(const ProgramHistory& entry) {
    auto it = std::find_if(history_.begin(), history_.end(), [&](const ProgramHistory& h) {
        return h.program_id == entry.program_id && h.label == entry.label;
    });
    if (it != history_.end()) {
        *it = entry;
    } else {
        history_.push_back(entry);
    }
}

LedgerRunResult LedgerHost::generate(const InterfaceModel& model, SuiteContext& context,
                                     const std::vector<std::string>& execution_order) {
    SuiteContext snapshot = context;
    MetadataAssembler assembler(model, context, options_);
    ComputeBudget budget(limits_.compute_budget);
    std::uint64_t total_compute = 0;

    auto header = assembler.assemble_header(execution_order);
    if (!header.ok()) {
        LedgerRunResult result;
        result.failure = std::move(header.failure);
        return result;
    }

    TestSuiteMetadata metadata = *header.metadata;
    std::vector<MetadataChunk> chunks;

    MetadataChunk first;
    first.index = 0;
    first.payload = serialize_metadata(metadata);
    if (first.payload.size() > limits_.account_ceiling) {
        return exhausted("header", "header chunk of " + std::to_string(first.payload.size()) +
                                       " bytes exceeds ceiling of " + std::to_string(limits_.account_ceiling));
    }
    if (!budget.charge_storage(first.payload.size())) {
        return exhausted("header", "compute budget exceeded storing header");
    }
    total_compute += budget.used();
    chunks.push_back(std::move(first));

    std::vector<std::string> planned;
    for (const auto& name : metadata.execution_order) {
        if (std::find(planned.begin(), planned.end(), name) != planned.end()) continue;
        planned.push_back(name);

        budget.reset(limits_.compute_budget);
        auto part = assembler.assemble_instruction(header, name);
        if (!part.ok()) {
            context = snapshot;
            LedgerRunResult result;
            result.failure = std::move(part.failure);
            return result;
        }

        MetadataChunk chunk;
        chunk.index = static_cast<std::uint32_t>(chunks.size());
        chunk.instruction = name;
        chunk.payload = serialize_instruction_plan(*part.plan);

        bool within_budget = budget.charge_instruction() &&
                             budget.charge_derivation(part.derivation_attempts) &&
                             budget.charge_test_cases(part.plan->test_cases.size()) &&
                             budget.charge_storage(chunk.payload.size());
        if (!within_budget) {
            context = snapshot;
            return exhausted(name, "compute budget of " + std::to_string(limits_.compute_budget) +
                                       " units exceeded (" + std::to_string(budget.used()) + " used)");
        }
        if (chunk.payload.size() > limits_.account_ceiling) {
            context = snapshot;
            return exhausted(name, "chunk of " + std::to_string(chunk.payload.size()) +
                                       " bytes exceeds ceiling of " + std::to_string(limits_.account_ceiling));
        }

        total_compute += budget.used();
        chunks.push_back(std::move(chunk));
        metadata.instructions.push_back(std::move(*part.plan));
    }

    LedgerRunResult result;
    result.history.program_id = metadata.program_id;
    result.history.program_name = metadata.program_name;
    result.history.label = metadata.label;
    result.history.test_count = metadata.test_case_count();
    result.history.chunk_count = static_cast<std::uint32_t>(chunks.size());
    result.history.compute_used = total_compute;
    result.history.schema_digest = model.source_digest;
    record(result.history);

    log::host.info() << "Stored " << chunks.size() << " chunks for " << metadata.program_name << " ("
                     << total_compute << " compute units)";

    result.chunks = std::move(chunks);
    result.metadata = std::move(metadata);
    return result;
}

}  // namespace suitegen
