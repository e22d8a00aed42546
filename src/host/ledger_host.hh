#pragma once

#include "analysis/context.hh"
#include "assembly/metadata.hh"
#include "assembly/persistence.hh"
#include "core/status.hh"
#include "core/types.hh"
#include "model/interface.hh"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace suitegen {

// ============================================================================
// Metering Configuration
// ============================================================================

struct MeteringCosts {
    static constexpr std::uint64_t COST_INSTRUCTION = 5000;      // Per assembled instruction
    static constexpr std::uint64_t COST_TEST_CASE = 400;         // Per synthesized case
    static constexpr std::uint64_t COST_NONCE_ATTEMPT = 1500;    // SHA-256 plus curve check
    static constexpr std::uint64_t COST_BYTE_STORED = 1;
};

struct LedgerLimits {
    std::uint64_t compute_budget = LEDGER_COMPUTE_BUDGET;    // Per transaction
    std::size_t account_ceiling = LEDGER_ACCOUNT_CEILING;    // Bytes per stored chunk
};

// ============================================================================
// Compute Budget - tracks units spent inside one transaction
// ============================================================================

class ComputeBudget {
public:
    explicit ComputeBudget(std::uint64_t limit);

    // Consume units (returns false once the limit is exceeded)
    bool consume(std::uint64_t units);

    bool charge_instruction();
    bool charge_test_cases(std::size_t count);
    bool charge_derivation(std::uint32_t attempts);
    bool charge_storage(std::size_t bytes);

    [[nodiscard]] bool exhausted() const;
    [[nodiscard]] std::uint64_t used() const;
    [[nodiscard]] std::uint64_t remaining() const;
    [[nodiscard]] std::uint64_t limit() const;

    void reset(std::uint64_t new_limit);

private:
    std::uint64_t limit_;
    std::uint64_t used_ = 0;
    bool exhausted_ = false;
};

// ============================================================================
// Program History
// ============================================================================

struct ProgramHistory {
    std::string program_id;
    std::string program_name;
    std::string label;
    std::uint64_t test_count = 0;
    std::uint32_t chunk_count = 0;
    std::uint64_t compute_used = 0;
    hash_t schema_digest{};
};

struct LedgerRunResult {
    std::vector<MetadataChunk> chunks;
    std::optional<TestSuiteMetadata> metadata;
    ProgramHistory history;
    Failure failure;

    [[nodiscard]] bool ok() const { return failure.code == ErrorCode::OK; }
};

// ============================================================================
// Ledger Host - same assembly, one instruction per transaction
// ============================================================================

class LedgerHost {
public:
    explicit LedgerHost(LedgerLimits limits = {}, AssemblyOptions options = {});

    // Header transaction, then one transaction per instruction. Each
    // transaction gets a fresh budget; any overrun or oversized chunk fails
    // the whole run with RESOURCE_EXHAUSTED and records nothing.
    [[nodiscard]] LedgerRunResult generate(const InterfaceModel& model, SuiteContext& context,
                                           const std::vector<std::string>& execution_order = {});

    [[nodiscard]] const std::vector<ProgramHistory>& history() const { return history_; }
    [[nodiscard]] std::optional<ProgramHistory> find_history(std::string_view program_id) const;

    [[nodiscard]] const LedgerLimits& limits() const { return limits_; }

private:
    LedgerLimits limits_;
    AssemblyOptions options_;
    std::vector<ProgramHistory> history_;

    void record(const ProgramHistory& entry);
};

}  // namespace suitegen
