#pragma once

#include "analysis/context.hh"
#include "assembly/metadata.hh"
#include "assembly/persistence.hh"
#include "core/status.hh"
#include "model/interface.hh"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace suitegen {

// ============================================================================
// Offline Pipeline: parse -> assemble -> sink
// ============================================================================

struct PipelineConfig {
    AssemblyOptions assembly;
    std::vector<std::string> execution_order;     // Empty: schema order
    std::string label = "default";

    // Pre-bound seeds
    std::map<std::string, Pubkey> accounts;
    std::map<std::string, ArgumentValue> arguments;

    // Give every plain signer a deterministic key derived from the label so
    // derived addresses seeded by signers resolve offline
    bool bind_placeholder_signers = true;
};

struct PipelineResult {
    std::optional<TestSuiteMetadata> metadata;
    Failure failure;

    [[nodiscard]] bool ok() const { return metadata.has_value(); }
};

// Key a placeholder signer receives under `label`
[[nodiscard]] Pubkey placeholder_key(std::string_view label, std::string_view account);

// Seed a context from the configuration: explicit bindings, fixed schema
// addresses, then placeholder signers for anything still unbound
void prepare_context(const InterfaceModel& model, const PipelineConfig& config, SuiteContext& context);

class OfflinePipeline {
public:
    explicit OfflinePipeline(PipelineConfig config = {});

    [[nodiscard]] PipelineResult run(std::string_view schema_json, MetadataSink* sink = nullptr) const;
    [[nodiscard]] PipelineResult run_file(const std::string& schema_path, MetadataSink* sink = nullptr) const;
    [[nodiscard]] PipelineResult run_model(const InterfaceModel& model, SuiteContext& context,
                                           MetadataSink* sink = nullptr) const;

    [[nodiscard]] const PipelineConfig& config() const { return config_; }

private:
    PipelineConfig config_;
};

}  // namespace suitegen
