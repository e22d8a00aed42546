#include "pipeline.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"
#include "model/parser.hh"

namespace suitegen {

Pubkey placeholder_key(std::string_view label, std::string_view account) {
    Pubkey key;
    key.bytes = sha256_multi(std::string_view("suitegen:signer:"), label, std::string_view(":"), account);
    return key;
}

void prepare_context(const InterfaceModel& model, const PipelineConfig& config, SuiteContext& context) {
    for (const auto& [name, key] : config.accounts) {
        context.register_account(name, key);
    }
    for (const auto& [name, value] : config.arguments) {
        context.bindings().bind_argument(name, value);
    }

    for (const auto& instruction : model.instructions) {
        for (const auto& account : instruction.accounts) {
            const std::string& name = account.canonical_key;
            if (context.bindings().has_account(name)) continue;

            if (account.fixed_address) {
                context.register_account(name, *account.fixed_address);
            } else if (config.bind_placeholder_signers && account.is_signer && !account.is_derived()) {
                context.register_account(name, placeholder_key(context.label(), name));
            }
        }
    }
}

// ============================================================================
// OfflinePipeline
// ============================================================================

OfflinePipeline::OfflinePipeline(PipelineConfig config) : config_(std::move(config)) {}

PipelineResult OfflinePipeline::run_model(const InterfaceModel& model, SuiteContext& context,
                                          MetadataSink* sink) const {
    PipelineResult result;

    MetadataAssembler assembler(model, context, config_.assembly);
    auto assembled = assembler.assemble(config_.execution_order);
    if (!assembled.ok()) {
        result.failure = std::move(assembled.failure);
        return result;
    }

    if (sink) {
        Failure failure = sink->accept(*assembled.metadata);
        if (failure.code != ErrorCode::OK) {
            result.failure = std::move(failure);
            return result;
        }
    }

    result.metadata = std::move(assembled.metadata);
    return result;
}

PipelineResult OfflinePipeline::run(std::string_view schema_json, MetadataSink* sink) const {
    auto parsed = parse_interface(schema_json);
    if (!parsed.ok()) {
        PipelineResult result;
        result.failure = std::move(parsed.failure);
        return result;
    }

    SuiteContext context(config_.label);
    prepare_context(*parsed.model, config_, context);

    log::host.info() << "Generating suite for " << parsed.model->program_name << " ["
                     << config_.label << "]";
    return run_model(*parsed.model, context, sink);
}

PipelineResult OfflinePipeline::run_file(const std::string& schema_path, MetadataSink* sink) const {
    auto parsed = parse_interface_file(schema_path);
    if (!parsed.ok()) {
        PipelineResult result;
        result.failure = std::move(parsed.failure);
        return result;
    }

    SuiteContext context(config_.label);
    prepare_context(*parsed.model, config_, context);

    log::host.info() << "Generating suite for " << parsed.model->program_name << " from "
                     << schema_path;
    return run_model(*parsed.model, context, sink);
}

}  // namespace suitegen
