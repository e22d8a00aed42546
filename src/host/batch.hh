#pragma once

#include "assembly/persistence.hh"
#include "host/pipeline.hh"
#include <string>
#include <vector>

namespace suitegen {

// ============================================================================
// Batch Runner - one worker per program
// ============================================================================

struct BatchJob {
    std::string name;
    std::string schema_json;
    PipelineConfig config;
};

struct BatchOutcome {
    std::string name;
    PipelineResult result;
};

// Runs every job on its own thread. Jobs share nothing except the sink, which
// must be safe for concurrent accept calls. Outcomes follow job order.
[[nodiscard]] std::vector<BatchOutcome> run_batch(const std::vector<BatchJob>& jobs,
                                                  MetadataSink* sink = nullptr);

}  // namespace suitegen
