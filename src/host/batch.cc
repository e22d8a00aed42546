#include "batch.hh"
#include "core/logging.hh"
#include <exception>
#include <thread>

namespace suitegen {

std::vector<BatchOutcome> run_batch(const std::vector<BatchJob>& jobs, MetadataSink* sink) {
    std::vector<BatchOutcome> outcomes(jobs.size());
    std::vector<std::exception_ptr> errors(jobs.size());
    // jthread joins on destruction, so a failed spawn still joins the
    // workers already running before the exception leaves this scope
    std::vector<std::jthread> workers;
    workers.reserve(jobs.size());

    for (std::size_t i = 0; i < jobs.size(); ++i) {
        workers.emplace_back([&jobs, &outcomes, &errors, sink, i] {
            try {
                OfflinePipeline pipeline(jobs[i].config);
                outcomes[i].name = jobs[i].name;
                outcomes[i].result = pipeline.run(jobs[i].schema_json, sink);
            } catch (...) {
                errors[i] = std::current_exception();
            }
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }

    // Crypto failures surface on the calling thread
    for (const auto& error : errors) {
        if (error) std::rethrow_exception(error);
    }

    std::size_t failed = 0;
    for (const auto& outcome : outcomes) {
        if (!outcome.result.ok()) ++failed;
    }
    log::host.info() << "Batch finished: " << jobs.size() - failed << " succeeded, " << failed << " failed";
    return outcomes;
}

}  // namespace suitegen
