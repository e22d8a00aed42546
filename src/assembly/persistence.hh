#pragma once

#include "assembly/metadata.hh"
#include "core/status.hh"
#include "core/types.hh"
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace suitegen {

// ============================================================================
// Binary Encoding
// ============================================================================
//
// Little-endian, u32 length prefixes for strings and vectors. The full
// artifact starts with METADATA_MAGIC.

[[nodiscard]] bytes_t serialize_metadata(const TestSuiteMetadata& metadata);
[[nodiscard]] std::optional<TestSuiteMetadata> deserialize_metadata(std::span<const std::uint8_t> data);

[[nodiscard]] bytes_t serialize_instruction_plan(const InstructionPlan& plan);
[[nodiscard]] std::optional<InstructionPlan> deserialize_instruction_plan(std::span<const std::uint8_t> data);

// ============================================================================
// JSON Rendering
// ============================================================================

[[nodiscard]] std::string metadata_to_json(const TestSuiteMetadata& metadata, bool pretty = true);

// ============================================================================
// Chunking
// ============================================================================

struct MetadataChunk {
    std::uint32_t index = 0;
    std::string instruction;          // Empty for the header chunk
    bytes_t payload;
};

struct ChunkResult {
    std::vector<MetadataChunk> chunks;
    Failure failure;

    [[nodiscard]] bool ok() const { return failure.code == ErrorCode::OK; }
};

// Chunk 0 carries the metadata without instruction plans, then one chunk per
// instruction plan. Any chunk larger than `ceiling` bytes is RESOURCE_EXHAUSTED.
[[nodiscard]] ChunkResult chunk_by_instruction(const TestSuiteMetadata& metadata,
                                               std::size_t ceiling = LEDGER_ACCOUNT_CEILING);

[[nodiscard]] std::optional<TestSuiteMetadata> reassemble_chunks(const std::vector<MetadataChunk>& chunks);

// ============================================================================
// Metadata Sinks
// ============================================================================

// Receives finished metadata: test renderers, files, ledger persistence
class MetadataSink {
public:
    virtual ~MetadataSink() = default;
    [[nodiscard]] virtual Failure accept(const TestSuiteMetadata& metadata) = 0;
};

class JsonFileSink : public MetadataSink {
public:
    explicit JsonFileSink(std::string path, bool pretty = true);

    [[nodiscard]] Failure accept(const TestSuiteMetadata& metadata) override;

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    std::string path_;
    bool pretty_;
};

class BinaryFileSink : public MetadataSink {
public:
    explicit BinaryFileSink(std::string path);

    [[nodiscard]] Failure accept(const TestSuiteMetadata& metadata) override;

private:
    std::string path_;
};

// Keeps everything it receives; safe to share between batch workers
class MemoryMetadataSink : public MetadataSink {
public:
    [[nodiscard]] Failure accept(const TestSuiteMetadata& metadata) override;

    [[nodiscard]] std::vector<TestSuiteMetadata> received() const;
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<TestSuiteMetadata> received_;
};

}  // namespace suitegen
