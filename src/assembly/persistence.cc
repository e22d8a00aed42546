#include "persistence.hh"
#include "core/logging.hh"
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <array>
#include <fstream>

namespace suitegen {

namespace {

// ============================================================================
// Byte Writer / Reader
// ============================================================================

class ByteWriter {
public:
    void put_u8(std::uint8_t v) { out_.push_back(v); }

    void put_u32(std::uint32_t v) {
        std::array<std::uint8_t, 4> buf;
        encode_u32(buf.data(), v);
        out_.insert(out_.end(), buf.begin(), buf.end());
    }

    void put_string(const std::string& s) {
        put_u32(static_cast<std::uint32_t>(s.size()));
        out_.insert(out_.end(), s.begin(), s.end());
    }

    void put_strings(const std::vector<std::string>& list) {
        put_u32(static_cast<std::uint32_t>(list.size()));
        for (const auto& s : list) put_string(s);
    }

    [[nodiscard]] bytes_t take() { return std::move(out_); }

private:
    bytes_t out_;
};

class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data) : data_(data) {}

    bool get_u8(std::uint8_t& v) {
        if (remaining() < 1) return false;
        v = data_[pos_++];
        return true;
    }

    bool get_u32(std::uint32_t& v) {
        if (remaining() < 4) return false;
        v = decode_u32(data_.data() + pos_);
        pos_ += 4;
        return true;
    }

    bool get_string(std::string& s) {
        std::uint32_t len = 0;
        if (!get_u32(len) || remaining() < len) return false;
        s.assign(reinterpret_cast<const char*>(data_.data() + pos_), len);
        pos_ += len;
        return true;
    }

    bool get_strings(std::vector<std::string>& list) {
        std::uint32_t count = 0;
        if (!get_u32(count) || count > remaining()) return false;
        list.resize(count);
        for (auto& s : list) {
            if (!get_string(s)) return false;
        }
        return true;
    }

    // Element counts can never exceed the bytes left; rejects absurd prefixes early
    bool get_count(std::uint32_t& count) {
        return get_u32(count) && count <= remaining();
    }

    [[nodiscard]] std::size_t remaining() const { return data_.size() - pos_; }
    [[nodiscard]] bool at_end() const { return pos_ == data_.size(); }

private:
    std::span<const std::uint8_t> data_;
    std::size_t pos_ = 0;
};

// ============================================================================
// Record Encoding
// ============================================================================

void write_test_case(ByteWriter& w, const TestCase& tc) {
    w.put_u8(static_cast<std::uint8_t>(tc.kind));
    w.put_string(tc.description);
    w.put_string(tc.target_argument);
    w.put_u32(static_cast<std::uint32_t>(tc.values.size()));
    for (const auto& v : tc.values) {
        w.put_string(v.argument);
        w.put_string(v.value);
        w.put_u8(v.valid ? 1 : 0);
        w.put_string(v.reason);
    }
    w.put_u8(static_cast<std::uint8_t>(tc.expected.kind));
    w.put_string(tc.expected.error_code);
    w.put_string(tc.expected.message);
}

bool read_test_case(ByteReader& r, TestCase& tc) {
    std::uint8_t kind = 0;
    if (!r.get_u8(kind) || kind > static_cast<std::uint8_t>(TestCaseKind::NEGATIVE_CONSTRAINT)) return false;
    tc.kind = static_cast<TestCaseKind>(kind);
    if (!r.get_string(tc.description) || !r.get_string(tc.target_argument)) return false;

    std::uint32_t count = 0;
    if (!r.get_count(count)) return false;
    tc.values.resize(count);
    for (auto& v : tc.values) {
        std::uint8_t valid = 0;
        if (!r.get_string(v.argument) || !r.get_string(v.value) || !r.get_u8(valid) ||
            !r.get_string(v.reason)) {
            return false;
        }
        v.valid = valid != 0;
    }

    std::uint8_t outcome = 0;
    if (!r.get_u8(outcome) || outcome > static_cast<std::uint8_t>(OutcomeKind::FAILURE)) return false;
    tc.expected.kind = static_cast<OutcomeKind>(outcome);
    return r.get_string(tc.expected.error_code) && r.get_string(tc.expected.message);
}

void write_plan(ByteWriter& w, const InstructionPlan& plan) {
    w.put_string(plan.name);
    w.put_strings(plan.account_order);

    w.put_u32(static_cast<std::uint32_t>(plan.derived_addresses.size()));
    for (const auto& d : plan.derived_addresses) {
        w.put_string(d.account);
        w.put_u32(static_cast<std::uint32_t>(d.seeds.size()));
        for (const auto& seed : d.seeds) {
            w.put_u8(static_cast<std::uint8_t>(seed.kind));
            w.put_string(seed.value);
        }
        w.put_string(d.owning_program);
        w.put_u8(d.resolved ? 1 : 0);
        w.put_string(d.address);
        w.put_u8(d.nonce);
    }

    w.put_u32(static_cast<std::uint32_t>(plan.test_cases.size()));
    for (const auto& tc : plan.test_cases) {
        write_test_case(w, tc);
    }
}

bool read_plan(ByteReader& r, InstructionPlan& plan) {
    if (!r.get_string(plan.name) || !r.get_strings(plan.account_order)) return false;

    std::uint32_t count = 0;
    if (!r.get_count(count)) return false;
    plan.derived_addresses.resize(count);
    for (auto& d : plan.derived_addresses) {
        std::uint32_t seeds = 0;
        if (!r.get_string(d.account) || !r.get_count(seeds)) return false;
        d.seeds.resize(seeds);
        for (auto& seed : d.seeds) {
            std::uint8_t kind = 0;
            if (!r.get_u8(kind) || kind > static_cast<std::uint8_t>(SeedKind::ACCOUNT)) return false;
            seed.kind = static_cast<SeedKind>(kind);
            if (!r.get_string(seed.value)) return false;
        }
        std::uint8_t resolved = 0;
        if (!r.get_string(d.owning_program) || !r.get_u8(resolved) || !r.get_string(d.address) ||
            !r.get_u8(d.nonce)) {
            return false;
        }
        d.resolved = resolved != 0;
    }

    if (!r.get_count(count)) return false;
    plan.test_cases.resize(count);
    for (auto& tc : plan.test_cases) {
        if (!read_test_case(r, tc)) return false;
    }
    return true;
}

void write_header(ByteWriter& w, const TestSuiteMetadata& m) {
    w.put_u32(METADATA_MAGIC);
    w.put_string(m.program_id);
    w.put_string(m.program_name);
    w.put_string(m.label);
    w.put_strings(m.execution_order);
    w.put_strings(m.initialization_order);
    w.put_u32(static_cast<std::uint32_t>(m.setup_steps.size()));
    for (const auto& step : m.setup_steps) {
        w.put_u8(static_cast<std::uint8_t>(step.kind));
        w.put_string(step.account);
        w.put_string(step.description);
        w.put_strings(step.depends_on);
    }
}

bool read_header(ByteReader& r, TestSuiteMetadata& m) {
    std::uint32_t magic = 0;
    if (!r.get_u32(magic) || magic != METADATA_MAGIC) return false;
    if (!r.get_string(m.program_id) || !r.get_string(m.program_name) || !r.get_string(m.label) ||
        !r.get_strings(m.execution_order) || !r.get_strings(m.initialization_order)) {
        return false;
    }
    std::uint32_t count = 0;
    if (!r.get_count(count)) return false;
    m.setup_steps.resize(count);
    for (auto& step : m.setup_steps) {
        std::uint8_t kind = 0;
        if (!r.get_u8(kind) || kind > static_cast<std::uint8_t>(SetupStepKind::INITIALIZE_DERIVED_ADDRESS)) {
            return false;
        }
        step.kind = static_cast<SetupStepKind>(kind);
        if (!r.get_string(step.account) || !r.get_string(step.description) ||
            !r.get_strings(step.depends_on)) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// JSON
// ============================================================================

template<typename Writer>
void write_string_array(Writer& w, const std::vector<std::string>& list) {
    w.StartArray();
    for (const auto& s : list) {
        w.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
    }
    w.EndArray();
}

template<typename Writer>
void write_key_string(Writer& w, const char* key, const std::string& value) {
    w.Key(key);
    w.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

template<typename Writer>
void write_json(Writer& w, const TestSuiteMetadata& m) {
    w.StartObject();
    write_key_string(w, "programId", m.program_id);
    write_key_string(w, "programName", m.program_name);
    write_key_string(w, "label", m.label);
    w.Key("executionOrder");
    write_string_array(w, m.execution_order);
    w.Key("initializationOrder");
    write_string_array(w, m.initialization_order);

    w.Key("setupSteps");
    w.StartArray();
    for (const auto& step : m.setup_steps) {
        w.StartObject();
        w.Key("kind");
        w.String(setup_step_kind_name(step.kind).data());
        write_key_string(w, "account", step.account);
        write_key_string(w, "description", step.description);
        w.Key("dependsOn");
        write_string_array(w, step.depends_on);
        w.EndObject();
    }
    w.EndArray();

    w.Key("perInstruction");
    w.StartArray();
    for (const auto& plan : m.instructions) {
        w.StartObject();
        write_key_string(w, "name", plan.name);
        w.Key("accountOrder");
        write_string_array(w, plan.account_order);

        w.Key("derivedAddresses");
        w.StartArray();
        for (const auto& d : plan.derived_addresses) {
            w.StartObject();
            write_key_string(w, "account", d.account);
            w.Key("seeds");
            w.StartArray();
            for (const auto& seed : d.seeds) {
                w.StartObject();
                w.Key("kind");
                w.String(seed_kind_name(seed.kind).data());
                write_key_string(w, "value", seed.value);
                w.EndObject();
            }
            w.EndArray();
            if (!d.owning_program.empty()) write_key_string(w, "owningProgram", d.owning_program);
            if (d.resolved) {
                write_key_string(w, "address", d.address);
                w.Key("nonce");
                w.Uint(d.nonce);
            }
            w.EndObject();
        }
        w.EndArray();

        w.Key("testCases");
        w.StartArray();
        for (const auto& tc : plan.test_cases) {
            w.StartObject();
            w.Key("kind");
            w.String(test_case_kind_name(tc.kind).data());
            write_key_string(w, "description", tc.description);
            if (!tc.target_argument.empty()) write_key_string(w, "targetArgument", tc.target_argument);

            w.Key("argumentValues");
            w.StartArray();
            for (const auto& v : tc.values) {
                w.StartObject();
                write_key_string(w, "name", v.argument);
                write_key_string(w, "value", v.value);
                w.Key("valid");
                w.Bool(v.valid);
                if (!v.reason.empty()) write_key_string(w, "reason", v.reason);
                w.EndObject();
            }
            w.EndArray();

            w.Key("expectedOutcome");
            w.StartObject();
            w.Key("kind");
            w.String(tc.expected.is_success() ? "Success" : "FailureContains");
            if (!tc.expected.is_success()) write_key_string(w, "errorCode", tc.expected.error_code);
            write_key_string(w, "message", tc.expected.message);
            w.EndObject();

            w.EndObject();
        }
        w.EndArray();
        w.EndObject();
    }
    w.EndArray();
    w.EndObject();
}

Failure sink_failure(const std::string& path, const std::string& detail) {
    Failure f;
    f.code = ErrorCode::RESOURCE_EXHAUSTED;
    f.names.push_back(path);
    f.detail = detail;
    log::assembly.error() << "Sink " << path << ": " << detail;
    return f;
}

}  // namespace

// ============================================================================
// Binary Encoding
// ============================================================================

bytes_t serialize_metadata(const TestSuiteMetadata& metadata) {
    ByteWriter w;
    write_header(w, metadata);
    w.put_u32(static_cast<std::uint32_t>(metadata.instructions.size()));
    for (const auto& plan : metadata.instructions) {
        write_plan(w, plan);
    }
    return w.take();
}

std::optional<TestSuiteMetadata> deserialize_metadata(std::span<const std::uint8_t> data) {
    ByteReader r(data);
    TestSuiteMetadata metadata;
    if (!read_header(r, metadata)) {
        return std::nullopt;
    }
    std::uint32_t count = 0;
    if (!r.get_count(count)) {
        return std::nullopt;
    }
    metadata.instructions.resize(count);
    for (auto& plan : metadata.instructions) {
        if (!read_plan(r, plan)) return std::nullopt;
    }
    if (!r.at_end()) {
        return std::nullopt;
    }
    return metadata;
}

bytes_t serialize_instruction_plan(const InstructionPlan& plan) {
    ByteWriter w;
    write_plan(w, plan);
    return w.take();
}

std::optional<InstructionPlan> deserialize_instruction_plan(std::span<const std::uint8_t> data) {
    ByteReader r(data);
    InstructionPlan plan;
    if (!read_plan(r, plan) || !r.at_end()) {
        return std::nullopt;
    }
    return plan;
}

// ============================================================================
// JSON Rendering
// ============================================================================

std::string metadata_to_json(const TestSuiteMetadata& metadata, bool pretty) {
    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        write_json(writer, metadata);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        write_json(writer, metadata);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

// ============================================================================
// Chunking
// ============================================================================

ChunkResult chunk_by_instruction(const TestSuiteMetadata& metadata, std::size_t ceiling) {
    ChunkResult result;

    TestSuiteMetadata header = metadata;
    header.instructions.clear();

    MetadataChunk first;
    first.index = 0;
    first.payload = serialize_metadata(header);
    result.chunks.push_back(std::move(first));

    for (const auto& plan : metadata.instructions) {
        MetadataChunk chunk;
        chunk.index = static_cast<std::uint32_t>(result.chunks.size());
        chunk.instruction = plan.name;
        chunk.payload = serialize_instruction_plan(plan);
        result.chunks.push_back(std::move(chunk));
    }

    for (const auto& chunk : result.chunks) {
        if (chunk.payload.size() > ceiling) {
            result.failure.code = ErrorCode::RESOURCE_EXHAUSTED;
            result.failure.names = {chunk.instruction.empty() ? std::string("header") : chunk.instruction};
            result.failure.detail = "chunk of " + std::to_string(chunk.payload.size()) +
                                    " bytes exceeds ceiling of " + std::to_string(ceiling);
            log::assembly.error() << result.failure.to_string();
            result.chunks.clear();
            return result;
        }
    }
    return result;
}

std::optional<TestSuiteMetadata> reassemble_chunks(const std::vector<MetadataChunk>& chunks) {
    if (chunks.empty() || !chunks.front().instruction.empty()) {
        return std::nullopt;
    }
    auto metadata = deserialize_metadata(chunks.front().payload);
    if (!metadata || !metadata->instructions.empty()) {
        return std::nullopt;
    }
    for (std::size_t i = 1; i < chunks.size(); ++i) {
        auto plan = deserialize_instruction_plan(chunks[i].payload);
        if (!plan || plan->name != chunks[i].instruction) {
            return std::nullopt;
        }
        metadata->instructions.push_back(std::move(*plan));
    }
    return metadata;
}

// ============================================================================
// Sinks
// ============================================================================

JsonFileSink::JsonFileSink(std::string path, bool pretty) : path_(std::move(path)), pretty_(pretty) {}

Failure JsonFileSink::accept(const TestSuiteMetadata& metadata) {
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if (!out) {
        return sink_failure(path_, "cannot open output file");
    }
    out << metadata_to_json(metadata, pretty_) << '\n';
    if (!out) {
        return sink_failure(path_, "write failed");
    }
    log::assembly.info() << "Wrote " << metadata.test_case_count() << " test cases to " << path_;
    return {};
}

BinaryFileSink::BinaryFileSink(std::string path) : path_(std::move(path)) {}

Failure BinaryFileSink::accept(const TestSuiteMetadata& metadata) {
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if (!out) {
        return sink_failure(path_, "cannot open output file");
    }
    auto bytes = serialize_metadata(metadata);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        return sink_failure(path_, "write failed");
    }
    return {};
}

Failure MemoryMetadataSink::accept(const TestSuiteMetadata& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    received_.push_back(metadata);
    return {};
}

std::vector<TestSuiteMetadata> MemoryMetadataSink::received() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_;
}

std::size_t MemoryMetadataSink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_.size();
}

}  // namespace suitegen
