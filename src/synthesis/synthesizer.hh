#pragma once

#include "core/status.hh"
#include "core/types.hh"
#include "model/interface.hh"
#include "synthesis/test_case.hh"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace suitegen {

// ============================================================================
// Synthesis Configuration
// ============================================================================

struct SynthesisConfig {
    // Length of the too-long string when no maximum is declared
    std::size_t oversized_string_length = OVERSIZED_STRING_LENGTH;

    // Emit the "all arguments invalid" case for instructions with more than one argument
    bool emit_combined_case = true;

    // Domain prefix for deterministic public key samples
    std::string pubkey_domain = "suitegen";
};

struct SynthesisResult {
    std::vector<TestCase> cases;
    Failure failure;

    [[nodiscard]] bool ok() const { return failure.code == ErrorCode::OK; }
};

// ============================================================================
// Test Case Synthesizer
// ============================================================================

// Produces, per instruction: one positive case, the negative cases of every
// argument in declared order, then the combined invalid case. Output depends
// only on the model and the configuration.
class TestCaseSynthesizer {
public:
    explicit TestCaseSynthesizer(const InterfaceModel& model, SynthesisConfig config = {});

    [[nodiscard]] SynthesisResult synthesize(const InstructionSpec& instruction) const;

    // Looks the instruction up by name; UNKNOWN_INSTRUCTION when absent
    [[nodiscard]] SynthesisResult synthesize(std::string_view instruction_name) const;

    [[nodiscard]] const SynthesisConfig& config() const { return config_; }

private:
    struct NegativeCase {
        TestCaseKind kind = TestCaseKind::NEGATIVE_CONSTRAINT;
        std::string summary;              // Appended to "<instruction> - <argument> "
        std::string value;
        std::string reason;
        ExpectedOutcome expected;
    };

    struct ArgumentPlan {
        ArgumentSample positive;
        std::vector<NegativeCase> negatives;
    };

    const InterfaceModel& model_;
    SynthesisConfig config_;

    [[nodiscard]] bool plan_argument(const InstructionSpec& instruction, const ArgumentSpec& arg,
                                     ArgumentPlan& plan) const;

    void plan_string(const ArgumentSpec& arg, ArgumentPlan& plan) const;
    void plan_unsigned(const ArgumentSpec& arg, ArgumentPlan& plan) const;
    void plan_signed(const ArgumentSpec& arg, ArgumentPlan& plan) const;
    void plan_public_key(const InstructionSpec& instruction, const ArgumentSpec& arg,
                         ArgumentPlan& plan) const;
    void plan_composite(const ArgumentSpec& arg, ArgumentPlan& plan) const;

    // Declared constraint error when present, else the default code and message
    [[nodiscard]] ExpectedOutcome expect_failure(const ArgumentSpec& arg, const std::string& key,
                                                 const std::string& default_code,
                                                 const std::string& default_message) const;
};

// Largest value of an unsigned or signed integer type, as decimal text
[[nodiscard]] std::string integer_type_max(const DataType& type);

}  // namespace suitegen
