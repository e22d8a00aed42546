#include "synthesizer.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"
#include <algorithm>
#include <limits>

namespace suitegen {

namespace {

std::uint64_t unsigned_limit(std::uint16_t width) {
    if (width >= 64) return std::numeric_limits<std::uint64_t>::max();
    return (std::uint64_t{1} << width) - 1;
}

std::int64_t signed_upper(std::uint16_t width) {
    if (width >= 64) return std::numeric_limits<std::int64_t>::max();
    return (std::int64_t{1} << (width - 1)) - 1;
}

std::int64_t signed_lower(std::uint16_t width) {
    if (width >= 64) return std::numeric_limits<std::int64_t>::min();
    return -(std::int64_t{1} << (width - 1));
}

}  // namespace

std::string integer_type_max(const DataType& type) {
    if (type.kind == DataKind::UNSIGNED_INTEGER) {
        if (type.width_bits == 128) return "340282366920938463463374607431768211455";
        return std::to_string(unsigned_limit(type.width_bits));
    }
    if (type.kind == DataKind::SIGNED_INTEGER) {
        if (type.width_bits == 128) return "170141183460469231731687303715884105727";
        return std::to_string(signed_upper(type.width_bits));
    }
    return {};
}

// ============================================================================
// TestCaseSynthesizer
// ============================================================================

TestCaseSynthesizer::TestCaseSynthesizer(const InterfaceModel& model, SynthesisConfig config)
    : model_(model), config_(std::move(config)) {}

ExpectedOutcome TestCaseSynthesizer::expect_failure(const ArgumentSpec& arg, const std::string& key,
                                                    const std::string& default_code,
                                                    const std::string& default_message) const {
    auto it = arg.constraints.errors.find(key);
    if (it != arg.constraints.errors.end()) {
        if (const ErrorSpec* declared = model_.find_error(it->second)) {
            return ExpectedOutcome::failure(declared->name,
                                            declared->message.empty() ? default_message : declared->message);
        }
        // Not a declared error name: the text itself is the expected message
        return ExpectedOutcome::failure(default_code, it->second);
    }
    if (const ErrorSpec* declared = model_.find_error(default_code)) {
        return ExpectedOutcome::failure(declared->name,
                                        declared->message.empty() ? default_message : declared->message);
    }
    return ExpectedOutcome::failure(default_code, default_message);
}

void TestCaseSynthesizer::plan_string(const ArgumentSpec& arg, ArgumentPlan& plan) const {
    const auto& c = arg.constraints;

    std::string sample(STRING_SAMPLE);
    if (c.max_length && *c.max_length < sample.size()) {
        sample.assign(*c.max_length, 'a');
    } else if (c.min_length && *c.min_length > sample.size()) {
        sample.assign(*c.min_length, 'a');
    }
    plan.positive.value = std::move(sample);

    plan.negatives.push_back(NegativeCase{
        TestCaseKind::NEGATIVE_EMPTY, "empty string", "", "String cannot be empty",
        expect_failure(arg, "empty", "EmptyString", "String cannot be empty")});

    std::size_t too_long = c.max_length ? static_cast<std::size_t>(*c.max_length) + 1
                                        : config_.oversized_string_length;
    plan.negatives.push_back(NegativeCase{
        TestCaseKind::NEGATIVE_TOO_LONG, "too long", std::string(too_long, 'a'),
        "Exceeds maximum length",
        expect_failure(arg, "maxLength", "StringTooLong", "String exceeds maximum length")});

    if (c.min_length && *c.min_length > 1) {
        std::uint32_t n = *c.min_length;
        plan.negatives.push_back(NegativeCase{
            TestCaseKind::NEGATIVE_CONSTRAINT, "too short", std::string(n - 1, 'a'),
            "Below minimum length of " + std::to_string(n),
            expect_failure(arg, "minLength", "ConstraintViolation",
                           arg.name + " must be at least " + std::to_string(n) + " characters")});
    }
}

void TestCaseSynthesizer::plan_unsigned(const ArgumentSpec& arg, ArgumentPlan& plan) const {
    const auto& c = arg.constraints;
    const std::uint64_t type_max = unsigned_limit(arg.type.width_bits);

    std::uint64_t lo = 0;
    if (c.min && *c.min > 0) lo = static_cast<std::uint64_t>(*c.min);
    if (c.nonzero) lo = std::max<std::uint64_t>(lo, 1);
    std::uint64_t hi = type_max;
    if (c.max && *c.max >= 0) hi = std::min(hi, static_cast<std::uint64_t>(*c.max));
    std::uint64_t sample = UNSIGNED_SAMPLE;
    if (lo <= hi) sample = std::clamp(sample, lo, hi);
    plan.positive.value = std::to_string(std::min(sample, type_max));

    if (c.min && *c.min > 0) {
        std::int64_t value = *c.min;
        plan.negatives.push_back(NegativeCase{
            TestCaseKind::NEGATIVE_CONSTRAINT, "below minimum", std::to_string(value - 1),
            "Below minimum value of " + std::to_string(value),
            expect_failure(arg, "min", "ConstraintViolation",
                           arg.name + " must be at least " + std::to_string(value))});
    }
    if (c.max && *c.max >= 0 && static_cast<std::uint64_t>(*c.max) < type_max) {
        std::int64_t value = *c.max;
        plan.negatives.push_back(NegativeCase{
            TestCaseKind::NEGATIVE_CONSTRAINT, "above maximum",
            std::to_string(static_cast<std::uint64_t>(value) + 1),
            "Above maximum value of " + std::to_string(value),
            expect_failure(arg, "max", "ConstraintViolation",
                           arg.name + " must be at most " + std::to_string(value))});
    }
    if (c.disallows_zero()) {
        plan.negatives.push_back(NegativeCase{
            TestCaseKind::NEGATIVE_ZERO, "is zero", "0", "Must be non-zero",
            expect_failure(arg, "nonzero", "ZeroAmount", arg.name + " cannot be zero")});
    }

    plan.negatives.push_back(NegativeCase{
        TestCaseKind::NEGATIVE_OVERFLOW, "overflow", integer_type_max(arg.type),
        "Potential arithmetic overflow",
        expect_failure(arg, "overflow", "Overflow", "Arithmetic overflow")});

    plan.negatives.push_back(NegativeCase{
        TestCaseKind::NEGATIVE_NEGATIVE, "negative value", "-1", "Unsigned type cannot be negative",
        expect_failure(arg, "negative", "InvalidType", "Unsigned integer cannot be negative")});
}

void TestCaseSynthesizer::plan_signed(const ArgumentSpec& arg, ArgumentPlan& plan) const {
    const auto& c = arg.constraints;
    const std::int64_t type_lo = signed_lower(arg.type.width_bits);
    const std::int64_t type_hi = signed_upper(arg.type.width_bits);

    std::int64_t lo = std::max(type_lo, c.min.value_or(type_lo));
    std::int64_t hi = std::min(type_hi, c.max.value_or(type_hi));
    std::int64_t sample = SIGNED_SAMPLE;
    if (lo <= hi) sample = std::clamp(sample, lo, hi);
    if (c.nonzero && sample == 0) sample = hi > 0 ? 1 : -1;
    plan.positive.value = std::to_string(sample);

    if (c.min && *c.min > type_lo) {
        std::int64_t value = *c.min;
        plan.negatives.push_back(NegativeCase{
            TestCaseKind::NEGATIVE_CONSTRAINT, "below minimum", std::to_string(value - 1),
            "Below minimum value of " + std::to_string(value),
            expect_failure(arg, "min", "ConstraintViolation",
                           arg.name + " must be at least " + std::to_string(value))});
    }
    if (c.max && *c.max < type_hi) {
        std::int64_t value = *c.max;
        plan.negatives.push_back(NegativeCase{
            TestCaseKind::NEGATIVE_CONSTRAINT, "above maximum", std::to_string(value + 1),
            "Above maximum value of " + std::to_string(value),
            expect_failure(arg, "max", "ConstraintViolation",
                           arg.name + " must be at most " + std::to_string(value))});
    }
    if (c.disallows_zero()) {
        plan.negatives.push_back(NegativeCase{
            TestCaseKind::NEGATIVE_ZERO, "is zero", "0", "Must be non-zero",
            expect_failure(arg, "nonzero", "ZeroAmount", arg.name + " cannot be zero")});
    }
}

void TestCaseSynthesizer::plan_public_key(const InstructionSpec& instruction, const ArgumentSpec& arg,
                                          ArgumentPlan& plan) const {
    hash_t digest = sha256(config_.pubkey_domain + ":" + instruction.name + ":" + arg.name);
    plan.positive.value = encode_base58(digest);

    if (arg.constraints.nonzero) {
        plan.negatives.push_back(NegativeCase{
            TestCaseKind::NEGATIVE_ZERO, "is zero", Pubkey{}.to_base58(), "Must be non-zero",
            expect_failure(arg, "nonzero", "ZeroAmount", arg.name + " cannot be zero")});
    }
}

void TestCaseSynthesizer::plan_composite(const ArgumentSpec& arg, ArgumentPlan& plan) const {
    const auto& type = arg.type;
    switch (type.composite) {
        case CompositeKind::ENUM:
            plan.positive.value = type.variants.empty() ? "0" : type.variants.front();
            plan.negatives.push_back(NegativeCase{
                TestCaseKind::NEGATIVE_CONSTRAINT, "invalid variant", std::to_string(type.variants.size()),
                "Variant index out of range",
                expect_failure(arg, "enum", "InvalidVariant",
                               arg.name + " is not a valid " + type.name + " variant")});
            return;

        case CompositeKind::OPTION:
            plan.positive.value = "null";
            return;

        case CompositeKind::ARRAY:
            plan.positive.value = "[0; " + std::to_string(type.array_length) + "]";
            return;

        case CompositeKind::VEC:
        case CompositeKind::BYTES:
            plan.positive.value = "[]";
            if (arg.constraints.max_length) {
                std::uint32_t n = *arg.constraints.max_length;
                plan.negatives.push_back(NegativeCase{
                    TestCaseKind::NEGATIVE_TOO_LONG, "too long",
                    "[0; " + std::to_string(static_cast<std::uint64_t>(n) + 1) + "]",
                    "Exceeds maximum length",
                    expect_failure(arg, "maxLength", "VectorTooLong",
                                   arg.name + " exceeds maximum length of " + std::to_string(n))});
            }
            return;

        case CompositeKind::STRUCT:
        case CompositeKind::NONE:
            plan.positive.value = "{}";
            return;
    }
}

bool TestCaseSynthesizer::plan_argument(const InstructionSpec& instruction, const ArgumentSpec& arg,
                                        ArgumentPlan& plan) const {
    plan.positive.argument = arg.name;
    plan.positive.valid = true;

    switch (arg.type.kind) {
        case DataKind::STRING: plan_string(arg, plan); return true;
        case DataKind::UNSIGNED_INTEGER: plan_unsigned(arg, plan); return true;
        case DataKind::SIGNED_INTEGER: plan_signed(arg, plan); return true;
        case DataKind::BOOLEAN: plan.positive.value = "true"; return true;
        case DataKind::PUBLIC_KEY: plan_public_key(instruction, arg, plan); return true;
        case DataKind::COMPOSITE: plan_composite(arg, plan); return true;
        case DataKind::UNSUPPORTED: return false;
    }
    return false;
}

SynthesisResult TestCaseSynthesizer::synthesize(const InstructionSpec& instruction) const {
    SynthesisResult result;

    std::vector<ArgumentPlan> plans(instruction.args.size());
    for (std::size_t i = 0; i < instruction.args.size(); ++i) {
        const auto& arg = instruction.args[i];
        if (!plan_argument(instruction, arg, plans[i])) {
            result.failure.code = ErrorCode::UNSUPPORTED_TYPE;
            result.failure.names = {instruction.name + "." + arg.name};
            result.failure.detail = "no synthesis policy for type " + arg.type.name;
            log::synthesis.error() << "Unsupported type " << arg.type.name << " for " << instruction.name
                                   << "." << arg.name;
            return result;
        }
    }

    std::vector<ArgumentSample> positives;
    positives.reserve(plans.size());
    for (const auto& plan : plans) {
        positives.push_back(plan.positive);
    }

    TestCase positive;
    positive.kind = TestCaseKind::POSITIVE;
    positive.description = instruction.name + " - valid inputs";
    positive.values = positives;
    positive.expected = ExpectedOutcome::success("Instruction executed without errors");
    result.cases.push_back(std::move(positive));

    for (std::size_t i = 0; i < plans.size(); ++i) {
        const auto& arg = instruction.args[i];
        for (const auto& negative : plans[i].negatives) {
            TestCase tc;
            tc.kind = negative.kind;
            tc.description = instruction.name + " - " + arg.name + " " + negative.summary;
            tc.target_argument = arg.name;
            tc.values = positives;
            tc.values[i].value = negative.value;
            tc.values[i].valid = false;
            tc.values[i].reason = negative.reason;
            tc.expected = negative.expected;
            result.cases.push_back(std::move(tc));
        }
    }

    if (config_.emit_combined_case && plans.size() > 1) {
        TestCase combined;
        combined.kind = TestCaseKind::NEGATIVE_CONSTRAINT;
        combined.description = instruction.name + " - all arguments invalid";
        combined.values = positives;
        bool any_invalid = false;
        for (std::size_t i = 0; i < plans.size(); ++i) {
            if (plans[i].negatives.empty()) continue;
            combined.values[i].value = plans[i].negatives.front().value;
            combined.values[i].valid = false;
            combined.values[i].reason = "Multiple validation failures";
            any_invalid = true;
        }
        if (any_invalid) {
            combined.expected = ExpectedOutcome::failure("", "Multiple validation errors");
            result.cases.push_back(std::move(combined));
        }
    }

    SUITEGEN_LOG_DEBUG(log::synthesis) << "Synthesized " << result.cases.size() << " cases for "
                                       << instruction.name;
    return result;
}

SynthesisResult TestCaseSynthesizer::synthesize(std::string_view instruction_name) const {
    const InstructionSpec* instruction = model_.find_instruction(instruction_name);
    if (!instruction) {
        SynthesisResult result;
        result.failure.code = ErrorCode::UNKNOWN_INSTRUCTION;
        result.failure.names = {std::string(instruction_name)};
        result.failure.detail = "instruction is not declared by " + model_.program_name;
        return result;
    }
    return synthesize(*instruction);
}

}  // namespace suitegen
