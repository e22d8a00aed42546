#include "test_case.hh"
#include <algorithm>

namespace suitegen {

std::string_view test_case_kind_name(TestCaseKind kind) {
    switch (kind) {
        case TestCaseKind::POSITIVE: return "Positive";
        case TestCaseKind::NEGATIVE_EMPTY: return "NegativeEmpty";
        case TestCaseKind::NEGATIVE_TOO_LONG: return "NegativeTooLong";
        case TestCaseKind::NEGATIVE_ZERO: return "NegativeZero";
        case TestCaseKind::NEGATIVE_NEGATIVE: return "NegativeNegative";
        case TestCaseKind::NEGATIVE_OVERFLOW: return "NegativeOverflow";
        case TestCaseKind::NEGATIVE_CONSTRAINT: return "NegativeConstraint";
    }
    return "Unknown";
}

ExpectedOutcome ExpectedOutcome::success(std::string message) {
    ExpectedOutcome outcome;
    outcome.kind = OutcomeKind::SUCCESS;
    outcome.message = std::move(message);
    return outcome;
}

ExpectedOutcome ExpectedOutcome::failure(std::string error_code, std::string message) {
    ExpectedOutcome outcome;
    outcome.kind = OutcomeKind::FAILURE;
    outcome.error_code = std::move(error_code);
    outcome.message = std::move(message);
    return outcome;
}

const ArgumentSample* TestCase::value_of(std::string_view argument) const {
    auto it = std::find_if(values.begin(), values.end(),
                           [argument](const ArgumentSample& s) { return s.argument == argument; });
    return it == values.end() ? nullptr : &*it;
}

}  // namespace suitegen
