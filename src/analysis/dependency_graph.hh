#pragma once

#include "core/status.hh"
#include "model/interface.hh"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace suitegen {

// ============================================================================
// Graph Options
// ============================================================================

struct GraphOptions {
    // Fall back to case-insensitive substring matching when a seed or
    // relation names an account that is not declared anywhere
    bool allow_heuristic_matching = true;
};

// ============================================================================
// Graph Output
// ============================================================================

enum class EdgeReason : std::uint8_t {
    SEED = 0,         // Account referenced by a derived-address seed
    SIGNER = 1,       // Signer of the instruction declaring the derived address
    RELATION = 2,     // has_one style relation target
};

[[nodiscard]] std::string_view edge_reason_name(EdgeReason reason);

// `from` must be initialized before `to`
struct DependencyEdge {
    std::string from;
    std::string to;
    EdgeReason reason = EdgeReason::SEED;

    bool operator==(const DependencyEdge&) const = default;
};

struct HeuristicMatch {
    std::string instruction;
    std::string reference;    // Name as written in the schema
    std::string matched;      // Declared account it was mapped to
};

struct InitOrderResult {
    std::vector<std::string> order;
    std::vector<DependencyEdge> edges;
    std::vector<HeuristicMatch> heuristic_matches;
    Failure failure;

    [[nodiscard]] bool ok() const { return failure.code == ErrorCode::OK; }

    // Accounts that must precede `account`, in first-seen order
    [[nodiscard]] std::vector<std::string> dependencies_of(std::string_view account) const;

    // Position of `account` in the order, or nullopt when absent
    [[nodiscard]] std::optional<std::size_t> position_of(std::string_view account) const;
};

// ============================================================================
// Dependency Graph Builder
// ============================================================================

// Builds the global account initialization order for every instruction of a
// model. Nodes are merged by exact declared name and kept in first-seen
// order; ties in the topological sort are broken by that order, so the
// output is deterministic.
class DependencyGraphBuilder {
public:
    explicit DependencyGraphBuilder(const InterfaceModel& model, GraphOptions options = {});

    [[nodiscard]] InitOrderResult build() const;

private:
    const InterfaceModel& model_;
    GraphOptions options_;

    [[nodiscard]] std::optional<std::string> match_heuristic(std::string_view reference,
                                                             const std::vector<std::string>& nodes) const;
};

}  // namespace suitegen
