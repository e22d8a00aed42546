#include "dependency_graph.hh"
#include "analysis/derived_address.hh"
#include "core/logging.hh"
#include <algorithm>
#include <cctype>
#include <functional>
#include <queue>
#include <set>
#include <unordered_map>

namespace suitegen {

namespace {

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

std::string_view edge_reason_name(EdgeReason reason) {
    switch (reason) {
        case EdgeReason::SEED: return "seed";
        case EdgeReason::SIGNER: return "signer";
        case EdgeReason::RELATION: return "relation";
    }
    return "unknown";
}

// ============================================================================
// InitOrderResult
// ============================================================================

std::vector<std::string> InitOrderResult::dependencies_of(std::string_view account) const {
    std::vector<std::string> deps;
    for (const auto& edge : edges) {
        if (edge.to == account && std::find(deps.begin(), deps.end(), edge.from) == deps.end()) {
            deps.push_back(edge.from);
        }
    }
    return deps;
}

std::optional<std::size_t> InitOrderResult::position_of(std::string_view account) const {
    auto it = std::find(order.begin(), order.end(), account);
    if (it == order.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - order.begin());
}

// ============================================================================
// DependencyGraphBuilder
// ============================================================================

DependencyGraphBuilder::DependencyGraphBuilder(const InterfaceModel& model, GraphOptions options)
    : model_(model), options_(options) {}

std::optional<std::string> DependencyGraphBuilder::match_heuristic(
    std::string_view reference, const std::vector<std::string>& nodes) const {
    if (!options_.allow_heuristic_matching) {
        return std::nullopt;
    }
    std::string needle = to_lower(reference);
    for (const auto& node : nodes) {
        std::string candidate = to_lower(node);
        if (candidate.find(needle) != std::string::npos || needle.find(candidate) != std::string::npos) {
            return node;
        }
    }
    return std::nullopt;
}

InitOrderResult DependencyGraphBuilder::build() const {
    InitOrderResult result;

    // Nodes in first-seen order
    std::vector<std::string> nodes;
    std::unordered_map<std::string, std::size_t> index;
    for (const auto& instruction : model_.instructions) {
        for (const auto& account : instruction.accounts) {
            if (index.emplace(account.canonical_key, nodes.size()).second) {
                nodes.push_back(account.canonical_key);
            }
        }
    }

    std::set<std::pair<std::size_t, std::size_t>> seen_edges;
    auto add_edge = [&](const std::string& from, const std::string& to, EdgeReason reason) {
        if (seen_edges.emplace(index.at(from), index.at(to)).second) {
            result.edges.push_back(DependencyEdge{from, to, reason});
        }
    };

    // Maps a referenced name onto a declared node, or records the failure
    auto lookup = [&](const std::string& instruction, const std::string& reference)
        -> std::optional<std::string> {
        if (index.count(reference)) {
            return reference;
        }
        auto matched = match_heuristic(reference, nodes);
        if (!matched) {
            result.failure.code = ErrorCode::AMBIGUOUS_SEED;
            result.failure.names = {reference};
            result.failure.detail = "no declared account matches \"" + reference + "\" in " + instruction;
            log::graph.error() << result.failure.detail;
            return std::nullopt;
        }
        log::graph.warn() << "Heuristic match in " << instruction << ": \"" << reference
                          << "\" resolved to account \"" << *matched << "\"";
        result.heuristic_matches.push_back(HeuristicMatch{instruction, reference, *matched});
        return matched;
    };

    SeedScope scope;
    scope.accounts = nodes;

    for (const auto& instruction : model_.instructions) {
        scope.arguments.clear();
        for (const auto& arg : instruction.args) {
            scope.arguments.push_back(arg.name);
        }

        for (const auto& account : instruction.accounts) {
            for (const auto& relation : account.relations) {
                auto target = lookup(instruction.name, relation);
                if (!target) return result;
                add_edge(*target, account.canonical_key, EdgeReason::RELATION);
            }

            if (!account.derived) continue;

            auto inspection = inspect_seeds(*account.derived, scope);
            for (const auto& ref : inspection.account_refs) {
                auto source = lookup(instruction.name, ref.root);
                if (!source) return result;
                add_edge(*source, account.canonical_key, EdgeReason::SEED);
            }

            for (const auto& signer : instruction.accounts) {
                if (!signer.is_signer || signer.is_derived() || signer.canonical_key == account.canonical_key) {
                    continue;
                }
                add_edge(signer.canonical_key, account.canonical_key, EdgeReason::SIGNER);
            }
        }
    }

    // Kahn's algorithm, smallest first-seen index first
    std::vector<std::size_t> in_degree(nodes.size(), 0);
    std::vector<std::vector<std::size_t>> successors(nodes.size());
    for (const auto& [from, to] : seen_edges) {
        successors[from].push_back(to);
        ++in_degree[to];
    }

    std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<>> ready;
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        if (in_degree[i] == 0) ready.push(i);
    }

    std::vector<std::size_t> sorted;
    sorted.reserve(nodes.size());
    while (!ready.empty()) {
        std::size_t current = ready.top();
        ready.pop();
        sorted.push_back(current);
        for (std::size_t next : successors[current]) {
            if (--in_degree[next] == 0) ready.push(next);
        }
    }

    if (sorted.size() != nodes.size()) {
        result.failure.code = ErrorCode::DEPENDENCY_CYCLE;
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            if (in_degree[i] > 0) result.failure.names.push_back(nodes[i]);
        }
        result.failure.detail = "accounts form a dependency cycle";
        log::graph.error() << "Dependency cycle among " << result.failure.names.size() << " accounts";
        return result;
    }

    result.order.reserve(sorted.size());
    for (std::size_t i : sorted) {
        result.order.push_back(nodes[i]);
    }

    SUITEGEN_LOG_DEBUG(log::graph) << "Initialization order: " << result.order.size() << " accounts, "
                                   << result.edges.size() << " edges";
    return result;
}

}  // namespace suitegen
