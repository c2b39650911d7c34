#pragma once

#include "trellis/resource_cache.hpp"
#include "trellis/resources.hpp"
#include "trellis/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace trellis {

// ============================================================================
// Delegation Graph
// ============================================================================

// Arena of proxy documents. Inclusion edges refer to documents by arena
// index, never by pointer, so traversal state is a plain index stack.
class DelegationGraph {
public:
    explicit DelegationGraph(std::vector<const Document*> proxies);

    static DelegationGraph from_snapshot(const CacheSnapshot& snapshot);

    std::size_t size() const { return documents_.size(); }
    const Document& document(std::size_t index) const { return *documents_[index]; }
    const ProxySpec& proxy(std::size_t index) const { return *documents_[index]->proxy(); }
    bool is_root(std::size_t index) const { return documents_[index]->is_root(); }

    std::optional<std::size_t> find(const std::string& ns, const std::string& name) const;

    // "ns/name" of an arena entry
    std::string label(std::size_t index) const;

private:
    std::vector<const Document*> documents_;
    std::map<std::pair<std::string, std::string>, std::size_t> index_;
};

// ============================================================================
// Delegation Paths
// ============================================================================

// One distinct way of reaching a document from a root.
struct DelegationPath {
    std::size_t root = 0;
    std::vector<std::size_t> chain;            // arena indices, root first
    std::vector<std::size_t> include_indices;  // include of chain[i] leading to chain[i + 1]

    // Set when the path ends in an include whose target is missing or is
    // itself a root. The include's condition is served as a 502 route.
    std::optional<std::size_t> dangling_include;

    std::size_t leaf() const { return chain.back(); }
};

struct DelegationIssue {
    std::size_t document = 0;
    Severity severity = Severity::Error;
    ConditionType type = ConditionType::IncludeError;
    std::string reason;
    std::string message;
};

struct DelegationResult {
    std::vector<DelegationPath> paths;  // DFS order, parent before child
    std::vector<DelegationIssue> issues;
    std::vector<bool> reachable;        // by arena index
    std::vector<bool> in_cycle;         // by arena index
};

// Walk every valid root (arena indices, in the order given). Every
// document, reachable or not, has its includes checked; documents on an
// include cycle are excluded from every tree.
DelegationResult resolve_delegation(const DelegationGraph& graph,
                                    const std::vector<std::size_t>& valid_roots);

} // namespace trellis
