#include "trellis/delegation.hpp"

#include "trellis/conditions.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <set>

namespace trellis {

namespace {

enum class EdgeKind {
    Child,     // followed during traversal
    Dangling,  // missing target or root target, served as 502
    Dropped    // target lies on an include cycle
};

struct Edge {
    std::size_t include_index = 0;
    EdgeKind kind = EdgeKind::Child;
    std::size_t target = 0;
};

void add_issue(DelegationResult& result, std::size_t doc, Severity severity,
               const std::string& reason, const std::string& message) {
    DelegationIssue issue;
    issue.document = doc;
    issue.severity = severity;
    issue.type = ConditionType::IncludeError;
    issue.reason = reason;
    issue.message = message;
    result.issues.push_back(std::move(issue));
}

// Check every include of every document and classify its edge
std::vector<std::vector<Edge>> collect_edges(const DelegationGraph& graph, DelegationResult& result) {
    std::vector<std::vector<Edge>> edges(graph.size());

    for (std::size_t d = 0; d < graph.size(); ++d) {
        const auto& doc = graph.document(d);
        const auto& includes = graph.proxy(d).includes;
        std::set<std::string> seen;

        for (std::size_t i = 0; i < includes.size(); ++i) {
            const auto& inc = includes[i];

            auto check = validate_condition_block(inc.conditions, false);
            if (!check.ok) {
                add_issue(result, d, Severity::Error, check.reason, "include: " + check.error);
                continue;
            }

            std::string sig = include_condition_signature(inc.conditions);
            if (!sig.empty() && !seen.insert(sig).second) {
                add_issue(result, d, Severity::Error, "DuplicateMatchConditions",
                          "duplicate conditions defined on an include");
                continue;
            }

            std::string ns = inc.ns.empty() ? doc.key.ns : inc.ns;
            auto target = graph.find(ns, inc.name);

            Edge edge;
            edge.include_index = i;
            if (!target) {
                add_issue(result, d, Severity::Error, "IncludeNotFound",
                          "include " + ns + "/" + inc.name + " not found");
                edge.kind = EdgeKind::Dangling;
            } else if (graph.is_root(*target)) {
                add_issue(result, d, Severity::Error, "RootIncludesRoot",
                          "root proxy cannot be included (" + ns + "/" + inc.name + ")");
                edge.kind = EdgeKind::Dangling;
            } else {
                edge.kind = EdgeKind::Child;
                edge.target = *target;
            }
            edges[d].push_back(edge);
        }
    }

    return edges;
}

// Tarjan's strongly connected components over Child edges, iterative.
// Returns the component id of every document.
std::vector<std::size_t> strongly_connected(const std::vector<std::vector<Edge>>& edges,
                                            std::vector<std::size_t>& component_size) {
    const std::size_t n = edges.size();
    const std::size_t unvisited = static_cast<std::size_t>(-1);

    std::vector<std::size_t> index(n, unvisited);
    std::vector<std::size_t> low(n, 0);
    std::vector<bool> on_stack(n, false);
    std::vector<std::size_t> component(n, unvisited);
    std::vector<std::size_t> stack;
    std::size_t counter = 0;

    struct Frame {
        std::size_t node;
        std::size_t edge;
    };

    for (std::size_t start = 0; start < n; ++start) {
        if (index[start] != unvisited) continue;

        std::vector<Frame> calls;
        calls.push_back({start, 0});
        index[start] = low[start] = counter++;
        stack.push_back(start);
        on_stack[start] = true;

        while (!calls.empty()) {
            std::size_t u = calls.back().node;

            if (calls.back().edge < edges[u].size()) {
                const Edge& e = edges[u][calls.back().edge++];
                if (e.kind != EdgeKind::Child) continue;

                std::size_t w = e.target;
                if (index[w] == unvisited) {
                    index[w] = low[w] = counter++;
                    stack.push_back(w);
                    on_stack[w] = true;
                    calls.push_back({w, 0});
                } else if (on_stack[w]) {
                    low[u] = std::min(low[u], index[w]);
                }
                continue;
            }

            if (low[u] == index[u]) {
                std::size_t id = component_size.size();
                std::size_t size = 0;
                std::size_t w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    on_stack[w] = false;
                    component[w] = id;
                    ++size;
                } while (w != u);
                component_size.push_back(size);
            }

            calls.pop_back();
            if (!calls.empty()) {
                std::size_t parent = calls.back().node;
                low[parent] = std::min(low[parent], low[u]);
            }
        }
    }

    return component;
}

// Shortest include path from d back to itself within its component
std::vector<std::size_t> cycle_through(std::size_t d, const std::vector<std::vector<Edge>>& edges,
                                       const std::vector<std::size_t>& component) {
    const std::size_t none = static_cast<std::size_t>(-1);
    std::vector<std::size_t> parent(edges.size(), none);
    std::vector<bool> visited(edges.size(), false);
    std::deque<std::size_t> queue;

    queue.push_back(d);
    std::size_t closing = none;

    while (!queue.empty() && closing == none) {
        std::size_t u = queue.front();
        queue.pop_front();
        for (const auto& e : edges[u]) {
            if (e.kind != EdgeKind::Child || component[e.target] != component[d]) continue;
            if (e.target == d) {
                closing = u;
                break;
            }
            if (!visited[e.target]) {
                visited[e.target] = true;
                parent[e.target] = u;
                queue.push_back(e.target);
            }
        }
    }

    std::vector<std::size_t> path;
    if (closing == none) return path;

    for (std::size_t u = closing; u != d; u = parent[u]) {
        path.push_back(u);
    }
    path.push_back(d);
    std::reverse(path.begin(), path.end());
    path.push_back(d);
    return path;
}

bool has_self_loop(std::size_t d, const std::vector<std::vector<Edge>>& edges) {
    for (const auto& e : edges[d]) {
        if (e.kind == EdgeKind::Child && e.target == d) return true;
    }
    return false;
}

} // namespace

// ============================================================================
// DelegationGraph
// ============================================================================

DelegationGraph::DelegationGraph(std::vector<const Document*> proxies)
    : documents_(std::move(proxies)) {
    for (std::size_t i = 0; i < documents_.size(); ++i) {
        index_[{documents_[i]->key.ns, documents_[i]->key.name}] = i;
    }
}

DelegationGraph DelegationGraph::from_snapshot(const CacheSnapshot& snapshot) {
    std::vector<const Document*> proxies;
    for (const auto* doc : snapshot.of_kind(Kind::Proxy)) {
        if (doc->proxy()) {
            proxies.push_back(doc);
        }
    }
    return DelegationGraph(std::move(proxies));
}

std::optional<std::size_t> DelegationGraph::find(const std::string& ns, const std::string& name) const {
    auto it = index_.find({ns, name});
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string DelegationGraph::label(std::size_t index) const {
    return documents_[index]->key.to_string();
}

// ============================================================================
// Resolution
// ============================================================================

DelegationResult resolve_delegation(const DelegationGraph& graph,
                                    const std::vector<std::size_t>& valid_roots) {
    DelegationResult result;
    result.reachable.assign(graph.size(), false);
    result.in_cycle.assign(graph.size(), false);

    auto edges = collect_edges(graph, result);

    // Cycles
    std::vector<std::size_t> component_size;
    auto component = strongly_connected(edges, component_size);

    for (std::size_t d = 0; d < graph.size(); ++d) {
        if (component_size[component[d]] > 1 || has_self_loop(d, edges)) {
            result.in_cycle[d] = true;
        }
    }

    for (std::size_t d = 0; d < graph.size(); ++d) {
        if (!result.in_cycle[d]) continue;

        std::string path;
        for (auto u : cycle_through(d, edges, component)) {
            if (!path.empty()) path += " -> ";
            path += graph.label(u);
        }
        add_issue(result, d, Severity::Error, "IncludeCreatesCycle",
                  "include creates an include cycle: " + path);
    }

    // Edges from outside a cycle into it are dropped
    for (std::size_t d = 0; d < graph.size(); ++d) {
        if (result.in_cycle[d]) continue;
        for (auto& e : edges[d]) {
            if (e.kind == EdgeKind::Child && result.in_cycle[e.target]) {
                e.kind = EdgeKind::Dropped;
                add_issue(result, d, Severity::Warning, "IncludeSubtreeDropped",
                          "include " + graph.label(e.target) +
                              " was dropped because it is part of an include cycle");
            }
        }
    }

    // Per-root depth-first walk
    struct Frame {
        std::size_t doc;
        std::size_t edge;
    };

    for (auto root : valid_roots) {
        std::vector<Frame> stack;
        DelegationPath current;
        current.root = root;
        current.chain.push_back(root);

        result.reachable[root] = true;
        result.paths.push_back(current);
        stack.push_back({root, 0});

        while (!stack.empty()) {
            std::size_t doc = stack.back().doc;

            if (stack.back().edge >= edges[doc].size()) {
                stack.pop_back();
                current.chain.pop_back();
                if (!current.include_indices.empty()) {
                    current.include_indices.pop_back();
                }
                continue;
            }

            const Edge e = edges[doc][stack.back().edge++];

            if (e.kind == EdgeKind::Dangling) {
                DelegationPath dangling = current;
                dangling.dangling_include = e.include_index;
                result.paths.push_back(std::move(dangling));
                continue;
            }
            if (e.kind != EdgeKind::Child) continue;

            current.chain.push_back(e.target);
            current.include_indices.push_back(e.include_index);
            result.reachable[e.target] = true;
            result.paths.push_back(current);
            stack.push_back({e.target, 0});
        }
    }

    spdlog::debug("delegation: {} documents, {} roots, {} paths, {} issues",
                  graph.size(), valid_roots.size(), result.paths.size(), result.issues.size());

    return result;
}

} // namespace trellis
