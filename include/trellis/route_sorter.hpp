#pragma once

#include "trellis/conditions.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace trellis {

// ============================================================================
// Route Ordering
// ============================================================================

enum class RouteOrdering {
    Specificity,  // exact > regex > prefix, longer first, more headers first
    Declaration   // depth-first, parent before child, array order
};

inline const char* route_ordering_to_string(RouteOrdering o) {
    switch (o) {
        case RouteOrdering::Specificity: return "specificity";
        case RouteOrdering::Declaration: return "declaration";
        default: return "specificity";
    }
}

std::optional<RouteOrdering> parse_route_ordering(const std::string& s);

// exact = 0, regex = 1, prefix = 2
int path_match_rank(const PathMatch& path);

// Strict specificity order between two conditions. Equal conditions
// compare false both ways.
bool condition_less(const MergedCondition& a, const MergedCondition& b);

// Same order, with each condition's render() supplied by the caller
bool condition_less(const MergedCondition& a, const std::string& rendered_a,
                    const MergedCondition& b, const std::string& rendered_b);

// Permutation of [0, n) giving the order routes should be matched in.
// Declaration ordering returns the identity. Equal keys keep their
// relative order.
std::vector<std::size_t> sort_order(const std::vector<MergedCondition>& conditions,
                                    RouteOrdering ordering = RouteOrdering::Specificity);

// Reorder any route sequence whose element exposes a MergedCondition
template <typename T, typename ConditionOf>
void sort_routes(std::vector<T>& routes, RouteOrdering ordering, ConditionOf condition_of) {
    std::vector<MergedCondition> conditions;
    conditions.reserve(routes.size());
    for (const auto& r : routes) {
        conditions.push_back(condition_of(r));
    }

    auto order = sort_order(conditions, ordering);

    std::vector<T> sorted;
    sorted.reserve(routes.size());
    for (auto i : order) {
        sorted.push_back(std::move(routes[i]));
    }
    routes = std::move(sorted);
}

} // namespace trellis
