#include "trellis/route_sorter.hpp"

#include <algorithm>
#include <numeric>

namespace trellis {

std::optional<RouteOrdering> parse_route_ordering(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "specificity") return RouteOrdering::Specificity;
    if (lower == "declaration") return RouteOrdering::Declaration;
    return std::nullopt;
}

int path_match_rank(const PathMatch& path) {
    if (std::holds_alternative<ExactMatch>(path)) return 0;
    if (std::holds_alternative<RegexMatch>(path)) return 1;
    return 2;
}

bool condition_less(const MergedCondition& a, const std::string& rendered_a,
                    const MergedCondition& b, const std::string& rendered_b) {
    int rank_a = path_match_rank(a.path);
    int rank_b = path_match_rank(b.path);
    if (rank_a != rank_b) {
        return rank_a < rank_b;
    }

    // Longer match string first
    std::size_t len_a = a.match_string().size();
    std::size_t len_b = b.match_string().size();
    if (len_a != len_b) {
        return len_a > len_b;
    }

    // More header clauses first
    if (a.headers.size() != b.headers.size()) {
        return a.headers.size() > b.headers.size();
    }

    return rendered_a < rendered_b;
}

bool condition_less(const MergedCondition& a, const MergedCondition& b) {
    return condition_less(a, a.render(), b, b.render());
}

std::vector<std::size_t> sort_order(const std::vector<MergedCondition>& conditions,
                                    RouteOrdering ordering) {
    std::vector<std::size_t> order(conditions.size());
    std::iota(order.begin(), order.end(), 0);

    if (ordering == RouteOrdering::Declaration) {
        return order;
    }

    // Render once; render() allocates
    std::vector<std::string> rendered;
    rendered.reserve(conditions.size());
    for (const auto& c : conditions) {
        rendered.push_back(c.render());
    }

    std::stable_sort(order.begin(), order.end(), [&](std::size_t i, std::size_t j) {
        return condition_less(conditions[i], rendered[i], conditions[j], rendered[j]);
    });

    return order;
}

} // namespace trellis
