#pragma once

#include "trellis/resources.hpp"

#include <string>
#include <vector>

namespace trellis {

// ============================================================================
// Merged Condition
// ============================================================================

// Effective condition of one route after merging every block along its
// delegation path. Header names are stored lower-cased.
struct MergedCondition {
    PathMatch path = PrefixMatch{"/"};
    std::vector<HeaderMatch> headers;

    // The matched path string (prefix, exact path or regex)
    const std::string& match_string() const;

    // Canonical text form, e.g. "prefix:/api&header:x-env=exact:prod".
    // Used as the final sort key and in graph output.
    std::string render() const;
};

inline bool operator==(const MergedCondition& a, const MergedCondition& b) {
    return a.render() == b.render();
}

const char* path_match_type(const PathMatch& path);

// ============================================================================
// Validation
// ============================================================================

struct ConditionCheck {
    bool ok = false;
    std::string reason;  // status reason when !ok
    std::string error;
};

// Check one condition block. Include blocks (route_level == false) accept
// prefix clauses only; route blocks also accept exact and regex.
// At most one path clause per block.
ConditionCheck validate_condition_block(const std::vector<MatchCondition>& block, bool route_level);

// Contradictions between header clauses (names compared case-insensitively):
// exact+notexact with one value, two exacts, present+notpresent,
// contains+notcontains with one value.
ConditionCheck validate_header_conditions(const std::vector<HeaderMatch>& headers);

// ============================================================================
// Merge
// ============================================================================

struct ConditionMergeResult {
    bool ok = false;
    std::string reason;
    std::string error;
    MergedCondition condition;
};

// Merge condition blocks ordered root to leaf. Prefixes are concatenated
// and runs of '/' collapsed; an empty result becomes "/". Only the last
// block may carry an exact or regex path, which is then combined with the
// inherited prefix. Header clauses accumulate in order without duplicates.
ConditionMergeResult merge_conditions(const std::vector<std::vector<MatchCondition>>& blocks);

// Replace runs of '/' with a single '/'
std::string collapse_slashes(const std::string& path);

// Escape regex metacharacters so the string matches literally
std::string escape_regex(const std::string& s);

// Key used to detect duplicate include conditions within one document.
// Empty for the exempt default condition (prefix "/" and no headers).
std::string include_condition_signature(const std::vector<MatchCondition>& block);

} // namespace trellis
