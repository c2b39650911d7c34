#include "trellis/conditions.hpp"

#include <algorithm>
#include <regex>
#include <tuple>

namespace trellis {

namespace {

bool value_kind(HeaderMatchKind kind) {
    return kind != HeaderMatchKind::Present && kind != HeaderMatchKind::NotPresent;
}

std::string render_header(const HeaderMatch& h) {
    std::string out = "header:" + h.name + "=" + header_match_kind_to_string(h.kind);
    if (value_kind(h.kind)) {
        out += ":" + h.value;
    }
    return out;
}

HeaderMatch normalized(const HeaderMatch& h) {
    HeaderMatch out = h;
    out.name = to_lower(h.name);
    return out;
}

ConditionCheck fail(const std::string& reason, const std::string& error) {
    ConditionCheck check;
    check.reason = reason;
    check.error = error;
    return check;
}

ConditionCheck validate_path_clause(const MatchCondition& cond, bool route_level) {
    const char* reason = "PathMatchConditionsNotValid";

    if (const auto* p = std::get_if<PrefixMatch>(&cond)) {
        if (p->prefix.empty() || p->prefix[0] != '/') {
            return fail(reason, "prefix conditions must start with /, " + p->prefix + " was supplied");
        }
    } else if (const auto* e = std::get_if<ExactMatch>(&cond)) {
        if (!route_level) {
            return fail(reason, "include conditions only support prefix matching");
        }
        if (e->path.empty() || e->path[0] != '/') {
            return fail(reason, "exact conditions must start with /, " + e->path + " was supplied");
        }
    } else if (const auto* r = std::get_if<RegexMatch>(&cond)) {
        if (!route_level) {
            return fail(reason, "include conditions only support prefix matching");
        }
        if (r->regex.empty()) {
            return fail(reason, "regex conditions must not be empty");
        }
        try {
            std::regex compiled(r->regex, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            return fail(reason, "invalid regex " + r->regex + ": " + e.what());
        }
    }

    ConditionCheck ok;
    ok.ok = true;
    return ok;
}

} // namespace

// ============================================================================
// MergedCondition
// ============================================================================

const std::string& MergedCondition::match_string() const {
    if (const auto* p = std::get_if<PrefixMatch>(&path)) return p->prefix;
    if (const auto* e = std::get_if<ExactMatch>(&path)) return e->path;
    return std::get<RegexMatch>(path).regex;
}

std::string MergedCondition::render() const {
    std::string out = std::string(path_match_type(path)) + ":" + match_string();
    for (const auto& h : headers) {
        out += "&" + render_header(h);
    }
    return out;
}

const char* path_match_type(const PathMatch& path) {
    if (std::holds_alternative<ExactMatch>(path)) return "exact";
    if (std::holds_alternative<RegexMatch>(path)) return "regex";
    return "prefix";
}

// ============================================================================
// Validation
// ============================================================================

ConditionCheck validate_condition_block(const std::vector<MatchCondition>& block, bool route_level) {
    int path_clauses = 0;
    std::vector<HeaderMatch> headers;

    for (const auto& cond : block) {
        if (const auto* h = std::get_if<HeaderMatch>(&cond)) {
            if (h->name.empty()) {
                return fail("HeaderMatchConditionsNotValid", "header conditions must name a header");
            }
            if (value_kind(h->kind) && h->value.empty()) {
                return fail("HeaderMatchConditionsNotValid",
                            std::string("header condition ") + header_match_kind_to_string(h->kind) +
                                " on " + h->name + " requires a value");
            }
            headers.push_back(*h);
            continue;
        }

        ++path_clauses;
        if (path_clauses > 1) {
            return fail("PathMatchConditionsNotValid",
                        "more than one path condition is not allowed in a condition block");
        }

        auto check = validate_path_clause(cond, route_level);
        if (!check.ok) {
            return check;
        }
    }

    return validate_header_conditions(headers);
}

ConditionCheck validate_header_conditions(const std::vector<HeaderMatch>& headers) {
    const char* reason = "HeaderMatchConditionsNotValid";
    std::vector<HeaderMatch> seen;

    auto has = [&seen](const std::string& name, HeaderMatchKind kind, const std::string& value) {
        for (const auto& s : seen) {
            if (s.name == name && s.kind == kind && (!value_kind(kind) || s.value == value)) {
                return true;
            }
        }
        return false;
    };

    for (const auto& raw : headers) {
        HeaderMatch h = normalized(raw);

        switch (h.kind) {
            case HeaderMatchKind::Present:
                if (has(h.name, HeaderMatchKind::NotPresent, "")) {
                    return fail(reason, "cannot specify contradictory 'present' and 'notpresent' conditions for header " + h.name);
                }
                break;
            case HeaderMatchKind::NotPresent:
                if (has(h.name, HeaderMatchKind::Present, "")) {
                    return fail(reason, "cannot specify contradictory 'present' and 'notpresent' conditions for header " + h.name);
                }
                break;
            case HeaderMatchKind::Exact:
                for (const auto& s : seen) {
                    if (s.name == h.name && s.kind == HeaderMatchKind::Exact) {
                        return fail(reason, "cannot specify duplicate 'exact' conditions for header " + h.name);
                    }
                }
                if (has(h.name, HeaderMatchKind::NotExact, h.value)) {
                    return fail(reason, "cannot specify contradictory 'exact' and 'notexact' conditions for header " + h.name);
                }
                break;
            case HeaderMatchKind::NotExact:
                if (has(h.name, HeaderMatchKind::Exact, h.value)) {
                    return fail(reason, "cannot specify contradictory 'exact' and 'notexact' conditions for header " + h.name);
                }
                break;
            case HeaderMatchKind::Contains:
                if (has(h.name, HeaderMatchKind::NotContains, h.value)) {
                    return fail(reason, "cannot specify contradictory 'contains' and 'notcontains' conditions for header " + h.name);
                }
                break;
            case HeaderMatchKind::NotContains:
                if (has(h.name, HeaderMatchKind::Contains, h.value)) {
                    return fail(reason, "cannot specify contradictory 'contains' and 'notcontains' conditions for header " + h.name);
                }
                break;
        }

        seen.push_back(std::move(h));
    }

    ConditionCheck ok;
    ok.ok = true;
    return ok;
}

// ============================================================================
// Merge
// ============================================================================

std::string collapse_slashes(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        if (c == '/' && !out.empty() && out.back() == '/') {
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::string escape_regex(const std::string& s) {
    static const std::string special = "\\^$.|?*+()[]{}";
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (special.find(c) != std::string::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

ConditionMergeResult merge_conditions(const std::vector<std::vector<MatchCondition>>& blocks) {
    ConditionMergeResult result;

    std::string prefix;
    const ExactMatch* exact = nullptr;
    const RegexMatch* regex = nullptr;

    for (size_t i = 0; i < blocks.size(); ++i) {
        bool last = (i + 1 == blocks.size());
        auto check = validate_condition_block(blocks[i], last);
        if (!check.ok) {
            result.reason = check.reason;
            result.error = check.error;
            return result;
        }

        for (const auto& cond : blocks[i]) {
            if (const auto* p = std::get_if<PrefixMatch>(&cond)) {
                prefix += p->prefix;
            } else if (const auto* e = std::get_if<ExactMatch>(&cond)) {
                exact = e;
            } else if (const auto* r = std::get_if<RegexMatch>(&cond)) {
                regex = r;
            } else if (const auto* h = std::get_if<HeaderMatch>(&cond)) {
                HeaderMatch n = normalized(*h);
                auto& headers = result.condition.headers;
                if (std::find(headers.begin(), headers.end(), n) == headers.end()) {
                    headers.push_back(std::move(n));
                }
            }
        }
    }

    auto header_check = validate_header_conditions(result.condition.headers);
    if (!header_check.ok) {
        result.reason = header_check.reason;
        result.error = header_check.error;
        return result;
    }

    std::string inherited = collapse_slashes(prefix);

    if (exact) {
        result.condition.path = ExactMatch{collapse_slashes(inherited + exact->path)};
    } else if (regex) {
        if (inherited.empty() || inherited == "/") {
            result.condition.path = RegexMatch{regex->regex};
        } else {
            if (inherited.back() == '/' && regex->regex[0] == '/') {
                inherited.pop_back();
            }
            result.condition.path = RegexMatch{escape_regex(inherited) + regex->regex};
        }
    } else {
        result.condition.path = PrefixMatch{inherited.empty() ? "/" : inherited};
    }

    result.ok = true;
    return result;
}

std::string include_condition_signature(const std::vector<MatchCondition>& block) {
    std::string prefix;
    std::vector<HeaderMatch> headers;

    for (const auto& cond : block) {
        if (const auto* p = std::get_if<PrefixMatch>(&cond)) {
            prefix += p->prefix;
        } else if (const auto* h = std::get_if<HeaderMatch>(&cond)) {
            HeaderMatch n = normalized(*h);
            if (std::find(headers.begin(), headers.end(), n) == headers.end()) {
                headers.push_back(std::move(n));
            }
        }
    }

    prefix = collapse_slashes(prefix);
    if (prefix.empty()) {
        prefix = "/";
    }
    if (prefix == "/" && headers.empty()) {
        return "";
    }

    std::sort(headers.begin(), headers.end(), [](const HeaderMatch& a, const HeaderMatch& b) {
        return std::make_tuple(a.kind, a.name, a.value) < std::make_tuple(b.kind, b.name, b.value);
    });

    std::string sig = "prefix:" + prefix;
    for (const auto& h : headers) {
        sig += "&" + render_header(h);
    }
    return sig;
}

} // namespace trellis
