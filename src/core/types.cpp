#include "trellis/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace trellis {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::optional<Kind> parse_kind(const std::string& s) {
    std::string lower = to_lower(s);

    if (lower == "proxy") return Kind::Proxy;
    if (lower == "route") return Kind::Route;
    if (lower == "gateway") return Kind::Gateway;
    if (lower == "service") return Kind::Service;
    if (lower == "secret") return Kind::Secret;
    if (lower == "certificatedelegation") return Kind::CertificateDelegation;

    return std::nullopt;
}

std::optional<PolicyAction> parse_policy_action(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "warn") return PolicyAction::Warn;
    if (lower == "ignore") return PolicyAction::Ignore;
    if (lower == "error") return PolicyAction::Error;
    return std::nullopt;
}

std::string normalize_rfc3339(const std::string& ts) {
    if (ts.empty()) return ts;

    std::string result = ts;

    // Replace +00:00 or -00:00 with Z for UTC
    if (result.size() >= 6) {
        std::string suffix = result.substr(result.size() - 6);
        if (suffix == "+00:00" || suffix == "-00:00") {
            result = result.substr(0, result.size() - 6) + "Z";
        }
    }

    return result;
}

bool timestamp_before(const std::string& a, const std::string& b) {
    if (a.empty()) return false;
    if (b.empty()) return true;

    // Lexicographic comparison works for normalized RFC3339 UTC timestamps
    // Format: YYYY-MM-DDTHH:MM:SSZ (fixed width, sortable)
    return normalize_rfc3339(a) < normalize_rfc3339(b);
}

} // namespace trellis
