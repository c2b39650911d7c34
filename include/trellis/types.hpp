#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace trellis {

// ============================================================================
// Resource Kinds
// ============================================================================

enum class Kind {
    Proxy,
    Route,
    Gateway,
    Service,
    Secret,
    CertificateDelegation
};

inline const char* kind_to_string(Kind k) {
    switch (k) {
        case Kind::Proxy: return "Proxy";
        case Kind::Route: return "Route";
        case Kind::Gateway: return "Gateway";
        case Kind::Service: return "Service";
        case Kind::Secret: return "Secret";
        case Kind::CertificateDelegation: return "CertificateDelegation";
        default: return "Unknown";
    }
}

// Parse a kind string (case-insensitive)
std::optional<Kind> parse_kind(const std::string& s);

// ============================================================================
// Resource Key
// ============================================================================

// Identity of a source document: (kind, namespace, name)
struct ResourceKey {
    Kind kind = Kind::Proxy;
    std::string ns;
    std::string name;

    // "namespace/name", the form used in status messages and include paths
    std::string to_string() const { return ns + "/" + name; }
};

inline bool operator==(const ResourceKey& a, const ResourceKey& b) {
    return a.kind == b.kind && a.ns == b.ns && a.name == b.name;
}

inline bool operator!=(const ResourceKey& a, const ResourceKey& b) {
    return !(a == b);
}

inline bool operator<(const ResourceKey& a, const ResourceKey& b) {
    if (a.kind != b.kind) return a.kind < b.kind;
    if (a.ns != b.ns) return a.ns < b.ns;
    return a.name < b.name;
}

struct ResourceKeyHash {
    std::size_t operator()(const ResourceKey& k) const {
        std::size_t h = std::hash<std::string>()(k.ns);
        h ^= std::hash<std::string>()(k.name) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= static_cast<std::size_t>(k.kind) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

// ============================================================================
// Status Condition Types
// ============================================================================

// The sub-structure a status condition refers to
enum class ConditionType {
    IncludeError,
    RouteError,
    ServiceError,
    TLSError,
    VirtualHostError,
    ListenerError,
    OrphanedError,
    SpecError,
    PolicyWarning,
    RootNamespaceError,
};

inline const char* condition_type_to_string(ConditionType t) {
    switch (t) {
        case ConditionType::IncludeError: return "IncludeError";
        case ConditionType::RouteError: return "RouteError";
        case ConditionType::ServiceError: return "ServiceError";
        case ConditionType::TLSError: return "TLSError";
        case ConditionType::VirtualHostError: return "VirtualHostError";
        case ConditionType::ListenerError: return "ListenerError";
        case ConditionType::OrphanedError: return "OrphanedError";
        case ConditionType::SpecError: return "SpecError";
        case ConditionType::PolicyWarning: return "PolicyWarning";
        case ConditionType::RootNamespaceError: return "RootNamespaceError";
        default: return "Unknown";
    }
}

enum class Severity {
    Error,
    Warning
};

inline const char* severity_to_string(Severity s) {
    switch (s) {
        case Severity::Error: return "error";
        case Severity::Warning: return "warning";
        default: return "error";
    }
}

// ============================================================================
// Condition Policy Action
// ============================================================================

// Configured treatment of a warning reason. Errors are never downgraded.
enum class PolicyAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(PolicyAction a) {
    switch (a) {
        case PolicyAction::Warn: return "warn";
        case PolicyAction::Ignore: return "ignore";
        case PolicyAction::Error: return "error";
        default: return "warn";
    }
}

std::optional<PolicyAction> parse_policy_action(const std::string& s);

// ============================================================================
// Verdict
// ============================================================================

enum class Verdict {
    Valid,
    ValidWithWarnings,
    Invalid,
    Orphaned
};

inline const char* verdict_to_string(Verdict v) {
    switch (v) {
        case Verdict::Valid: return "valid";
        case Verdict::ValidWithWarnings: return "valid-with-warnings";
        case Verdict::Invalid: return "invalid";
        case Verdict::Orphaned: return "orphaned";
        default: return "invalid";
    }
}

// ============================================================================
// Status Record
// ============================================================================

struct StatusCondition {
    Severity severity = Severity::Error;
    ConditionType type = ConditionType::SpecError;
    std::string reason;   // CamelCase, e.g. "IncludeCreatesCycle"
    std::string message;
};

inline bool operator==(const StatusCondition& a, const StatusCondition& b) {
    return a.severity == b.severity && a.type == b.type &&
           a.reason == b.reason && a.message == b.message;
}

inline bool operator!=(const StatusCondition& a, const StatusCondition& b) {
    return !(a == b);
}

struct StatusRecord {
    ResourceKey key;
    Verdict verdict = Verdict::Valid;
    std::string vhost;  // fqdn for root proxies, empty otherwise
    std::vector<StatusCondition> conditions;
};

inline bool operator==(const StatusRecord& a, const StatusRecord& b) {
    return a.key == b.key && a.verdict == b.verdict && a.vhost == b.vhost &&
           a.conditions == b.conditions;
}

inline bool operator!=(const StatusRecord& a, const StatusRecord& b) {
    return !(a == b);
}

// ============================================================================
// Timestamps
// ============================================================================

// Normalize an RFC3339 timestamp so UTC offsets compare equal to 'Z'
std::string normalize_rfc3339(const std::string& ts);

// True if timestamp 'a' is strictly before 'b'. Empty sorts last.
bool timestamp_before(const std::string& a, const std::string& b);

// Lower-case ASCII copy
std::string to_lower(const std::string& s);

} // namespace trellis
