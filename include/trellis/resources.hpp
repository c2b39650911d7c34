#pragma once

#include "trellis/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace trellis {

// ============================================================================
// Match Conditions
// ============================================================================

enum class HeaderMatchKind {
    Present,
    NotPresent,
    Contains,
    NotContains,
    Exact,
    NotExact
};

inline const char* header_match_kind_to_string(HeaderMatchKind k) {
    switch (k) {
        case HeaderMatchKind::Present: return "present";
        case HeaderMatchKind::NotPresent: return "notpresent";
        case HeaderMatchKind::Contains: return "contains";
        case HeaderMatchKind::NotContains: return "notcontains";
        case HeaderMatchKind::Exact: return "exact";
        case HeaderMatchKind::NotExact: return "notexact";
        default: return "present";
    }
}

std::optional<HeaderMatchKind> parse_header_match_kind(const std::string& s);

struct PrefixMatch {
    std::string prefix;
};

struct ExactMatch {
    std::string path;
};

struct RegexMatch {
    std::string regex;
};

struct HeaderMatch {
    std::string name;
    HeaderMatchKind kind = HeaderMatchKind::Present;
    std::string value;  // unused for present/notpresent
};

inline bool operator==(const HeaderMatch& a, const HeaderMatch& b) {
    return a.name == b.name && a.kind == b.kind && a.value == b.value;
}

// One entry of a condition block
using MatchCondition = std::variant<PrefixMatch, ExactMatch, RegexMatch, HeaderMatch>;

// The path part of a merged condition
using PathMatch = std::variant<PrefixMatch, ExactMatch, RegexMatch>;

// ============================================================================
// Proxy Documents
// ============================================================================

struct TLSSpec {
    std::string secret_name;               // [namespace/]name
    std::string minimum_protocol_version;  // "1.2" | "1.3", empty = default
    bool passthrough = false;
};

struct VirtualHostSpec {
    std::string fqdn;
    std::optional<int> port;  // externally visible port
    std::optional<TLSSpec> tls;
};

struct IncludeSpec {
    std::string name;
    std::string ns;  // empty = the including document's namespace
    std::vector<MatchCondition> conditions;
};

struct RouteServiceSpec {
    std::string name;
    int port = 0;
    std::string protocol;  // h2 | h2c | tls | empty
    uint32_t weight = 0;
};

struct HeaderValue {
    std::string name;
    std::string value;
};

struct HeadersPolicySpec {
    std::vector<HeaderValue> set;
    std::vector<std::string> remove;
};

struct RetryPolicySpec {
    int count = 1;
    std::string per_try_timeout;
    std::vector<std::string> retry_on;
};

struct TimeoutPolicySpec {
    std::string response;
    std::string idle;
};

struct PrefixReplacement {
    std::string prefix;  // empty = the default replacement
    std::string replacement;
};

struct DirectResponseSpec {
    int status_code = 0;
    std::string body;
};

struct RouteSpec {
    std::vector<MatchCondition> conditions;
    std::vector<RouteServiceSpec> services;
    bool permit_insecure = false;
    bool enable_websockets = false;
    std::vector<PrefixReplacement> prefix_replacements;
    std::optional<HeadersPolicySpec> request_headers_policy;
    std::optional<HeadersPolicySpec> response_headers_policy;
    std::optional<RetryPolicySpec> retry_policy;
    std::optional<TimeoutPolicySpec> timeout_policy;
    std::optional<DirectResponseSpec> direct_response;
};

struct ProxySpec {
    std::optional<VirtualHostSpec> virtualhost;  // present = root document
    std::vector<IncludeSpec> includes;
    std::vector<RouteSpec> routes;
};

// ============================================================================
// Flat Route Resources
// ============================================================================

struct ParentRef {
    std::string ns;            // empty = the route's namespace
    std::string name;
    std::string section_name;  // listener name, empty = every listener
};

struct RouteMatchSpec {
    std::optional<PathMatch> path;  // absent = prefix "/"
    std::vector<HeaderMatch> headers;
};

struct BackendRef {
    std::string name;
    std::string ns;  // empty = the route's namespace
    int port = 0;
    uint32_t weight = 1;
};

struct RouteRule {
    std::vector<RouteMatchSpec> matches;
    std::vector<BackendRef> backends;
};

struct RouteResourceSpec {
    std::vector<ParentRef> parent_refs;
    std::vector<std::string> hostnames;
    std::vector<RouteRule> rules;
};

// ============================================================================
// Gateways
// ============================================================================

enum class ListenerProtocol {
    HTTP,
    HTTPS,
    TLS
};

inline const char* listener_protocol_to_string(ListenerProtocol p) {
    switch (p) {
        case ListenerProtocol::HTTP: return "HTTP";
        case ListenerProtocol::HTTPS: return "HTTPS";
        case ListenerProtocol::TLS: return "TLS";
        default: return "HTTP";
    }
}

std::optional<ListenerProtocol> parse_listener_protocol(const std::string& s);

enum class AllowedRoutes {
    Same,
    All
};

struct GatewayListenerSpec {
    std::string name;
    ListenerProtocol protocol = ListenerProtocol::HTTP;
    int port = 0;
    std::string hostname;         // empty = catch-all
    std::string certificate_ref;  // [namespace/]name
    AllowedRoutes allowed_routes = AllowedRoutes::Same;
};

struct GatewaySpec {
    std::vector<GatewayListenerSpec> listeners;
};

// ============================================================================
// Services, Secrets and Certificate Delegation
// ============================================================================

struct ServicePort {
    std::string name;
    int port = 0;
    std::string protocol;
};

struct ServiceResourceSpec {
    std::vector<ServicePort> ports;
    std::string external_name;
};

struct SecretSpec {
    std::string type;  // "tls" | "ca" | other
    std::unordered_map<std::string, std::string> data;
};

struct CertificateDelegationEntry {
    std::string secret_name;
    std::vector<std::string> target_namespaces;  // "*" = all
};

struct CertificateDelegationSpec {
    std::vector<CertificateDelegationEntry> delegations;
};

// ============================================================================
// Document
// ============================================================================

using DocumentSpec = std::variant<ProxySpec,
                                  RouteResourceSpec,
                                  GatewaySpec,
                                  ServiceResourceSpec,
                                  SecretSpec,
                                  CertificateDelegationSpec>;

struct Document {
    ResourceKey key;
    std::string creation_timestamp;  // RFC3339
    uint64_t revision = 0;           // 0 = unknown, always treated as changed
    DocumentSpec spec;

    // Field-level problems found while ingesting; reported as SpecError
    std::vector<std::string> parse_errors;

    const ProxySpec* proxy() const { return std::get_if<ProxySpec>(&spec); }
    const RouteResourceSpec* route() const { return std::get_if<RouteResourceSpec>(&spec); }
    const GatewaySpec* gateway() const { return std::get_if<GatewaySpec>(&spec); }
    const ServiceResourceSpec* service() const { return std::get_if<ServiceResourceSpec>(&spec); }
    const SecretSpec* secret() const { return std::get_if<SecretSpec>(&spec); }
    const CertificateDelegationSpec* delegation() const {
        return std::get_if<CertificateDelegationSpec>(&spec);
    }

    bool is_root() const {
        const auto* p = proxy();
        return p && p->virtualhost.has_value();
    }
};

// Builders used by tools and tests
Document make_proxy(const std::string& ns, const std::string& name, ProxySpec spec,
                    const std::string& creation_timestamp = "");
Document make_route_resource(const std::string& ns, const std::string& name, RouteResourceSpec spec,
                             const std::string& creation_timestamp = "");
Document make_gateway(const std::string& ns, const std::string& name, GatewaySpec spec,
                      const std::string& creation_timestamp = "");
Document make_service(const std::string& ns, const std::string& name, std::vector<ServicePort> ports);
Document make_tls_secret(const std::string& ns, const std::string& name);

} // namespace trellis
