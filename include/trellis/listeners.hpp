#pragma once

#include "trellis/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace trellis {

// ============================================================================
// Port Mapping
// ============================================================================

// Privileged external ports are served from a disjoint high range
constexpr int kPrivilegedPortLimit = 1024;
constexpr int kPrivilegedPortOffset = 64512;

struct PortMapping {
    bool ok = false;
    std::string error;
    int internal_port = 0;
};

// 1-1023 -> port + 64512; 1024-65535 unchanged; anything else is an error
PortMapping map_external_port(int external_port);

// ============================================================================
// Listener Requests
// ============================================================================

// HTTPS and TLS gateway listeners share one class
enum class ProtocolClass {
    HTTP,
    HTTPS
};

inline const char* protocol_class_to_string(ProtocolClass p) {
    switch (p) {
        case ProtocolClass::HTTP: return "http";
        case ProtocolClass::HTTPS: return "https";
        default: return "http";
    }
}

// A configuration source asking for one (hostname, port) to be served
struct ListenerRequest {
    ResourceKey source;
    std::string source_timestamp;  // age of the source
    std::string member;            // which part of the source asked, e.g. a listener name
    ProtocolClass protocol = ProtocolClass::HTTP;
    int external_port = 0;
    std::string hostname;                   // empty = catch-all
    std::optional<std::string> tls_secret;  // "ns/name"

    // Root proxies own their virtual host. A source with an owning request
    // is all-or-nothing: losing one request loses all of them.
    bool owning = false;
};

// True if source a takes precedence over source b (older, then ns/name)
bool request_older(const ListenerRequest& a, const ListenerRequest& b);

// ============================================================================
// Listener Plan
// ============================================================================

struct PlannedVirtualHost {
    std::string hostname;                   // lower-cased, empty = catch-all
    std::optional<std::string> tls_secret;
    std::vector<std::size_t> requests;      // merged members, oldest first
};

struct PlannedListener {
    std::string name;  // "http-80", "https-443", ...
    ProtocolClass protocol = ProtocolClass::HTTP;
    int external_port = 0;
    int internal_port = 0;
    std::vector<PlannedVirtualHost> virtual_hosts;  // sorted by hostname
};

struct RejectedRequest {
    std::size_t request = 0;
    std::string reason;
    std::string message;
};

struct ListenerPlan {
    std::vector<PlannedListener> listeners;  // sorted by name
    std::vector<RejectedRequest> rejected;   // by request index
    std::vector<bool> accepted;              // by request index

    const RejectedRequest* rejection(std::size_t request) const;
};

// Group requests by (protocol class, internal port), merge compatible
// members and resolve conflicts by source age.
ListenerPlan plan_listeners(const std::vector<ListenerRequest>& requests);

// ============================================================================
// Hostnames
// ============================================================================

// RFC 1123 name, optionally with a leading "*." label
bool is_valid_hostname(const std::string& hostname);

bool is_wildcard_hostname(const std::string& hostname);

// "*.example.com" matches any name ending in ".example.com" but not
// "example.com" itself. Comparison is case-insensitive.
bool hostname_matches(const std::string& pattern, const std::string& hostname);

// Hostnames a route serves through a listener. A route without hostnames
// serves the listener's own hostname. Otherwise each route hostname the
// listener accepts is kept, and a route wildcard covering the listener
// hostname narrows to the listener hostname. Empty when nothing matches.
std::vector<std::string> intersect_hostnames(const std::string& listener_hostname,
                                             const std::vector<std::string>& route_hostnames);

} // namespace trellis
