#pragma once

#include "trellis/conditions.hpp"
#include "trellis/listeners.hpp"
#include "trellis/policy.hpp"
#include "trellis/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace trellis {

// ============================================================================
// Graph Types
// ============================================================================

struct Cluster {
    std::string name;  // "ns/service/port[/protocol]"
    std::string ns;
    std::string service;
    int port = 0;
    std::string protocol;
    std::string external_name;
};

std::string cluster_name(const std::string& ns, const std::string& service, int port,
                         const std::string& protocol);

struct WeightedCluster {
    std::string cluster;
    uint32_t weight = 0;
};

struct DirectResponse {
    int status_code = 0;
    std::string body;
};

struct Route {
    MergedCondition condition;
    std::vector<WeightedCluster> clusters;
    std::optional<DirectResponse> direct_response;  // set instead of clusters

    bool https_upgrade = false;
    bool websocket = false;
    std::optional<std::string> prefix_rewrite;
    HeadersPolicy request_headers;
    HeadersPolicy response_headers;
    std::optional<RetryPolicy> retry;
    TimeoutPolicy timeout;

    ResourceKey source;  // document that declared the route
};

struct VirtualHost {
    std::string hostname;  // "*" for the catch-all
    std::optional<std::string> tls_secret;
    std::string min_tls_version;  // set when tls_secret is
    std::vector<Route> routes;    // match order
};

struct Listener {
    std::string name;
    ProtocolClass protocol = ProtocolClass::HTTP;
    int port = 0;           // external
    int internal_port = 0;  // bound by the data plane
    std::vector<VirtualHost> virtual_hosts;
};

// Immutable routing snapshot. Never modified after publication.
struct Graph {
    std::vector<Listener> listeners;  // sorted by name
    std::vector<Cluster> clusters;    // sorted by name
    uint64_t source_revision = 0;     // cache revision it was built from

    const Listener* find_listener(const std::string& name) const;
    const VirtualHost* find_virtual_host(const std::string& listener, const std::string& hostname) const;
    std::size_t route_count() const;
};

// ============================================================================
// Emission
// ============================================================================

struct VirtualHostContent {
    std::string min_tls_version;
    std::vector<Route> routes;  // already ordered
};

// Keyed by (listener name, planned hostname)
using VirtualHostRoutes = std::map<std::pair<std::string, std::string>, VirtualHostContent>;

// Assemble the graph from the listener plan and the per-vhost routes.
// Virtual hosts without routes and listeners without virtual hosts are left
// out. Clusters are de-duplicated and sorted.
Graph emit_graph(const ListenerPlan& plan, VirtualHostRoutes routes,
                 std::vector<Cluster> clusters, uint64_t source_revision);

// Deterministic JSON: same graph, same bytes
std::string serialize_graph_json(const Graph& graph);

} // namespace trellis
