#pragma once

#include "trellis/builder_config.hpp"
#include "trellis/delegation.hpp"
#include "trellis/graph.hpp"
#include "trellis/listeners.hpp"
#include "trellis/resource_cache.hpp"
#include "trellis/services.hpp"
#include "trellis/status.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace trellis {
namespace detail {

// (listener name, planned hostname)
using VhostKey = std::pair<std::string, std::string>;

// A root proxy that passed its own checks
struct RootInfo {
    std::size_t arena = 0;
    const Document* doc = nullptr;
    std::string hostname;  // lower-cased fqdn
    std::optional<std::string> tls_secret;
    std::string min_tls_version;
    std::optional<std::size_t> https_request;
    std::optional<std::size_t> http_request;
};

// A gateway listener that passed its own checks
struct GatewayListenerInfo {
    const Document* gateway = nullptr;
    const GatewayListenerSpec* spec = nullptr;
    std::size_t request = 0;
};

// Mutable state of one build. Lives on the builder's stack.
struct BuildContext {
    BuildContext(const BuilderConfig& config, const CacheSnapshot& snapshot,
                 const ServiceResolver& resolver)
        : config(config), snapshot(snapshot), resolver(resolver), status(config.condition_policy) {}

    const BuilderConfig& config;
    const CacheSnapshot& snapshot;
    const ServiceResolver& resolver;

    StatusCache status;

    std::vector<ListenerRequest> requests;
    std::vector<RootInfo> roots;
    std::vector<GatewayListenerInfo> gateway_listeners;

    ListenerPlan plan;
    std::map<std::size_t, VhostKey> placement;  // accepted request -> vhost

    VirtualHostRoutes vhost_routes;
    std::vector<Cluster> clusters;

    StatusCollector& status_for(const Document& doc) { return status.accessor(doc.key); }

    std::optional<VhostKey> placed(std::optional<std::size_t> request) const {
        if (!request) return std::nullopt;
        auto it = placement.find(*request);
        if (it == placement.end()) return std::nullopt;
        return it->second;
    }

    void add_route(const VhostKey& key, Route route) {
        vhost_routes[key].routes.push_back(std::move(route));
    }
};

// Resolve one upstream reference. Failures become a ServiceError on the
// collector; with record set, the cluster is added to the graph.
std::optional<WeightedCluster> resolve_cluster(BuildContext& ctx, const ServiceRef& ref,
                                               uint32_t weight, StatusCollector& status,
                                               bool record = true);

// proxy_processor.cpp
void validate_roots(BuildContext& ctx, const DelegationGraph& graph);
void process_proxies(BuildContext& ctx, const DelegationGraph& graph);

// gateway_processor.cpp
void validate_gateways(BuildContext& ctx);
void process_flat_routes(BuildContext& ctx);

} // namespace detail
} // namespace trellis
