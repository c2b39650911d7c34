#include "trellis/builder.hpp"

#include "build_context.hpp"

#include "trellis/delegation.hpp"
#include "trellis/route_sorter.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace trellis {

namespace detail {

std::optional<WeightedCluster> resolve_cluster(BuildContext& ctx, const ServiceRef& ref,
                                               uint32_t weight, StatusCollector& status, bool record) {
    auto resolution = ctx.resolver.resolve(ref);
    if (!resolution.ok) {
        status.add_error(ConditionType::ServiceError, resolution.reason, resolution.error);
        return std::nullopt;
    }

    Cluster cluster;
    cluster.name = cluster_name(ref.ns, ref.name, ref.port, resolution.protocol);
    cluster.ns = ref.ns;
    cluster.service = ref.name;
    cluster.port = ref.port;
    cluster.protocol = resolution.protocol;
    cluster.external_name = resolution.external_name;

    WeightedCluster weighted;
    weighted.cluster = cluster.name;
    weighted.weight = weight;

    if (record) {
        ctx.clusters.push_back(std::move(cluster));
    }
    return weighted;
}

namespace {

// Documents that get a status record. Non-root proxies may be orphaned.
void track_documents(BuildContext& ctx) {
    for (const auto& [key, doc] : ctx.snapshot.documents()) {
        bool tracked = key.kind == Kind::Proxy || key.kind == Kind::Route || key.kind == Kind::Gateway;
        if (!tracked) continue;

        ctx.status.track(key, key.kind == Kind::Proxy && !doc->is_root());

        auto& status = ctx.status.accessor(key);
        for (const auto& error : doc->parse_errors) {
            status.add_error(ConditionType::SpecError, "SpecNotValid", error);
        }
    }
}

ConditionType rejection_type(const std::string& reason) {
    if (reason == "DuplicateVhost" || reason == "TLSConflict") {
        return ConditionType::VirtualHostError;
    }
    return ConditionType::ListenerError;
}

void apply_plan(BuildContext& ctx) {
    ctx.plan = plan_listeners(ctx.requests);

    for (const auto& rejected : ctx.plan.rejected) {
        const auto& request = ctx.requests[rejected.request];
        ctx.status.accessor(request.source)
            .add_error(rejection_type(rejected.reason), rejected.reason, rejected.message);
    }

    for (const auto& listener : ctx.plan.listeners) {
        for (const auto& vhost : listener.virtual_hosts) {
            for (auto request : vhost.requests) {
                ctx.placement[request] = {listener.name, vhost.hostname};
            }
        }
    }
}

} // namespace

} // namespace detail

// ============================================================================
// Builder
// ============================================================================

Builder::Builder(BuilderConfig config) : config_(std::move(config)) {}

BuildResult Builder::build(const CacheSnapshot& snapshot) const {
    SnapshotServiceResolver resolver(snapshot);
    return build(snapshot, resolver);
}

BuildResult Builder::build(const CacheSnapshot& snapshot, const ServiceResolver& resolver) const {
    detail::BuildContext ctx(config_, snapshot, resolver);

    spdlog::debug("build: revision {}, {} documents", snapshot.revision(), snapshot.size());

    detail::track_documents(ctx);

    auto graph = DelegationGraph::from_snapshot(snapshot);

    detail::validate_roots(ctx, graph);
    detail::validate_gateways(ctx);
    detail::apply_plan(ctx);
    detail::process_proxies(ctx, graph);
    detail::process_flat_routes(ctx);

    for (auto& [key, content] : ctx.vhost_routes) {
        sort_routes(content.routes, config_.route_ordering,
                    [](const Route& r) -> const MergedCondition& { return r.condition; });
    }

    BuildResult result;
    result.graph = std::make_shared<const Graph>(
        emit_graph(ctx.plan, std::move(ctx.vhost_routes), std::move(ctx.clusters), snapshot.revision()));
    result.statuses = ctx.status.records();

    spdlog::debug("build: {} listeners, {} routes, {} status records",
                  result.graph->listeners.size(), result.graph->route_count(), result.statuses.size());

    return result;
}

} // namespace trellis
