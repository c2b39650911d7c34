#include "build_context.hpp"

#include "trellis/conditions.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace trellis {
namespace detail {

namespace {

ProtocolClass protocol_class(ListenerProtocol p) {
    return p == ListenerProtocol::HTTP ? ProtocolClass::HTTP : ProtocolClass::HTTPS;
}

// Find or add the virtual host for a route hostname on a planned listener.
// An existing virtual host is shared only when it uses the same TLS secret.
bool ensure_virtual_host(BuildContext& ctx, const std::string& listener_name, const std::string& hostname,
                         std::size_t request, StatusCollector& status) {
    const auto& tls_secret = ctx.requests[request].tls_secret;

    for (auto& listener : ctx.plan.listeners) {
        if (listener.name != listener_name) continue;

        auto it = std::lower_bound(listener.virtual_hosts.begin(), listener.virtual_hosts.end(), hostname,
                                   [](const PlannedVirtualHost& v, const std::string& h) { return v.hostname < h; });
        if (it != listener.virtual_hosts.end() && it->hostname == hostname) {
            if (it->tls_secret != tls_secret) {
                status.add_error(ConditionType::VirtualHostError, "TLSConflict",
                                 "hostname " + hostname + " on " + listener_name +
                                     " uses a different TLS secret than the route's listener");
                return false;
            }
            return true;
        }

        PlannedVirtualHost vhost;
        vhost.hostname = hostname;
        vhost.tls_secret = tls_secret;
        vhost.requests.push_back(request);
        listener.virtual_hosts.insert(it, std::move(vhost));
        return true;
    }
    return false;
}

std::vector<MatchCondition> match_block(const RouteMatchSpec& match) {
    std::vector<MatchCondition> block;
    if (match.path) {
        std::visit([&block](const auto& p) { block.emplace_back(p); }, *match.path);
    }
    for (const auto& h : match.headers) {
        block.emplace_back(h);
    }
    return block;
}

} // namespace

// ============================================================================
// Gateways
// ============================================================================

void validate_gateways(BuildContext& ctx) {
    for (const auto* doc : ctx.snapshot.of_kind(Kind::Gateway)) {
        const auto* gateway = doc->gateway();
        if (!gateway || !doc->parse_errors.empty()) continue;

        auto& status = ctx.status_for(*doc);
        std::set<std::string> names;

        for (const auto& listener : gateway->listeners) {
            if (listener.name.empty()) {
                status.add_error(ConditionType::ListenerError, "ListenerNameNotValid",
                                 "gateway listeners must be named");
                continue;
            }
            if (!names.insert(listener.name).second) {
                status.add_error(ConditionType::ListenerError, "DuplicateListenerName",
                                 "listener " + listener.name + " is declared more than once");
                continue;
            }
            if (!listener.hostname.empty() && !is_valid_hostname(listener.hostname)) {
                status.add_error(ConditionType::ListenerError, "InvalidHostname",
                                 "listener " + listener.name + ": hostname \"" + listener.hostname +
                                     "\" is not valid");
                continue;
            }

            ListenerRequest request;
            request.source = doc->key;
            request.source_timestamp = doc->creation_timestamp;
            request.member = listener.name;
            request.protocol = protocol_class(listener.protocol);
            request.external_port = listener.port;
            request.hostname = to_lower(listener.hostname);
            request.owning = false;

            if (request.protocol == ProtocolClass::HTTPS) {
                if (listener.certificate_ref.empty()) {
                    status.add_error(ConditionType::TLSError, "SecretNotValid",
                                     "listener " + listener.name + ": " +
                                         listener_protocol_to_string(listener.protocol) +
                                         " listeners need a certificate reference");
                    continue;
                }
                auto secret = lookup_secret(ctx.snapshot, listener.certificate_ref, doc->key.ns,
                                            SecretUse::ServingCertificate);
                if (!secret.ok) {
                    status.add_error(ConditionType::TLSError, secret.reason,
                                     "listener " + listener.name + ": " + secret.error);
                    continue;
                }
                request.tls_secret = secret.key.to_string();
            }

            GatewayListenerInfo info;
            info.gateway = doc;
            info.spec = &listener;
            info.request = ctx.requests.size();
            ctx.requests.push_back(std::move(request));
            ctx.gateway_listeners.push_back(info);
        }
    }
}

// ============================================================================
// Flat routes
// ============================================================================

void process_flat_routes(BuildContext& ctx) {
    std::size_t attached = 0;

    for (const auto* doc : ctx.snapshot.of_kind(Kind::Route)) {
        const auto* spec = doc->route();
        if (!spec || !doc->parse_errors.empty()) continue;

        auto& status = ctx.status_for(*doc);

        if (spec->parent_refs.empty()) {
            status.add_error(ConditionType::RouteError, "ParentRefsNotSpecified",
                             "route must name at least one parent gateway");
            continue;
        }

        bool hostnames_ok = true;
        for (const auto& h : spec->hostnames) {
            if (!is_valid_hostname(h)) {
                status.add_error(ConditionType::RouteError, "InvalidHostname",
                                 "hostname \"" + h + "\" is not valid");
                hostnames_ok = false;
            }
        }
        if (!hostnames_ok) continue;

        // Virtual hosts this route attaches to
        std::vector<VhostKey> targets;
        for (const auto& parent : spec->parent_refs) {
            std::string ns = parent.ns.empty() ? doc->key.ns : parent.ns;
            std::string label = ns + "/" + parent.name;

            const Document* gateway = ctx.snapshot.find(Kind::Gateway, ns, parent.name);
            if (!gateway || !gateway->gateway()) {
                status.add_error(ConditionType::RouteError, "GatewayNotFound",
                                 "gateway " + label + " not found");
                continue;
            }

            bool section_found = false;
            bool allowed = false;
            bool hostname_match = false;
            std::size_t before = targets.size();

            for (const auto& info : ctx.gateway_listeners) {
                if (info.gateway != gateway) continue;
                if (!parent.section_name.empty() && info.spec->name != parent.section_name) continue;
                section_found = true;

                if (info.spec->allowed_routes == AllowedRoutes::Same && gateway->key.ns != doc->key.ns) {
                    continue;
                }
                allowed = true;

                auto hosts = intersect_hostnames(info.spec->hostname, spec->hostnames);
                if (hosts.empty()) continue;
                hostname_match = true;

                auto placed = ctx.placed(info.request);
                if (!placed) continue;

                for (const auto& host : hosts) {
                    VhostKey key{placed->first, host};
                    if (host != placed->second &&
                        !ensure_virtual_host(ctx, placed->first, host, info.request, status)) {
                        continue;
                    }
                    if (std::find(targets.begin(), targets.end(), key) == targets.end()) {
                        targets.push_back(key);
                    }
                }
            }

            if (!section_found) {
                status.add_error(ConditionType::RouteError, "ListenerNotFound",
                                 parent.section_name.empty()
                                     ? "gateway " + label + " has no usable listeners"
                                     : "gateway " + label + " has no usable listener " + parent.section_name);
            } else if (!allowed) {
                status.add_error(ConditionType::RouteError, "NotAllowedByListeners",
                                 "no listener of gateway " + label + " allows routes from namespace " +
                                     doc->key.ns);
            } else if (!hostname_match) {
                status.add_error(ConditionType::RouteError, "NoMatchingListenerHostname",
                                 "no listener of gateway " + label + " matches the route hostnames");
            } else if (targets.size() == before) {
                status.add_error(ConditionType::RouteError, "ListenerNotServed",
                                 "the matching listeners of gateway " + label + " were rejected");
            }
        }

        if (targets.empty()) continue;

        std::vector<Route> routes;
        for (std::size_t r = 0; r < spec->rules.size(); ++r) {
            const auto& rule = spec->rules[r];

            std::vector<WeightedCluster> clusters;
            for (const auto& backend : rule.backends) {
                ServiceRef ref;
                ref.ns = backend.ns.empty() ? doc->key.ns : backend.ns;
                ref.name = backend.name;
                ref.port = backend.port;
                auto cluster = resolve_cluster(ctx, ref, backend.weight, status);
                if (cluster) {
                    clusters.push_back(*cluster);
                }
            }
            if (clusters.empty()) {
                status.add_error(ConditionType::RouteError, "BackendNotResolved",
                                 "rule " + std::to_string(r) + " has no resolvable backend");
                continue;
            }

            std::vector<RouteMatchSpec> matches = rule.matches;
            if (matches.empty()) {
                matches.emplace_back();
            }

            for (const auto& match : matches) {
                std::vector<std::vector<MatchCondition>> blocks{match_block(match)};
                auto merged = merge_conditions(blocks);
                if (!merged.ok) {
                    status.add_error(ConditionType::RouteError, merged.reason,
                                     "rule " + std::to_string(r) + ": " + merged.error);
                    continue;
                }
                Route route;
                route.condition = merged.condition;
                route.clusters = clusters;
                route.source = doc->key;
                routes.push_back(std::move(route));
            }
        }

        for (const auto& key : targets) {
            for (const auto& route : routes) {
                ctx.add_route(key, route);
            }
        }
        if (!routes.empty()) ++attached;
    }

    spdlog::debug("flat routes: {} attached", attached);
}

} // namespace detail
} // namespace trellis
