#include "build_context.hpp"

#include "trellis/conditions.hpp"
#include "trellis/policy.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <set>

namespace trellis {
namespace detail {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

struct PendingRoute {
    Route route;
    bool permit_insecure = false;
};

// Effective prefix rewrite for a merged prefix. An exact replacement
// prefix wins over the default (empty) one.
std::optional<std::string> prefix_rewrite(const std::vector<PrefixReplacement>& replacements,
                                          const std::string& prefix) {
    const PrefixReplacement* fallback = nullptr;
    for (const auto& r : replacements) {
        if (r.prefix.empty()) {
            fallback = &r;
        } else if (collapse_slashes(r.prefix) == prefix) {
            return r.replacement;
        }
    }
    if (fallback) return fallback->replacement;
    return std::nullopt;
}

bool prefix_replacements_valid(const std::vector<PrefixReplacement>& replacements, std::string& error) {
    std::set<std::string> seen;
    int defaults = 0;
    for (const auto& r : replacements) {
        if (r.prefix.empty()) {
            if (++defaults > 1) {
                error = "ambiguous prefix replacement: more than one default replacement";
                return false;
            }
            continue;
        }
        if (!seen.insert(collapse_slashes(r.prefix)).second) {
            error = "duplicate replacement prefix \"" + r.prefix + "\"";
            return false;
        }
    }
    return true;
}

// Turn one route declaration into a graph route under the given condition
// blocks. Problems are reported on the declaring document's collector.
// Clusters are only recorded for routes that will be served.
std::optional<PendingRoute> process_route(BuildContext& ctx, const Document& doc, const RouteSpec& spec,
                                          std::vector<std::vector<MatchCondition>> blocks,
                                          StatusCollector& status, bool served) {
    bool has_services = !spec.services.empty();
    bool has_direct = spec.direct_response.has_value();
    if (has_services == has_direct) {
        status.add_error(ConditionType::RouteError, "RouteActionCountNotValid",
                         "must set exactly one of services or direct_response");
        return std::nullopt;
    }

    blocks.push_back(spec.conditions);
    auto merged = merge_conditions(blocks);
    if (!merged.ok) {
        status.add_error(ConditionType::RouteError, merged.reason, merged.error);
        return std::nullopt;
    }

    PendingRoute pending;
    Route& route = pending.route;
    route.condition = merged.condition;
    route.source = doc.key;
    route.websocket = spec.enable_websockets;

    if (!spec.prefix_replacements.empty()) {
        const auto* prefix = std::get_if<PrefixMatch>(&route.condition.path);
        if (!prefix) {
            status.add_error(ConditionType::RouteError, "PrefixReplaceNotValid",
                             "prefix replacement requires a prefix condition");
            return std::nullopt;
        }
        std::string error;
        if (!prefix_replacements_valid(spec.prefix_replacements, error)) {
            status.add_error(ConditionType::RouteError, "PrefixReplaceNotValid", error);
            return std::nullopt;
        }
        route.prefix_rewrite = prefix_rewrite(spec.prefix_replacements, prefix->prefix);
    }

    if (has_direct) {
        const auto& dr = *spec.direct_response;
        if (dr.status_code < 200 || dr.status_code > 599) {
            status.add_error(ConditionType::RouteError, "DirectResponseNotValid",
                             "direct response status " + std::to_string(dr.status_code) +
                                 " is outside 200-599");
            return std::nullopt;
        }
        route.direct_response = DirectResponse{dr.status_code, dr.body};
    } else {
        bool weighted = std::any_of(spec.services.begin(), spec.services.end(),
                                    [](const RouteServiceSpec& s) { return s.weight > 0; });
        for (const auto& svc : spec.services) {
            ServiceRef ref;
            ref.ns = doc.key.ns;
            ref.name = svc.name;
            ref.port = svc.port;
            ref.protocol = svc.protocol;
            auto cluster = resolve_cluster(ctx, ref, weighted ? svc.weight : 1, status, served);
            if (cluster) {
                route.clusters.push_back(*cluster);
            }
        }
        if (route.clusters.empty()) {
            return std::nullopt;
        }
    }

    if (spec.request_headers_policy) {
        route.request_headers = build_headers_policy(*spec.request_headers_policy, true, "request", status);
    }
    if (spec.response_headers_policy) {
        route.response_headers = build_headers_policy(*spec.response_headers_policy, false, "response", status);
    }
    if (spec.retry_policy) {
        route.retry = build_retry_policy(*spec.retry_policy, status);
    }
    route.timeout = build_timeout_policy(spec.timeout_policy, status);

    pending.permit_insecure = spec.permit_insecure;
    if (spec.permit_insecure && ctx.config.disable_permit_insecure) {
        status.add_warning(ConditionType::PolicyWarning, "PermitInsecureDisabled",
                           "permit_insecure is disabled by configuration and was ignored");
        pending.permit_insecure = false;
    }

    return pending;
}

// Place a root's route on its virtual hosts. A TLS root serves the route
// on https and an upgrade on http unless insecure access is permitted.
void place_route(BuildContext& ctx, const RootInfo& root, PendingRoute pending) {
    auto https = ctx.placed(root.https_request);
    auto http = ctx.placed(root.http_request);

    if (root.tls_secret) {
        if (http) {
            Route insecure = pending.route;
            if (!pending.permit_insecure) {
                insecure.https_upgrade = true;
                insecure.clusters.clear();
                insecure.direct_response.reset();
            }
            ctx.add_route(*http, std::move(insecure));
        }
        if (https) {
            ctx.add_route(*https, std::move(pending.route));
        }
    } else if (http) {
        ctx.add_route(*http, std::move(pending.route));
    }
}

std::vector<std::vector<MatchCondition>> include_blocks(const DelegationGraph& graph,
                                                        const DelegationPath& path) {
    std::vector<std::vector<MatchCondition>> blocks;
    for (std::size_t i = 0; i < path.include_indices.size(); ++i) {
        blocks.push_back(graph.proxy(path.chain[i]).includes[path.include_indices[i]].conditions);
    }
    return blocks;
}

} // namespace

// ============================================================================
// Roots
// ============================================================================

void validate_roots(BuildContext& ctx, const DelegationGraph& graph) {
    for (std::size_t i = 0; i < graph.size(); ++i) {
        if (!graph.is_root(i)) continue;

        const Document& doc = graph.document(i);
        const auto& proxy = graph.proxy(i);
        const auto& vhost = *proxy.virtualhost;
        auto& status = ctx.status_for(doc);

        if (!doc.parse_errors.empty()) continue;

        if (is_blank(vhost.fqdn)) {
            status.add_error(ConditionType::VirtualHostError, "FQDNNotSpecified",
                             "virtualhost.fqdn must be specified");
            continue;
        }
        status.set_vhost(vhost.fqdn);

        if (!is_valid_hostname(vhost.fqdn)) {
            status.add_error(ConditionType::VirtualHostError, "FQDNNotValid",
                             "virtualhost.fqdn \"" + vhost.fqdn + "\" is not a valid hostname");
            continue;
        }

        if (!ctx.config.root_namespace_allowed(doc.key.ns)) {
            status.add_error(ConditionType::RootNamespaceError, "RootProxyNotAllowedInNamespace",
                             "root proxy cannot be defined in this namespace");
            continue;
        }

        if (proxy.routes.empty() && proxy.includes.empty()) {
            status.add_error(ConditionType::SpecError, "NothingDefined",
                             "proxy must have at least one route or include");
            continue;
        }

        RootInfo root;
        root.arena = i;
        root.doc = &doc;
        root.hostname = to_lower(vhost.fqdn);

        if (vhost.tls) {
            const auto& tls = *vhost.tls;
            bool has_secret = !is_blank(tls.secret_name);

            if (has_secret && tls.passthrough) {
                status.add_error(ConditionType::TLSError, "TLSConfigNotValid",
                                 "virtualhost.tls: both passthrough and secret_name were specified");
                continue;
            }
            if (!has_secret && !tls.passthrough) {
                status.add_error(ConditionType::TLSError, "TLSConfigNotValid",
                                 "virtualhost.tls: neither passthrough nor secret_name were specified");
                continue;
            }
            if (tls.passthrough) {
                status.add_error(ConditionType::TLSError, "TLSPassthroughNotSupported",
                                 "virtualhost.tls: passthrough requires TCP proxying, which is not supported");
                continue;
            }

            auto secret = lookup_secret(ctx.snapshot, tls.secret_name, doc.key.ns, SecretUse::ServingCertificate);
            if (!secret.ok) {
                status.add_error(ConditionType::TLSError, secret.reason, "virtualhost.tls: " + secret.error);
                continue;
            }
            root.tls_secret = secret.key.to_string();
            root.min_tls_version = build_tls_min_version(tls.minimum_protocol_version, status);
        }

        ListenerRequest base;
        base.source = doc.key;
        base.source_timestamp = doc.creation_timestamp;
        base.hostname = root.hostname;
        base.owning = true;

        if (root.tls_secret) {
            ListenerRequest https = base;
            https.member = "https";
            https.protocol = ProtocolClass::HTTPS;
            https.external_port = vhost.port.value_or(ctx.config.https_port);
            https.tls_secret = root.tls_secret;
            root.https_request = ctx.requests.size();
            ctx.requests.push_back(std::move(https));

            ListenerRequest http = base;
            http.member = "http";
            http.protocol = ProtocolClass::HTTP;
            http.external_port = ctx.config.http_port;
            root.http_request = ctx.requests.size();
            ctx.requests.push_back(std::move(http));
        } else {
            ListenerRequest http = base;
            http.member = "http";
            http.protocol = ProtocolClass::HTTP;
            http.external_port = vhost.port.value_or(ctx.config.http_port);
            root.http_request = ctx.requests.size();
            ctx.requests.push_back(std::move(http));
        }

        ctx.roots.push_back(std::move(root));
    }
}

// ============================================================================
// Delegation trees
// ============================================================================

void process_proxies(BuildContext& ctx, const DelegationGraph& graph) {
    // Roots that kept every listener request
    std::vector<std::size_t> valid_roots;
    std::map<std::size_t, const RootInfo*> root_of;
    for (const auto& root : ctx.roots) {
        bool accepted = true;
        for (auto req : {root.https_request, root.http_request}) {
            if (req && !ctx.plan.accepted[*req]) accepted = false;
        }
        if (!accepted) continue;
        valid_roots.push_back(root.arena);
        root_of[root.arena] = &root;

        if (auto https = ctx.placed(root.https_request)) {
            ctx.vhost_routes[*https].min_tls_version = root.min_tls_version;
        }
    }

    auto delegation = resolve_delegation(graph, valid_roots);

    for (const auto& issue : delegation.issues) {
        auto& status = ctx.status_for(graph.document(issue.document));
        if (issue.severity == Severity::Error) {
            status.add_error(issue.type, issue.reason, issue.message);
        } else {
            status.add_warning(issue.type, issue.reason, issue.message);
        }
    }

    std::vector<bool> reached(graph.size(), false);

    for (const auto& path : delegation.paths) {
        bool broken = std::any_of(path.chain.begin(), path.chain.end(), [&](std::size_t d) {
            return !graph.document(d).parse_errors.empty();
        });
        if (broken) continue;

        for (auto d : path.chain) {
            if (!reached[d]) {
                reached[d] = true;
                ctx.status.mark_reachable(graph.document(d).key);
            }
        }

        const RootInfo& root = *root_of.at(path.root);
        auto blocks = include_blocks(graph, path);
        const Document& leaf = graph.document(path.leaf());

        if (path.dangling_include) {
            // Missing or root include: answer its traffic with a bad gateway
            blocks.push_back(graph.proxy(path.leaf()).includes[*path.dangling_include].conditions);
            auto merged = merge_conditions(blocks);
            if (!merged.ok) {
                ctx.status_for(leaf).add_error(ConditionType::IncludeError, merged.reason, merged.error);
                continue;
            }
            PendingRoute pending;
            pending.route.condition = merged.condition;
            pending.route.direct_response = DirectResponse{502, ""};
            pending.route.source = leaf.key;
            place_route(ctx, root, std::move(pending));
            continue;
        }

        auto& status = ctx.status_for(leaf);
        for (const auto& spec : graph.proxy(path.leaf()).routes) {
            auto pending = process_route(ctx, leaf, spec, blocks, status, true);
            if (pending) {
                place_route(ctx, root, std::move(*pending));
            }
        }
    }

    // Unreached delegates are still checked on their own
    for (std::size_t d = 0; d < graph.size(); ++d) {
        const Document& doc = graph.document(d);
        if (reached[d] || graph.is_root(d) || !doc.parse_errors.empty()) continue;

        auto& status = ctx.status_for(doc);
        for (const auto& spec : graph.proxy(d).routes) {
            process_route(ctx, doc, spec, {}, status, false);
        }
    }

    spdlog::debug("proxies: {} roots valid of {}, {} delegation paths",
                  valid_roots.size(), ctx.roots.size(), delegation.paths.size());
}

} // namespace detail
} // namespace trellis
