#include "trellis/graph.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace trellis {

namespace {

nlohmann::ordered_json headers_policy_json(const HeadersPolicy& policy) {
    nlohmann::ordered_json j;
    nlohmann::ordered_json set = nlohmann::ordered_json::array();
    for (const auto& h : policy.set) {
        nlohmann::ordered_json entry;
        entry["name"] = h.name;
        entry["value"] = h.value;
        set.push_back(std::move(entry));
    }
    j["set"] = std::move(set);
    j["remove"] = policy.remove;
    if (!policy.host_rewrite.empty()) {
        j["host_rewrite"] = policy.host_rewrite;
    }
    return j;
}

nlohmann::ordered_json route_json(const Route& route) {
    nlohmann::ordered_json j;

    nlohmann::ordered_json match;
    match[path_match_type(route.condition.path)] = route.condition.match_string();
    if (!route.condition.headers.empty()) {
        nlohmann::ordered_json headers = nlohmann::ordered_json::array();
        for (const auto& h : route.condition.headers) {
            nlohmann::ordered_json hj;
            hj["name"] = h.name;
            hj["match"] = header_match_kind_to_string(h.kind);
            if (h.kind != HeaderMatchKind::Present && h.kind != HeaderMatchKind::NotPresent) {
                hj["value"] = h.value;
            }
            headers.push_back(std::move(hj));
        }
        match["headers"] = std::move(headers);
    }
    j["match"] = std::move(match);

    if (route.direct_response) {
        j["direct_response"]["status"] = route.direct_response->status_code;
        j["direct_response"]["body"] = route.direct_response->body;
    } else {
        nlohmann::ordered_json clusters = nlohmann::ordered_json::array();
        for (const auto& c : route.clusters) {
            nlohmann::ordered_json cj;
            cj["cluster"] = c.cluster;
            cj["weight"] = c.weight;
            clusters.push_back(std::move(cj));
        }
        j["clusters"] = std::move(clusters);
    }

    if (route.https_upgrade) j["https_upgrade"] = true;
    if (route.websocket) j["websocket"] = true;
    if (route.prefix_rewrite) j["prefix_rewrite"] = *route.prefix_rewrite;
    if (!route.request_headers.empty()) j["request_headers"] = headers_policy_json(route.request_headers);
    if (!route.response_headers.empty()) j["response_headers"] = headers_policy_json(route.response_headers);

    if (route.retry) {
        j["retry"]["count"] = route.retry->count;
        j["retry"]["per_try_timeout"] = timeout_setting_to_string(route.retry->per_try_timeout);
        j["retry"]["retry_on"] = route.retry->retry_on;
    }

    if (route.timeout.response.mode != TimeoutSetting::Mode::Default ||
        route.timeout.idle.mode != TimeoutSetting::Mode::Default) {
        j["timeout"]["response"] = timeout_setting_to_string(route.timeout.response);
        j["timeout"]["idle"] = timeout_setting_to_string(route.timeout.idle);
    }

    j["source"] = std::string(kind_to_string(route.source.kind)) + " " + route.source.to_string();
    return j;
}

} // namespace

std::string cluster_name(const std::string& ns, const std::string& service, int port,
                         const std::string& protocol) {
    std::string name = ns + "/" + service + "/" + std::to_string(port);
    if (!protocol.empty()) {
        name += "/" + protocol;
    }
    return name;
}

// ============================================================================
// Graph lookups
// ============================================================================

const Listener* Graph::find_listener(const std::string& name) const {
    for (const auto& l : listeners) {
        if (l.name == name) return &l;
    }
    return nullptr;
}

const VirtualHost* Graph::find_virtual_host(const std::string& listener, const std::string& hostname) const {
    const Listener* l = find_listener(listener);
    if (!l) return nullptr;
    for (const auto& vh : l->virtual_hosts) {
        if (vh.hostname == hostname) return &vh;
    }
    return nullptr;
}

std::size_t Graph::route_count() const {
    std::size_t n = 0;
    for (const auto& l : listeners) {
        for (const auto& vh : l.virtual_hosts) {
            n += vh.routes.size();
        }
    }
    return n;
}

// ============================================================================
// Emission
// ============================================================================

Graph emit_graph(const ListenerPlan& plan, VirtualHostRoutes routes,
                 std::vector<Cluster> clusters, uint64_t source_revision) {
    Graph graph;
    graph.source_revision = source_revision;

    for (const auto& planned : plan.listeners) {
        Listener listener;
        listener.name = planned.name;
        listener.protocol = planned.protocol;
        listener.port = planned.external_port;
        listener.internal_port = planned.internal_port;

        for (const auto& pvh : planned.virtual_hosts) {
            auto it = routes.find({planned.name, pvh.hostname});
            if (it == routes.end() || it->second.routes.empty()) {
                continue;
            }

            VirtualHost vhost;
            vhost.hostname = pvh.hostname.empty() ? "*" : pvh.hostname;
            vhost.tls_secret = pvh.tls_secret;
            if (vhost.tls_secret) {
                vhost.min_tls_version = it->second.min_tls_version.empty() ? "1.2"
                                                                           : it->second.min_tls_version;
            }
            vhost.routes = std::move(it->second.routes);
            listener.virtual_hosts.push_back(std::move(vhost));
        }

        if (listener.virtual_hosts.empty()) {
            continue;
        }
        std::sort(listener.virtual_hosts.begin(), listener.virtual_hosts.end(),
                  [](const VirtualHost& a, const VirtualHost& b) { return a.hostname < b.hostname; });
        graph.listeners.push_back(std::move(listener));
    }

    std::sort(graph.listeners.begin(), graph.listeners.end(),
              [](const Listener& a, const Listener& b) { return a.name < b.name; });

    std::sort(clusters.begin(), clusters.end(),
              [](const Cluster& a, const Cluster& b) { return a.name < b.name; });
    clusters.erase(std::unique(clusters.begin(), clusters.end(),
                               [](const Cluster& a, const Cluster& b) { return a.name == b.name; }),
                   clusters.end());
    graph.clusters = std::move(clusters);

    spdlog::debug("emitted graph: {} listeners, {} routes, {} clusters",
                  graph.listeners.size(), graph.route_count(), graph.clusters.size());

    return graph;
}

std::string serialize_graph_json(const Graph& graph) {
    nlohmann::ordered_json j;
    j["revision"] = graph.source_revision;

    nlohmann::ordered_json listeners = nlohmann::ordered_json::array();
    for (const auto& l : graph.listeners) {
        nlohmann::ordered_json lj;
        lj["name"] = l.name;
        lj["protocol"] = protocol_class_to_string(l.protocol);
        lj["port"] = l.port;
        lj["internal_port"] = l.internal_port;

        nlohmann::ordered_json vhosts = nlohmann::ordered_json::array();
        for (const auto& vh : l.virtual_hosts) {
            nlohmann::ordered_json vj;
            vj["hostname"] = vh.hostname;
            if (vh.tls_secret) {
                vj["tls"]["secret"] = *vh.tls_secret;
                vj["tls"]["minimum_protocol_version"] = vh.min_tls_version;
            }
            nlohmann::ordered_json routes = nlohmann::ordered_json::array();
            for (const auto& r : vh.routes) {
                routes.push_back(route_json(r));
            }
            vj["routes"] = std::move(routes);
            vhosts.push_back(std::move(vj));
        }
        lj["virtual_hosts"] = std::move(vhosts);
        listeners.push_back(std::move(lj));
    }
    j["listeners"] = std::move(listeners);

    nlohmann::ordered_json clusters = nlohmann::ordered_json::array();
    for (const auto& c : graph.clusters) {
        nlohmann::ordered_json cj;
        cj["name"] = c.name;
        cj["service"] = c.ns + "/" + c.service;
        cj["port"] = c.port;
        if (!c.protocol.empty()) cj["protocol"] = c.protocol;
        if (!c.external_name.empty()) cj["external_name"] = c.external_name;
        clusters.push_back(std::move(cj));
    }
    j["clusters"] = std::move(clusters);

    return j.dump(2);
}

} // namespace trellis
