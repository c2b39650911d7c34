#pragma once

// Document builders shared by the unit and integration tests

#include <trellis/builder.hpp>
#include <trellis/resource_cache.hpp>
#include <trellis/resources.hpp>

#include <memory>
#include <string>
#include <vector>

namespace trellis::test {

inline MatchCondition prefix(const std::string& p) {
    return PrefixMatch{p};
}

inline MatchCondition exact(const std::string& p) {
    return ExactMatch{p};
}

inline MatchCondition regex(const std::string& r) {
    return RegexMatch{r};
}

inline MatchCondition header(const std::string& name, HeaderMatchKind kind, const std::string& value = "") {
    HeaderMatch h;
    h.name = name;
    h.kind = kind;
    h.value = value;
    return h;
}

inline IncludeSpec include(const std::string& name, std::vector<MatchCondition> conditions = {},
                           const std::string& ns = "") {
    IncludeSpec inc;
    inc.name = name;
    inc.ns = ns;
    inc.conditions = std::move(conditions);
    return inc;
}

inline RouteSpec route_to(const std::string& service, int port, std::vector<MatchCondition> conditions = {}) {
    RouteSpec route;
    route.conditions = std::move(conditions);
    RouteServiceSpec svc;
    svc.name = service;
    svc.port = port;
    route.services.push_back(svc);
    return route;
}

inline Document root_proxy(const std::string& ns, const std::string& name, const std::string& fqdn,
                           std::vector<RouteSpec> routes, std::vector<IncludeSpec> includes = {},
                           const std::string& created = "2024-01-01T00:00:00Z") {
    ProxySpec spec;
    VirtualHostSpec vhost;
    vhost.fqdn = fqdn;
    spec.virtualhost = vhost;
    spec.routes = std::move(routes);
    spec.includes = std::move(includes);
    return make_proxy(ns, name, std::move(spec), created);
}

inline Document tls_root_proxy(const std::string& ns, const std::string& name, const std::string& fqdn,
                               const std::string& secret, std::vector<RouteSpec> routes,
                               const std::string& created = "2024-01-01T00:00:00Z") {
    Document doc = root_proxy(ns, name, fqdn, std::move(routes), {}, created);
    TLSSpec tls;
    tls.secret_name = secret;
    std::get<ProxySpec>(doc.spec).virtualhost->tls = tls;
    return doc;
}

inline Document delegate_proxy(const std::string& ns, const std::string& name, std::vector<RouteSpec> routes,
                               std::vector<IncludeSpec> includes = {}) {
    ProxySpec spec;
    spec.routes = std::move(routes);
    spec.includes = std::move(includes);
    return make_proxy(ns, name, std::move(spec), "2024-01-01T00:00:00Z");
}

inline Document http_service(const std::string& ns, const std::string& name, int port = 80) {
    ServicePort p;
    p.name = "http";
    p.port = port;
    return make_service(ns, name, {p});
}

inline std::shared_ptr<const CacheSnapshot> snapshot_of(std::vector<Document> docs) {
    ResourceCache cache;
    cache.replace_all(std::move(docs));
    return cache.snapshot();
}

inline const StatusRecord* find_status(const std::vector<StatusRecord>& records, Kind kind,
                                       const std::string& ns, const std::string& name) {
    for (const auto& r : records) {
        if (r.key.kind == kind && r.key.ns == ns && r.key.name == name) {
            return &r;
        }
    }
    return nullptr;
}

inline const StatusCondition* find_condition(const StatusRecord& record, const std::string& reason) {
    for (const auto& c : record.conditions) {
        if (c.reason == reason) {
            return &c;
        }
    }
    return nullptr;
}

} // namespace trellis::test
