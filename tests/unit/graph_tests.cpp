#include <doctest/doctest.h>
#include <trellis/graph.hpp>

#include <nlohmann/json.hpp>

using namespace trellis;

namespace {

PlannedListener planned(ProtocolClass protocol, int port, std::vector<std::string> hostnames,
                        std::optional<std::string> secret = std::nullopt) {
    PlannedListener l;
    l.protocol = protocol;
    l.external_port = port;
    l.internal_port = map_external_port(port).internal_port;
    l.name = std::string(protocol_class_to_string(protocol)) + "-" + std::to_string(port);
    for (auto& h : hostnames) {
        PlannedVirtualHost vh;
        vh.hostname = h;
        vh.tls_secret = secret;
        l.virtual_hosts.push_back(vh);
    }
    return l;
}

Route cluster_route(const std::string& prefix, const std::string& cluster) {
    Route r;
    r.condition.path = PrefixMatch{prefix};
    r.clusters.push_back({cluster, 0});
    r.source = ResourceKey{Kind::Proxy, "ns", "root"};
    return r;
}

Cluster cluster(const std::string& service, int port) {
    Cluster c;
    c.ns = "ns";
    c.service = service;
    c.port = port;
    c.name = cluster_name("ns", service, port, "");
    return c;
}

} // namespace

TEST_CASE("cluster_name") {
    CHECK(cluster_name("ns", "svc", 80, "") == "ns/svc/80");
    CHECK(cluster_name("ns", "svc", 9000, "h2c") == "ns/svc/9000/h2c");
}

TEST_CASE("emit_graph assembles listeners and virtual hosts") {
    ListenerPlan plan;
    plan.listeners.push_back(planned(ProtocolClass::HTTPS, 443, {"b.example.com"}, std::string("ns/cert")));
    plan.listeners.push_back(planned(ProtocolClass::HTTP, 80, {"b.example.com", "", "a.example.com"}));

    VirtualHostRoutes routes;
    routes[{"http-80", "a.example.com"}].routes.push_back(cluster_route("/", "ns/a/80"));
    routes[{"http-80", ""}].routes.push_back(cluster_route("/", "ns/default/80"));
    routes[{"http-80", "b.example.com"}].routes.push_back(cluster_route("/", "ns/b/80"));
    routes[{"https-443", "b.example.com"}].routes.push_back(cluster_route("/", "ns/b/80"));

    auto graph = emit_graph(plan, routes, {cluster("b", 80), cluster("a", 80), cluster("b", 80)}, 12);

    CHECK(graph.source_revision == 12);
    REQUIRE(graph.listeners.size() == 2);
    CHECK(graph.listeners[0].name == "http-80");
    CHECK(graph.listeners[1].name == "https-443");

    const auto& http = graph.listeners[0];
    CHECK(http.internal_port == 64592);
    REQUIRE(http.virtual_hosts.size() == 3);
    CHECK(http.virtual_hosts[0].hostname == "*");
    CHECK(http.virtual_hosts[1].hostname == "a.example.com");
    CHECK(http.virtual_hosts[2].hostname == "b.example.com");

    const auto* secure = graph.find_virtual_host("https-443", "b.example.com");
    REQUIRE(secure != nullptr);
    CHECK(secure->tls_secret == std::string("ns/cert"));
    CHECK(secure->min_tls_version == "1.2");

    REQUIRE(graph.clusters.size() == 2);
    CHECK(graph.clusters[0].name == "ns/a/80");
    CHECK(graph.clusters[1].name == "ns/b/80");
    CHECK(graph.route_count() == 4);
}

TEST_CASE("virtual hosts without routes are left out") {
    ListenerPlan plan;
    plan.listeners.push_back(planned(ProtocolClass::HTTP, 80, {"a.example.com", "empty.example.com"}));
    plan.listeners.push_back(planned(ProtocolClass::HTTP, 8080, {"idle.example.com"}));

    VirtualHostRoutes routes;
    routes[{"http-80", "a.example.com"}].routes.push_back(cluster_route("/", "ns/a/80"));
    routes[{"http-80", "empty.example.com"}];

    auto graph = emit_graph(plan, routes, {}, 1);
    REQUIRE(graph.listeners.size() == 1);
    CHECK(graph.listeners[0].virtual_hosts.size() == 1);
    CHECK(graph.find_listener("http-8080") == nullptr);
    CHECK(graph.find_virtual_host("http-80", "empty.example.com") == nullptr);
    CHECK(graph.find_virtual_host("nope", "a.example.com") == nullptr);
}

TEST_CASE("a configured minimum TLS version is kept") {
    ListenerPlan plan;
    plan.listeners.push_back(planned(ProtocolClass::HTTPS, 443, {"a.example.com"}, std::string("ns/cert")));

    VirtualHostRoutes routes;
    auto& content = routes[{"https-443", "a.example.com"}];
    content.min_tls_version = "1.3";
    content.routes.push_back(cluster_route("/", "ns/a/80"));

    auto graph = emit_graph(plan, routes, {}, 1);
    CHECK(graph.find_virtual_host("https-443", "a.example.com")->min_tls_version == "1.3");
}

TEST_CASE("serialize_graph_json is byte-stable and complete") {
    ListenerPlan plan;
    plan.listeners.push_back(planned(ProtocolClass::HTTP, 80, {"a.example.com"}));

    Route upgrade;
    upgrade.condition.path = PrefixMatch{"/"};
    upgrade.https_upgrade = true;
    upgrade.source = ResourceKey{Kind::Proxy, "ns", "root"};

    Route direct;
    direct.condition.path = ExactMatch{"/gone"};
    HeaderMatch h;
    h.name = "x-env";
    h.kind = HeaderMatchKind::Exact;
    h.value = "prod";
    direct.condition.headers.push_back(h);
    direct.direct_response = DirectResponse{410, "gone"};
    direct.source = ResourceKey{Kind::Proxy, "ns", "root"};

    Route rich = cluster_route("/api", "ns/a/80");
    rich.websocket = true;
    rich.prefix_rewrite = "/v1";
    rich.retry = RetryPolicy{};
    rich.timeout.response.mode = TimeoutSetting::Mode::Value;
    rich.timeout.response.millis = 5000;
    rich.request_headers.set.push_back({"X-A", "1"});

    VirtualHostRoutes routes;
    routes[{"http-80", "a.example.com"}].routes = {direct, rich, upgrade};

    auto graph = emit_graph(plan, routes, {cluster("a", 80)}, 3);
    auto text = serialize_graph_json(graph);
    CHECK(text == serialize_graph_json(graph));

    auto j = nlohmann::json::parse(text);
    CHECK(j["revision"] == 3);
    const auto& vhost = j["listeners"][0]["virtual_hosts"][0];
    CHECK(vhost["hostname"] == "a.example.com");
    CHECK_FALSE(vhost.contains("tls"));

    const auto& r0 = vhost["routes"][0];
    CHECK(r0["match"]["exact"] == "/gone");
    CHECK(r0["match"]["headers"][0]["match"] == "exact");
    CHECK(r0["match"]["headers"][0]["value"] == "prod");
    CHECK(r0["direct_response"]["status"] == 410);
    CHECK_FALSE(r0.contains("clusters"));

    const auto& r1 = vhost["routes"][1];
    CHECK(r1["clusters"][0]["cluster"] == "ns/a/80");
    CHECK(r1["websocket"] == true);
    CHECK(r1["prefix_rewrite"] == "/v1");
    CHECK(r1["retry"]["retry_on"] == "5xx");
    CHECK(r1["timeout"]["response"] == "5000ms");
    CHECK(r1["timeout"]["idle"] == "default");
    CHECK(r1["request_headers"]["set"][0]["name"] == "X-A");
    CHECK(r1["source"] == "Proxy ns/root");

    const auto& r2 = vhost["routes"][2];
    CHECK(r2["https_upgrade"] == true);
    CHECK(r2["clusters"].empty());

    CHECK(j["clusters"][0]["service"] == "ns/a");
}
