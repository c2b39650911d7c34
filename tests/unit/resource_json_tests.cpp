#include <doctest/doctest.h>
#include <trellis/resource_json.hpp>

using namespace trellis;

TEST_CASE("parse a root proxy document") {
    auto result = parse_resource_document(R"json({
        "kind": "Proxy",
        "metadata": {"namespace": "web", "name": "root",
                     "creation_timestamp": "2024-01-01T00:00:00Z", "revision": 4},
        "spec": {
            "virtualhost": {
                "fqdn": "example.com",
                "tls": {"secret_name": "cert", "minimum_protocol_version": "1.3"}
            },
            "includes": [
                {"name": "app", "namespace": "team",
                 "conditions": [{"prefix": "/app"}, {"header": {"name": "x-env", "kind": "exact", "value": "prod"}}]}
            ],
            "routes": [
                {
                    "conditions": [{"exact": "/health"}],
                    "services": [{"name": "health", "port": 8080, "weight": 10}],
                    "permit_insecure": true,
                    "enable_websockets": true,
                    "path_rewrite": {"prefix_replacements": [{"prefix": "/health", "replacement": "/"}]},
                    "request_headers_policy": {"set": [{"name": "x-a", "value": "1"}], "remove": ["x-b"]},
                    "retry_policy": {"count": 3, "per_try_timeout": "1s", "retry_on": ["5xx"]},
                    "timeout_policy": {"response": "30s", "idle": "infinity"}
                },
                {"direct_response": {"status_code": 404, "body": "gone"}}
            ]
        }
    })json");

    REQUIRE(result.ok);
    const auto& doc = result.document;
    CHECK(doc.parse_errors.empty());
    CHECK(doc.key.kind == Kind::Proxy);
    CHECK(doc.key.to_string() == "web/root");
    CHECK(doc.revision == 4);
    CHECK(doc.creation_timestamp == "2024-01-01T00:00:00Z");
    CHECK(doc.is_root());

    const auto* proxy = doc.proxy();
    REQUIRE(proxy != nullptr);
    CHECK(proxy->virtualhost->fqdn == "example.com");
    REQUIRE(proxy->virtualhost->tls.has_value());
    CHECK(proxy->virtualhost->tls->secret_name == "cert");
    CHECK(proxy->virtualhost->tls->minimum_protocol_version == "1.3");

    REQUIRE(proxy->includes.size() == 1);
    CHECK(proxy->includes[0].ns == "team");
    REQUIRE(proxy->includes[0].conditions.size() == 2);
    CHECK(std::get<PrefixMatch>(proxy->includes[0].conditions[0]).prefix == "/app");
    const auto& h = std::get<HeaderMatch>(proxy->includes[0].conditions[1]);
    CHECK(h.kind == HeaderMatchKind::Exact);
    CHECK(h.value == "prod");

    REQUIRE(proxy->routes.size() == 2);
    const auto& route = proxy->routes[0];
    CHECK(std::get<ExactMatch>(route.conditions[0]).path == "/health");
    REQUIRE(route.services.size() == 1);
    CHECK(route.services[0].port == 8080);
    CHECK(route.services[0].weight == 10);
    CHECK(route.permit_insecure);
    CHECK(route.enable_websockets);
    CHECK(route.prefix_replacements.size() == 1);
    REQUIRE(route.request_headers_policy.has_value());
    CHECK(route.request_headers_policy->remove == std::vector<std::string>{"x-b"});
    CHECK(route.retry_policy->count == 3);
    CHECK(route.timeout_policy->idle == "infinity");

    REQUIRE(proxy->routes[1].direct_response.has_value());
    CHECK(proxy->routes[1].direct_response->status_code == 404);
}

TEST_CASE("namespace defaults to default") {
    auto result = parse_resource_document(R"({"kind": "Service", "metadata": {"name": "svc"}})");
    REQUIRE(result.ok);
    CHECK(result.document.key.ns == "default");
    CHECK(result.document.service() != nullptr);
}

TEST_CASE("unidentifiable documents fail to parse") {
    CHECK(parse_resource_document(R"({"metadata": {"name": "x"}})").error == "kind missing");
    CHECK(parse_resource_document(R"({"kind": "Widget", "metadata": {"name": "x"}})")
              .error.find("unknown kind") == 0);
    CHECK(parse_resource_document(R"({"kind": "Proxy"})").error == "metadata missing");
    CHECK(parse_resource_document(R"({"kind": "Proxy", "metadata": {}})", "a.json").error ==
          "a.json: metadata.name missing");
    CHECK(parse_resource_document("[1, 2").error.find("parse error") == 0);
}

TEST_CASE("field problems are recorded on the document") {
    auto result = parse_resource_document(R"json({
        "kind": "Proxy",
        "metadata": {"name": "p"},
        "spec": {
            "includes": [{"conditions": [{"prefix": "/a"}]}],
            "routes": [
                {"conditions": [{"prefix": "/a", "exact": "/b"}], "services": [{"name": "s", "port": "80"}]},
                "not an object"
            ]
        }
    })json");

    REQUIRE(result.ok);
    const auto& errors = result.document.parse_errors;
    CHECK(errors.size() == 4);
    CHECK(errors[0] == "spec.includes[0].name: include name is required");
    CHECK(errors[1].find("spec.routes[0].conditions[0]") == 0);
    CHECK(errors[2] == "spec.routes[0].services[0].port: must be an integer");
    CHECK(errors[3] == "spec.routes[1]: must be an object");
}

TEST_CASE("out of range numbers are field errors, not wrapped values") {
    auto proxy = parse_resource_document(R"json({
        "kind": "Proxy",
        "metadata": {"namespace": "ns", "name": "r"},
        "spec": {
            "virtualhost": {"fqdn": "x.com", "port": 4294967376},
            "routes": [{"services": [{"name": "svc", "port": 4294967376, "weight": 4294967296}]}]
        }
    })json");

    REQUIRE(proxy.ok);
    const auto& errors = proxy.document.parse_errors;
    REQUIRE(errors.size() == 3);
    CHECK(errors[0] == "spec.virtualhost.port: port 4294967376 is outside 1-65535");
    CHECK(errors[1] == "spec.routes[0].services[0].port: port 4294967376 is outside 1-65535");
    CHECK(errors[2] == "spec.routes[0].services[0].weight: must be at most 4294967295");

    const auto& spec = std::get<ProxySpec>(proxy.document.spec);
    CHECK_FALSE(spec.virtualhost->port.has_value());

    auto others = parse_resource_documents(R"json([
        {"kind": "Service", "metadata": {"name": "svc"}, "spec": {"ports": [{"name": "http", "port": 0}]}},
        {"kind": "Gateway", "metadata": {"name": "gw"},
         "spec": {"listeners": [{"name": "web", "protocol": "HTTP", "port": 70000}]}},
        {"kind": "Route", "metadata": {"name": "rt"},
         "spec": {"parent_refs": [{"name": "gw"}],
                  "rules": [{"backends": [{"name": "svc", "port": -80, "weight": -1}]}]}}
    ])json");

    REQUIRE(others.ok);
    REQUIRE(others.documents.size() == 3);
    CHECK(others.documents[0].parse_errors ==
          std::vector<std::string>{"spec.ports[0].port: port 0 is outside 1-65535"});
    CHECK(others.documents[1].parse_errors ==
          std::vector<std::string>{"spec.listeners[0].port: port 70000 is outside 1-65535"});
    CHECK(std::get<GatewaySpec>(others.documents[1].spec).listeners.empty());
    CHECK(others.documents[2].parse_errors ==
          std::vector<std::string>{"spec.rules[0].backends[0].port: port -80 is outside 1-65535",
                                   "spec.rules[0].backends[0].weight: must not be negative"});
}

TEST_CASE("parse a flat route and a gateway") {
    auto result = parse_resource_documents(R"json([
        {
            "kind": "Gateway",
            "metadata": {"namespace": "infra", "name": "gw"},
            "spec": {"listeners": [
                {"name": "web", "protocol": "HTTP", "port": 80, "hostname": "*.example.com", "allowed_routes": "All"},
                {"name": "secure", "protocol": "HTTPS", "port": 443, "tls": {"certificate_ref": "cert"}},
                {"name": "broken", "protocol": "HTTP"}
            ]}
        },
        {
            "kind": "Route",
            "metadata": {"namespace": "team", "name": "rt"},
            "spec": {
                "parent_refs": [{"namespace": "infra", "name": "gw", "section_name": "web"}],
                "hostnames": ["app.example.com"],
                "rules": [{
                    "matches": [{"path": {"type": "Exact", "value": "/login"},
                                 "headers": [{"name": "x-tenant", "kind": "present"}]}],
                    "backends": [{"name": "auth", "port": 8080, "weight": 2}]
                }]
            }
        }
    ])json", "docs.json");

    REQUIRE(result.ok);
    REQUIRE(result.documents.size() == 2);

    const auto* gw = result.documents[0].gateway();
    REQUIRE(gw != nullptr);
    REQUIRE(gw->listeners.size() == 2);
    CHECK(gw->listeners[0].allowed_routes == AllowedRoutes::All);
    CHECK(gw->listeners[0].hostname == "*.example.com");
    CHECK(gw->listeners[1].protocol == ListenerProtocol::HTTPS);
    CHECK(gw->listeners[1].certificate_ref == "cert");
    CHECK(gw->listeners[1].allowed_routes == AllowedRoutes::Same);
    REQUIRE(result.documents[0].parse_errors.size() == 1);
    CHECK(result.documents[0].parse_errors[0] == "spec.listeners[2].port: port is required");

    const auto* rt = result.documents[1].route();
    REQUIRE(rt != nullptr);
    CHECK(rt->parent_refs[0].section_name == "web");
    CHECK(rt->hostnames == std::vector<std::string>{"app.example.com"});
    REQUIRE(rt->rules.size() == 1);
    const auto& match = rt->rules[0].matches[0];
    REQUIRE(match.path.has_value());
    CHECK(std::get<ExactMatch>(*match.path).path == "/login");
    CHECK(match.headers.size() == 1);
    CHECK(rt->rules[0].backends[0].weight == 2);
    CHECK(rt->rules[0].backends[0].ns.empty());
}

TEST_CASE("parse services, secrets and delegations") {
    auto result = parse_resource_documents(R"json([
        {"kind": "Service", "metadata": {"namespace": "ns", "name": "api"},
         "spec": {"ports": [{"name": "grpc", "port": 9000, "protocol": "h2c"}]}},
        {"kind": "Secret", "metadata": {"namespace": "ns", "name": "cert"},
         "spec": {"type": "TLS", "data": {"tls.crt": "c", "tls.key": "k"}}},
        {"kind": "CertificateDelegation", "metadata": {"namespace": "ns", "name": "d"},
         "spec": {"delegations": [{"secret_name": "cert", "target_namespaces": ["*"]}]}}
    ])json");

    REQUIRE(result.ok);
    REQUIRE(result.documents.size() == 3);
    CHECK(result.documents[0].service()->ports[0].protocol == "h2c");
    CHECK(result.documents[1].secret()->type == "tls");
    CHECK(result.documents[1].secret()->data.at("tls.key") == "k");
    CHECK(result.documents[2].delegation()->delegations[0].target_namespaces ==
          std::vector<std::string>{"*"});
}

TEST_CASE("one bad document fails the whole list") {
    auto result = parse_resource_documents(R"json([
        {"kind": "Service", "metadata": {"name": "a"}},
        {"kind": "Service", "metadata": {}}
    ])json", "list.json");
    CHECK_FALSE(result.ok);
    CHECK(result.documents.empty());
    CHECK(result.error == "list.json[1]: metadata.name missing");

    CHECK(parse_resource_documents("42").error == "JSON must be an object or an array of objects");
}

TEST_CASE("a single object parses as a one-document list") {
    auto result = parse_resource_documents(R"({"kind": "Secret", "metadata": {"name": "s"}})");
    REQUIRE(result.ok);
    CHECK(result.documents.size() == 1);
}
