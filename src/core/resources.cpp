#include "trellis/resources.hpp"

#include <utility>

namespace trellis {

namespace {

Document make_document(Kind kind, const std::string& ns, const std::string& name,
                       DocumentSpec spec, const std::string& creation_timestamp) {
    Document doc;
    doc.key.kind = kind;
    doc.key.ns = ns;
    doc.key.name = name;
    doc.creation_timestamp = creation_timestamp;
    doc.spec = std::move(spec);
    return doc;
}

} // namespace

std::optional<HeaderMatchKind> parse_header_match_kind(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "present") return HeaderMatchKind::Present;
    if (lower == "notpresent") return HeaderMatchKind::NotPresent;
    if (lower == "contains") return HeaderMatchKind::Contains;
    if (lower == "notcontains") return HeaderMatchKind::NotContains;
    if (lower == "exact") return HeaderMatchKind::Exact;
    if (lower == "notexact") return HeaderMatchKind::NotExact;
    return std::nullopt;
}

std::optional<ListenerProtocol> parse_listener_protocol(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "http") return ListenerProtocol::HTTP;
    if (lower == "https") return ListenerProtocol::HTTPS;
    if (lower == "tls") return ListenerProtocol::TLS;
    return std::nullopt;
}

Document make_proxy(const std::string& ns, const std::string& name, ProxySpec spec,
                    const std::string& creation_timestamp) {
    return make_document(Kind::Proxy, ns, name, std::move(spec), creation_timestamp);
}

Document make_route_resource(const std::string& ns, const std::string& name, RouteResourceSpec spec,
                             const std::string& creation_timestamp) {
    return make_document(Kind::Route, ns, name, std::move(spec), creation_timestamp);
}

Document make_gateway(const std::string& ns, const std::string& name, GatewaySpec spec,
                      const std::string& creation_timestamp) {
    return make_document(Kind::Gateway, ns, name, std::move(spec), creation_timestamp);
}

Document make_service(const std::string& ns, const std::string& name, std::vector<ServicePort> ports) {
    ServiceResourceSpec spec;
    spec.ports = std::move(ports);
    return make_document(Kind::Service, ns, name, std::move(spec), "");
}

Document make_tls_secret(const std::string& ns, const std::string& name) {
    SecretSpec spec;
    spec.type = "tls";
    spec.data["tls.crt"] = "certificate";
    spec.data["tls.key"] = "key";
    return make_document(Kind::Secret, ns, name, std::move(spec), "");
}

} // namespace trellis
