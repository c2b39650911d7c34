#include "trellis/resource_json.hpp"

#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>

#include <nlohmann/json.hpp>

namespace trellis {

namespace {

// Collects field-level problems under a JSON path prefix
struct FieldErrors {
    std::vector<std::string>& errors;

    void add(const std::string& path, const std::string& message) {
        errors.push_back(path + ": " + message);
    }
};

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Helper to safely get a string array from JSON
std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

std::string string_or(const nlohmann::json& j, const std::string& key, const std::string& fallback = "") {
    auto value = get_string(j, key);
    return value ? *value : fallback;
}

bool bool_or(const nlohmann::json& j, const std::string& key, const std::string& path,
             FieldErrors& errors, bool fallback = false) {
    if (!j.contains(key)) return fallback;
    if (!j[key].is_boolean()) {
        errors.add(path + "." + key, "must be a boolean");
        return fallback;
    }
    return j[key].get<bool>();
}

std::optional<long long> get_int(const nlohmann::json& j, const std::string& key, const std::string& path,
                                 FieldErrors& errors) {
    if (!j.contains(key)) return std::nullopt;
    if (!j[key].is_number_integer()) {
        errors.add(path + "." + key, "must be an integer");
        return std::nullopt;
    }
    if (j[key].is_number_unsigned() &&
        j[key].get<unsigned long long>() > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
        errors.add(path + "." + key, "is out of range");
        return std::nullopt;
    }
    return j[key].get<long long>();
}

// Integer limited to [min, max]. Values outside the range are field errors.
std::optional<long long> get_int_in_range(const nlohmann::json& j, const std::string& key, const std::string& path,
                                          FieldErrors& errors, long long min, long long max) {
    auto value = get_int(j, key, path, errors);
    if (!value) return std::nullopt;
    if (*value < min || *value > max) {
        errors.add(path + "." + key, "must be between " + std::to_string(min) + " and " + std::to_string(max));
        return std::nullopt;
    }
    return value;
}

std::optional<int> get_port(const nlohmann::json& j, const std::string& key, const std::string& path,
                            FieldErrors& errors) {
    auto value = get_int(j, key, path, errors);
    if (!value) return std::nullopt;
    if (*value < 1 || *value > 65535) {
        errors.add(path + "." + key, "port " + std::to_string(*value) + " is outside 1-65535");
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

std::optional<int> get_int32(const nlohmann::json& j, const std::string& key, const std::string& path,
                             FieldErrors& errors) {
    auto value = get_int_in_range(j, key, path, errors, std::numeric_limits<int>::min(),
                                  std::numeric_limits<int>::max());
    if (!value) return std::nullopt;
    return static_cast<int>(*value);
}

std::optional<uint32_t> get_weight(const nlohmann::json& j, const std::string& key, const std::string& path,
                                   FieldErrors& errors) {
    auto value = get_int(j, key, path, errors);
    if (!value) return std::nullopt;
    if (*value < 0) {
        errors.add(path + "." + key, "must not be negative");
        return std::nullopt;
    }
    if (*value > static_cast<long long>(std::numeric_limits<uint32_t>::max())) {
        errors.add(path + "." + key, "must be at most " + std::to_string(std::numeric_limits<uint32_t>::max()));
        return std::nullopt;
    }
    return static_cast<uint32_t>(*value);
}

// Iterate an optional array field, reporting a non-array value
template <typename Fn>
void for_each_object(const nlohmann::json& j, const std::string& key, const std::string& path,
                     FieldErrors& errors, Fn fn) {
    if (!j.contains(key)) return;
    if (!j[key].is_array()) {
        errors.add(path + "." + key, "must be an array");
        return;
    }
    std::size_t i = 0;
    for (const auto& elem : j[key]) {
        std::string elem_path = path + "." + key + "[" + std::to_string(i++) + "]";
        if (!elem.is_object()) {
            errors.add(elem_path, "must be an object");
            continue;
        }
        fn(elem, elem_path);
    }
}

// ============================================================================
// Match conditions
// ============================================================================

std::optional<HeaderMatch> parse_header_match(const nlohmann::json& j, const std::string& path,
                                              FieldErrors& errors) {
    HeaderMatch header;
    header.name = trim(string_or(j, "name"));
    if (header.name.empty()) {
        errors.add(path, "header match requires a name");
        return std::nullopt;
    }

    auto kind = parse_header_match_kind(string_or(j, "kind", "present"));
    if (!kind) {
        errors.add(path + ".kind", "unknown header match kind \"" + string_or(j, "kind") + "\"");
        return std::nullopt;
    }
    header.kind = *kind;
    header.value = string_or(j, "value");
    return header;
}

std::vector<MatchCondition> parse_condition_block(const nlohmann::json& j, const std::string& key,
                                                  const std::string& path, FieldErrors& errors) {
    std::vector<MatchCondition> block;

    for_each_object(j, key, path, errors, [&](const nlohmann::json& entry, const std::string& entry_path) {
        int set = 0;
        for (const char* field : {"prefix", "exact", "regex", "header"}) {
            if (entry.contains(field)) ++set;
        }
        if (set != 1) {
            errors.add(entry_path, "condition must set exactly one of prefix, exact, regex or header");
            return;
        }

        if (auto prefix = get_string(entry, "prefix")) {
            block.emplace_back(PrefixMatch{*prefix});
        } else if (auto exact = get_string(entry, "exact")) {
            block.emplace_back(ExactMatch{*exact});
        } else if (auto regex = get_string(entry, "regex")) {
            block.emplace_back(RegexMatch{*regex});
        } else if (entry.contains("header") && entry["header"].is_object()) {
            if (auto header = parse_header_match(entry["header"], entry_path + ".header", errors)) {
                block.emplace_back(std::move(*header));
            }
        } else {
            errors.add(entry_path, "condition has the wrong type");
        }
    });

    return block;
}

// ============================================================================
// Proxy
// ============================================================================

HeadersPolicySpec parse_headers_policy(const nlohmann::json& j, const std::string& path, FieldErrors& errors) {
    HeadersPolicySpec spec;
    for_each_object(j, "set", path, errors, [&](const nlohmann::json& entry, const std::string&) {
        spec.set.push_back({string_or(entry, "name"), string_or(entry, "value")});
    });
    spec.remove = get_string_array(j, "remove");
    return spec;
}

RouteSpec parse_proxy_route(const nlohmann::json& j, const std::string& path, FieldErrors& errors) {
    RouteSpec route;
    route.conditions = parse_condition_block(j, "conditions", path, errors);

    for_each_object(j, "services", path, errors, [&](const nlohmann::json& s, const std::string& s_path) {
        RouteServiceSpec service;
        service.name = string_or(s, "name");
        if (auto port = get_port(s, "port", s_path, errors)) {
            service.port = *port;
        }
        service.protocol = string_or(s, "protocol");
        if (auto weight = get_weight(s, "weight", s_path, errors)) {
            service.weight = *weight;
        }
        if (service.name.empty()) {
            errors.add(s_path + ".name", "service name is required");
            return;
        }
        route.services.push_back(std::move(service));
    });

    route.permit_insecure = bool_or(j, "permit_insecure", path, errors);
    route.enable_websockets = bool_or(j, "enable_websockets", path, errors);

    if (j.contains("path_rewrite") && j["path_rewrite"].is_object()) {
        for_each_object(j["path_rewrite"], "prefix_replacements", path + ".path_rewrite", errors,
                        [&](const nlohmann::json& r, const std::string&) {
                            route.prefix_replacements.push_back(
                                {string_or(r, "prefix"), string_or(r, "replacement")});
                        });
    }

    if (j.contains("request_headers_policy") && j["request_headers_policy"].is_object()) {
        route.request_headers_policy =
            parse_headers_policy(j["request_headers_policy"], path + ".request_headers_policy", errors);
    }
    if (j.contains("response_headers_policy") && j["response_headers_policy"].is_object()) {
        route.response_headers_policy =
            parse_headers_policy(j["response_headers_policy"], path + ".response_headers_policy", errors);
    }

    if (j.contains("retry_policy") && j["retry_policy"].is_object()) {
        const auto& r = j["retry_policy"];
        RetryPolicySpec retry;
        if (auto count = get_int32(r, "count", path + ".retry_policy", errors)) {
            retry.count = *count;
        }
        retry.per_try_timeout = string_or(r, "per_try_timeout");
        retry.retry_on = get_string_array(r, "retry_on");
        route.retry_policy = std::move(retry);
    }

    if (j.contains("timeout_policy") && j["timeout_policy"].is_object()) {
        const auto& t = j["timeout_policy"];
        TimeoutPolicySpec timeout;
        timeout.response = string_or(t, "response");
        timeout.idle = string_or(t, "idle");
        route.timeout_policy = std::move(timeout);
    }

    if (j.contains("direct_response") && j["direct_response"].is_object()) {
        const auto& d = j["direct_response"];
        DirectResponseSpec direct;
        if (auto code = get_int32(d, "status_code", path + ".direct_response", errors)) {
            direct.status_code = *code;
        }
        direct.body = string_or(d, "body");
        route.direct_response = std::move(direct);
    }

    return route;
}

ProxySpec parse_proxy_spec(const nlohmann::json& j, FieldErrors& errors) {
    ProxySpec proxy;

    if (j.contains("virtualhost")) {
        if (!j["virtualhost"].is_object()) {
            errors.add("spec.virtualhost", "must be an object");
        } else {
            const auto& v = j["virtualhost"];
            VirtualHostSpec vhost;
            vhost.fqdn = string_or(v, "fqdn");
            if (auto port = get_port(v, "port", "spec.virtualhost", errors)) {
                vhost.port = *port;
            }
            if (v.contains("tls") && v["tls"].is_object()) {
                const auto& t = v["tls"];
                TLSSpec tls;
                tls.secret_name = string_or(t, "secret_name");
                tls.minimum_protocol_version = string_or(t, "minimum_protocol_version");
                tls.passthrough = bool_or(t, "passthrough", "spec.virtualhost.tls", errors);
                vhost.tls = std::move(tls);
            }
            proxy.virtualhost = std::move(vhost);
        }
    }

    for_each_object(j, "includes", "spec", errors, [&](const nlohmann::json& inc, const std::string& inc_path) {
        IncludeSpec include;
        include.name = string_or(inc, "name");
        include.ns = string_or(inc, "namespace");
        include.conditions = parse_condition_block(inc, "conditions", inc_path, errors);
        if (include.name.empty()) {
            errors.add(inc_path + ".name", "include name is required");
            return;
        }
        proxy.includes.push_back(std::move(include));
    });

    for_each_object(j, "routes", "spec", errors, [&](const nlohmann::json& r, const std::string& r_path) {
        proxy.routes.push_back(parse_proxy_route(r, r_path, errors));
    });

    return proxy;
}

// ============================================================================
// Flat routes and gateways
// ============================================================================

RouteResourceSpec parse_route_resource_spec(const nlohmann::json& j, FieldErrors& errors) {
    RouteResourceSpec spec;

    for_each_object(j, "parent_refs", "spec", errors, [&](const nlohmann::json& p, const std::string& p_path) {
        ParentRef ref;
        ref.ns = string_or(p, "namespace");
        ref.name = string_or(p, "name");
        ref.section_name = string_or(p, "section_name");
        if (ref.name.empty()) {
            errors.add(p_path + ".name", "parent gateway name is required");
            return;
        }
        spec.parent_refs.push_back(std::move(ref));
    });

    spec.hostnames = get_string_array(j, "hostnames");

    for_each_object(j, "rules", "spec", errors, [&](const nlohmann::json& r, const std::string& r_path) {
        RouteRule rule;

        for_each_object(r, "matches", r_path, errors, [&](const nlohmann::json& m, const std::string& m_path) {
            RouteMatchSpec match;
            if (m.contains("path") && m["path"].is_object()) {
                const auto& p = m["path"];
                std::string type = to_lower(string_or(p, "type", "prefix"));
                std::string value = string_or(p, "value", "/");
                if (type == "exact") {
                    match.path = ExactMatch{value};
                } else if (type == "prefix") {
                    match.path = PrefixMatch{value};
                } else if (type == "regex") {
                    match.path = RegexMatch{value};
                } else {
                    errors.add(m_path + ".path.type", "unknown path match type \"" + type + "\"");
                    return;
                }
            }
            for_each_object(m, "headers", m_path, errors, [&](const nlohmann::json& h, const std::string& h_path) {
                if (auto header = parse_header_match(h, h_path, errors)) {
                    match.headers.push_back(std::move(*header));
                }
            });
            rule.matches.push_back(std::move(match));
        });

        for_each_object(r, "backends", r_path, errors, [&](const nlohmann::json& b, const std::string& b_path) {
            BackendRef backend;
            backend.name = string_or(b, "name");
            backend.ns = string_or(b, "namespace");
            if (auto port = get_port(b, "port", b_path, errors)) {
                backend.port = *port;
            }
            if (auto weight = get_weight(b, "weight", b_path, errors)) {
                backend.weight = *weight;
            }
            if (backend.name.empty()) {
                errors.add(b_path + ".name", "backend name is required");
                return;
            }
            rule.backends.push_back(std::move(backend));
        });

        spec.rules.push_back(std::move(rule));
    });

    return spec;
}

GatewaySpec parse_gateway_spec(const nlohmann::json& j, FieldErrors& errors) {
    GatewaySpec spec;

    for_each_object(j, "listeners", "spec", errors, [&](const nlohmann::json& l, const std::string& l_path) {
        GatewayListenerSpec listener;
        listener.name = string_or(l, "name");

        auto protocol = parse_listener_protocol(string_or(l, "protocol", "HTTP"));
        if (!protocol) {
            errors.add(l_path + ".protocol", "unsupported protocol \"" + string_or(l, "protocol") + "\"");
            return;
        }
        listener.protocol = *protocol;

        if (!l.contains("port")) {
            errors.add(l_path + ".port", "port is required");
            return;
        }
        auto port = get_port(l, "port", l_path, errors);
        if (!port) return;
        listener.port = *port;

        listener.hostname = string_or(l, "hostname");
        if (l.contains("tls") && l["tls"].is_object()) {
            listener.certificate_ref = string_or(l["tls"], "certificate_ref");
        }

        std::string allowed = to_lower(string_or(l, "allowed_routes", "Same"));
        if (allowed == "same") {
            listener.allowed_routes = AllowedRoutes::Same;
        } else if (allowed == "all") {
            listener.allowed_routes = AllowedRoutes::All;
        } else {
            errors.add(l_path + ".allowed_routes", "must be Same or All");
            return;
        }

        spec.listeners.push_back(std::move(listener));
    });

    return spec;
}

// ============================================================================
// Services, secrets, delegations
// ============================================================================

ServiceResourceSpec parse_service_spec(const nlohmann::json& j, FieldErrors& errors) {
    ServiceResourceSpec spec;
    for_each_object(j, "ports", "spec", errors, [&](const nlohmann::json& p, const std::string& p_path) {
        ServicePort port;
        port.name = string_or(p, "name");
        port.protocol = string_or(p, "protocol");
        if (auto number = get_port(p, "port", p_path, errors)) {
            port.port = *number;
        }
        spec.ports.push_back(std::move(port));
    });
    spec.external_name = string_or(j, "external_name");
    return spec;
}

SecretSpec parse_secret_spec(const nlohmann::json& j) {
    SecretSpec spec;
    spec.type = to_lower(string_or(j, "type"));
    if (j.contains("data") && j["data"].is_object()) {
        for (auto& [key, val] : j["data"].items()) {
            if (val.is_string()) {
                spec.data[key] = val.get<std::string>();
            }
        }
    }
    return spec;
}

CertificateDelegationSpec parse_delegation_spec(const nlohmann::json& j, FieldErrors& errors) {
    CertificateDelegationSpec spec;
    for_each_object(j, "delegations", "spec", errors, [&](const nlohmann::json& d, const std::string&) {
        CertificateDelegationEntry entry;
        entry.secret_name = string_or(d, "secret_name");
        entry.target_namespaces = get_string_array(d, "target_namespaces");
        spec.delegations.push_back(std::move(entry));
    });
    return spec;
}

// ============================================================================
// Document
// ============================================================================

DocumentParseResult document_from_json(const nlohmann::json& j, const std::string& source_path) {
    DocumentParseResult result;
    std::string where = source_path.empty() ? "" : source_path + ": ";

    if (!j.is_object()) {
        result.error = where + "document must be an object";
        return result;
    }

    auto kind_str = get_string(j, "kind");
    if (!kind_str) {
        result.error = where + "kind missing";
        return result;
    }
    auto kind = parse_kind(trim(*kind_str));
    if (!kind) {
        result.error = where + "unknown kind \"" + *kind_str + "\"";
        return result;
    }

    Document& doc = result.document;
    doc.key.kind = *kind;

    if (!j.contains("metadata") || !j["metadata"].is_object()) {
        result.error = where + "metadata missing";
        return result;
    }
    const auto& metadata = j["metadata"];
    doc.key.ns = trim(string_or(metadata, "namespace", "default"));
    doc.key.name = trim(string_or(metadata, "name"));
    if (doc.key.name.empty()) {
        result.error = where + "metadata.name missing";
        return result;
    }
    if (doc.key.ns.empty()) {
        doc.key.ns = "default";
    }
    doc.creation_timestamp = trim(string_or(metadata, "creation_timestamp"));

    FieldErrors errors{doc.parse_errors};
    if (auto revision = get_int(metadata, "revision", "metadata", errors)) {
        if (*revision < 0) {
            errors.add("metadata.revision", "must not be negative");
        } else {
            doc.revision = static_cast<uint64_t>(*revision);
        }
    }

    nlohmann::json spec = nlohmann::json::object();
    if (j.contains("spec")) {
        if (j["spec"].is_object()) {
            spec = j["spec"];
        } else {
            errors.add("spec", "must be an object");
        }
    }

    switch (*kind) {
        case Kind::Proxy: doc.spec = parse_proxy_spec(spec, errors); break;
        case Kind::Route: doc.spec = parse_route_resource_spec(spec, errors); break;
        case Kind::Gateway: doc.spec = parse_gateway_spec(spec, errors); break;
        case Kind::Service: doc.spec = parse_service_spec(spec, errors); break;
        case Kind::Secret: doc.spec = parse_secret_spec(spec); break;
        case Kind::CertificateDelegation: doc.spec = parse_delegation_spec(spec, errors); break;
    }

    result.ok = true;
    return result;
}

} // namespace

DocumentParseResult parse_resource_document(const std::string& json_str, const std::string& source_path) {
    DocumentParseResult result;
    try {
        auto j = nlohmann::json::parse(json_str);
        return document_from_json(j, source_path);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

DocumentsParseResult parse_resource_documents(const std::string& json_str, const std::string& source_path) {
    DocumentsParseResult result;
    try {
        auto j = nlohmann::json::parse(json_str);

        if (j.is_object()) {
            auto doc = document_from_json(j, source_path);
            if (!doc.ok) {
                result.error = doc.error;
                return result;
            }
            result.documents.push_back(std::move(doc.document));
            result.ok = true;
            return result;
        }

        if (!j.is_array()) {
            result.error = "JSON must be an object or an array of objects";
            return result;
        }

        std::size_t i = 0;
        for (const auto& elem : j) {
            auto doc = document_from_json(elem, source_path + "[" + std::to_string(i++) + "]");
            if (!doc.ok) {
                result.error = doc.error;
                result.documents.clear();
                return result;
            }
            result.documents.push_back(std::move(doc.document));
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

} // namespace trellis
