#include "trellis/services.hpp"

#include <algorithm>

namespace trellis {

namespace {

bool has_value(const SecretSpec& spec, const std::string& key) {
    auto it = spec.data.find(key);
    return it != spec.data.end() && !it->second.empty();
}

} // namespace

bool is_supported_upstream_protocol(const std::string& protocol) {
    return protocol == "h2" || protocol == "h2c" || protocol == "tls";
}

// ============================================================================
// SnapshotServiceResolver
// ============================================================================

ServiceResolution SnapshotServiceResolver::resolve(const ServiceRef& ref) const {
    ServiceResolution result;
    std::string label = ref.ns + "/" + ref.name;

    if (ref.port < 1 || ref.port > 65535) {
        result.reason = "ServicePortInvalid";
        result.error = "service " + label + ": port " + std::to_string(ref.port) + " is outside 1-65535";
        return result;
    }

    if (!ref.protocol.empty() && !is_supported_upstream_protocol(ref.protocol)) {
        result.reason = "UnsupportedProtocol";
        result.error = "service " + label + ": unsupported protocol " + ref.protocol;
        return result;
    }

    const Document* doc = snapshot_.find(Kind::Service, ref.ns, ref.name);
    if (!doc || !doc->service()) {
        result.reason = "ServiceUnresolvedReference";
        result.error = "service " + label + " not found";
        return result;
    }
    const auto& svc = *doc->service();

    const ServicePort* match = nullptr;
    for (const auto& p : svc.ports) {
        if (p.port == ref.port) {
            match = &p;
            break;
        }
    }
    if (!match) {
        result.reason = "ServiceUnresolvedReference";
        result.error = "service " + label + " has no port " + std::to_string(ref.port);
        return result;
    }

    std::string protocol = ref.protocol.empty() ? match->protocol : ref.protocol;
    if (!ref.protocol.empty() && !match->protocol.empty() && ref.protocol != match->protocol) {
        result.reason = "UnsupportedProtocol";
        result.error = "service " + label + " port " + std::to_string(ref.port) + " speaks " +
                       match->protocol + ", not " + ref.protocol;
        return result;
    }
    if (!protocol.empty() && !is_supported_upstream_protocol(protocol)) {
        result.reason = "UnsupportedProtocol";
        result.error = "service " + label + ": unsupported protocol " + protocol;
        return result;
    }

    result.protocol = protocol;
    result.port_name = match->name;
    result.external_name = svc.external_name;
    result.ok = true;
    return result;
}

// ============================================================================
// Secrets
// ============================================================================

std::pair<std::string, std::string> split_namespaced_name(const std::string& ref,
                                                          const std::string& default_ns) {
    auto slash = ref.find('/');
    if (slash == std::string::npos) {
        return {default_ns, ref};
    }
    return {ref.substr(0, slash), ref.substr(slash + 1)};
}

bool delegation_permitted(const CacheSnapshot& snapshot, const ResourceKey& secret,
                          const std::string& target_ns) {
    if (secret.ns == target_ns) {
        return true;
    }

    for (const auto* doc : snapshot.of_kind(Kind::CertificateDelegation)) {
        if (doc->key.ns != secret.ns || !doc->delegation()) continue;

        for (const auto& d : doc->delegation()->delegations) {
            if (d.secret_name != secret.name) continue;
            const auto& targets = d.target_namespaces;
            if (std::find(targets.begin(), targets.end(), "*") != targets.end() ||
                std::find(targets.begin(), targets.end(), target_ns) != targets.end()) {
                return true;
            }
        }
    }
    return false;
}

SecretLookupResult lookup_secret(const CacheSnapshot& snapshot, const std::string& ref,
                                 const std::string& from_ns, SecretUse use) {
    SecretLookupResult result;

    auto [ns, name] = split_namespaced_name(ref, from_ns);
    result.key.kind = Kind::Secret;
    result.key.ns = ns;
    result.key.name = name;

    if (ns.empty() || name.empty()) {
        result.reason = "SecretNotValid";
        result.error = "Secret \"" + ref + "\" is not a valid reference";
        return result;
    }

    const Document* doc = snapshot.find(result.key);
    if (!doc || !doc->secret()) {
        result.reason = "SecretNotValid";
        result.error = "Secret \"" + ref + "\" is invalid: not found";
        return result;
    }

    const auto& spec = *doc->secret();
    std::string type = to_lower(spec.type);
    if (use == SecretUse::ServingCertificate && type == "ca") {
        result.reason = "SecretNotValid";
        result.error = "Secret \"" + ref + "\" is invalid: type ca cannot be used as a serving certificate";
        return result;
    }
    if (use == SecretUse::CertificateAuthority && type == "tls") {
        result.reason = "SecretNotValid";
        result.error = "Secret \"" + ref + "\" is invalid: type tls cannot be used as a certificate authority";
        return result;
    }

    if (use == SecretUse::ServingCertificate) {
        if (!has_value(spec, "tls.crt") || !has_value(spec, "tls.key")) {
            result.reason = "SecretNotValid";
            result.error = "Secret \"" + ref + "\" is invalid: missing tls.crt or tls.key";
            return result;
        }
    } else if (!has_value(spec, "ca.crt")) {
        result.reason = "SecretNotValid";
        result.error = "Secret \"" + ref + "\" is invalid: missing ca.crt";
        return result;
    }

    if (!delegation_permitted(snapshot, result.key, from_ns)) {
        result.reason = "DelegationNotPermitted";
        result.error = "Secret \"" + ref + "\" certificate delegation not permitted";
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace trellis
