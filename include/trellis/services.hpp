#pragma once

#include "trellis/resource_cache.hpp"
#include "trellis/types.hpp"

#include <string>
#include <utility>

namespace trellis {

// ============================================================================
// Service Resolution
// ============================================================================

struct ServiceRef {
    std::string ns;
    std::string name;
    int port = 0;
    std::string protocol;  // requested upstream protocol, empty = plain HTTP/1
};

struct ServiceResolution {
    bool ok = false;
    std::string reason;  // status reason when !ok
    std::string error;
    std::string protocol;       // effective upstream protocol
    std::string port_name;
    std::string external_name;  // set for external-name services
};

// Looks up a service reference. Failures are reported, never retried.
class ServiceResolver {
public:
    virtual ~ServiceResolver() = default;
    virtual ServiceResolution resolve(const ServiceRef& ref) const = 0;
};

// Resolves against the Service documents of one cache snapshot
class SnapshotServiceResolver : public ServiceResolver {
public:
    explicit SnapshotServiceResolver(const CacheSnapshot& snapshot) : snapshot_(snapshot) {}

    ServiceResolution resolve(const ServiceRef& ref) const override;

private:
    const CacheSnapshot& snapshot_;
};

// h2, h2c and tls
bool is_supported_upstream_protocol(const std::string& protocol);

// ============================================================================
// Secrets
// ============================================================================

enum class SecretUse {
    ServingCertificate,  // tls.crt + tls.key
    CertificateAuthority // ca.crt
};

struct SecretLookupResult {
    bool ok = false;
    std::string reason;  // SecretNotValid | DelegationNotPermitted
    std::string error;
    ResourceKey key;
};

// "[namespace/]name" -> (namespace, name), defaulting the namespace
std::pair<std::string, std::string> split_namespaced_name(const std::string& ref,
                                                          const std::string& default_ns);

// Find a secret referenced from from_ns, check its shape, and require a
// CertificateDelegation when it lives in another namespace.
SecretLookupResult lookup_secret(const CacheSnapshot& snapshot, const std::string& ref,
                                 const std::string& from_ns, SecretUse use);

// True if the secret may be used from target_ns
bool delegation_permitted(const CacheSnapshot& snapshot, const ResourceKey& secret,
                          const std::string& target_ns);

} // namespace trellis
