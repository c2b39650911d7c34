#include "trellis/listeners.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <tuple>
#include <utility>

namespace trellis {

namespace {

std::string listener_name(ProtocolClass protocol, int external_port) {
    return std::string(protocol_class_to_string(protocol)) + "-" + std::to_string(external_port);
}

std::string describe(const ListenerRequest& r) {
    return kind_to_string(r.source.kind) + std::string(" ") + r.source.to_string();
}

std::string host_label(const std::string& hostname) {
    return hostname.empty() ? "*" : hostname;
}

using Rejections = std::map<std::size_t, RejectedRequest>;

void reject(Rejections& out, std::size_t index, const std::string& reason, const std::string& message) {
    if (out.count(index)) return;
    RejectedRequest r;
    r.request = index;
    r.reason = reason;
    r.message = message;
    out[index] = std::move(r);
}

struct Candidate {
    std::size_t index;
    int internal_port;
};

// Sort request indices oldest source first, request index as tie-break
void sort_by_age(std::vector<std::size_t>& indices, const std::vector<ListenerRequest>& requests) {
    std::stable_sort(indices.begin(), indices.end(), [&](std::size_t a, std::size_t b) {
        if (request_older(requests[a], requests[b])) return true;
        if (request_older(requests[b], requests[a])) return false;
        return a < b;
    });
}

struct RoundResult {
    Rejections rejected;
    std::vector<PlannedListener> listeners;
};

RoundResult plan_round(const std::vector<ListenerRequest>& requests,
                       const std::vector<std::size_t>& candidates) {
    RoundResult round;

    // Port mapping
    std::map<int, std::vector<std::size_t>> by_internal;
    std::map<std::size_t, int> internal_of;
    for (auto i : candidates) {
        auto mapping = map_external_port(requests[i].external_port);
        if (!mapping.ok) {
            reject(round.rejected, i, "InvalidPort", mapping.error);
            continue;
        }
        by_internal[mapping.internal_port].push_back(i);
        internal_of[i] = mapping.internal_port;
    }

    // One (protocol class, external port) per internal port
    std::map<std::pair<ProtocolClass, int>, std::vector<std::size_t>> groups;

    for (auto& [internal, members] : by_internal) {
        using Tenant = std::pair<ProtocolClass, int>;
        std::map<ResourceKey, std::set<Tenant>> tenants_of_source;
        for (auto i : members) {
            tenants_of_source[requests[i].source].insert({requests[i].protocol, requests[i].external_port});
        }

        // A single source asking for two things on one internal port
        std::vector<std::size_t> remaining;
        for (auto i : members) {
            const auto& tenants = tenants_of_source[requests[i].source];
            if (tenants.size() > 1) {
                bool mixed = tenants.begin()->first != tenants.rbegin()->first;
                reject(round.rejected, i, mixed ? "ProtocolConflict" : "PortConflict",
                       describe(requests[i]) + " requests conflicting listeners on internal port " +
                           std::to_string(internal));
            } else {
                remaining.push_back(i);
            }
        }
        if (remaining.empty()) continue;

        sort_by_age(remaining, requests);
        const auto& winner = requests[remaining.front()];
        Tenant owner{winner.protocol, winner.external_port};

        for (auto i : remaining) {
            const auto& r = requests[i];
            if (r.protocol == owner.first && r.external_port == owner.second) {
                groups[owner].push_back(i);
                continue;
            }
            std::string reason = r.protocol != owner.first ? "ProtocolConflict" : "PortConflict";
            reject(round.rejected, i, reason,
                   std::string(protocol_class_to_string(r.protocol)) + " port " +
                       std::to_string(r.external_port) + " maps to internal port " +
                       std::to_string(internal) + " already used by " +
                       protocol_class_to_string(owner.first) + " port " +
                       std::to_string(owner.second) + " of " + describe(winner));
        }
    }

    // Hostname buckets within each group
    for (auto& [key, members] : groups) {
        PlannedListener listener;
        listener.protocol = key.first;
        listener.external_port = key.second;
        listener.internal_port = map_external_port(key.second).internal_port;
        listener.name = listener_name(key.first, key.second);

        std::map<std::string, std::vector<std::size_t>> buckets;
        for (auto i : members) {
            buckets[to_lower(requests[i].hostname)].push_back(i);
        }

        for (auto& [hostname, bucket] : buckets) {
            std::map<ResourceKey, int> per_source;
            for (auto i : bucket) {
                ++per_source[requests[i].source];
            }

            std::vector<std::size_t> contenders;
            for (auto i : bucket) {
                if (per_source[requests[i].source] > 1) {
                    reject(round.rejected, i, "DuplicateVhost",
                           describe(requests[i]) + " declares hostname " + host_label(hostname) +
                               " more than once on " + listener.name);
                } else {
                    contenders.push_back(i);
                }
            }
            if (contenders.empty()) continue;

            sort_by_age(contenders, requests);

            PlannedVirtualHost vhost;
            vhost.hostname = hostname;
            vhost.tls_secret = requests[contenders.front()].tls_secret;

            std::optional<std::size_t> owner;
            for (auto i : contenders) {
                const auto& r = requests[i];

                if (r.owning && owner) {
                    reject(round.rejected, i, "DuplicateVhost",
                           "hostname " + host_label(hostname) + " on " + listener.name +
                               " is already served by " + describe(requests[*owner]));
                    continue;
                }
                if (!vhost.requests.empty() && r.tls_secret != vhost.tls_secret) {
                    reject(round.rejected, i, "TLSConflict",
                           "hostname " + host_label(hostname) + " on " + listener.name +
                               " uses a different TLS secret than " +
                               describe(requests[vhost.requests.front()]));
                    continue;
                }

                vhost.requests.push_back(i);
                if (r.owning) {
                    owner = i;
                }
            }

            listener.virtual_hosts.push_back(std::move(vhost));
        }

        round.listeners.push_back(std::move(listener));
    }

    return round;
}

} // namespace

// ============================================================================
// Port Mapping
// ============================================================================

PortMapping map_external_port(int external_port) {
    PortMapping mapping;
    if (external_port < 1 || external_port > 65535) {
        mapping.error = "port " + std::to_string(external_port) + " is outside 1-65535";
        return mapping;
    }
    mapping.internal_port = external_port < kPrivilegedPortLimit
                                ? external_port + kPrivilegedPortOffset
                                : external_port;
    mapping.ok = true;
    return mapping;
}

bool request_older(const ListenerRequest& a, const ListenerRequest& b) {
    if (timestamp_before(a.source_timestamp, b.source_timestamp)) return true;
    if (timestamp_before(b.source_timestamp, a.source_timestamp)) return false;
    return std::tie(a.source.ns, a.source.name, a.source.kind) <
           std::tie(b.source.ns, b.source.name, b.source.kind);
}

// ============================================================================
// Plan
// ============================================================================

const RejectedRequest* ListenerPlan::rejection(std::size_t request) const {
    for (const auto& r : rejected) {
        if (r.request == request) return &r;
    }
    return nullptr;
}

ListenerPlan plan_listeners(const std::vector<ListenerRequest>& requests) {
    std::set<ResourceKey> excluded;
    Rejections carried;
    RoundResult round;

    // Owning sources that lose part of their requests are withdrawn
    // entirely and the plan is recomputed without them.
    while (true) {
        std::vector<std::size_t> candidates;
        for (std::size_t i = 0; i < requests.size(); ++i) {
            if (!excluded.count(requests[i].source)) {
                candidates.push_back(i);
            }
        }

        round = plan_round(requests, candidates);

        std::map<ResourceKey, std::pair<int, int>> tally;  // rejected, total
        for (auto i : candidates) {
            if (!requests[i].owning) continue;
            auto& t = tally[requests[i].source];
            ++t.second;
            if (round.rejected.count(i)) ++t.first;
        }

        std::set<ResourceKey> partial;
        for (const auto& [source, t] : tally) {
            if (t.first > 0 && t.first < t.second) {
                partial.insert(source);
            }
        }
        if (partial.empty()) break;

        for (auto i : candidates) {
            if (!partial.count(requests[i].source)) continue;
            auto it = round.rejected.find(i);
            if (it != round.rejected.end()) {
                carried[i] = it->second;
            } else {
                reject(carried, i, "ListenerNotServed",
                       "hostname " + host_label(requests[i].hostname) + " on " +
                           listener_name(requests[i].protocol, requests[i].external_port) +
                           " withdrawn because another listener of " + describe(requests[i]) +
                           " was rejected");
            }
        }
        excluded.insert(partial.begin(), partial.end());
    }

    for (auto& [i, r] : carried) {
        round.rejected.emplace(i, r);
    }

    ListenerPlan plan;
    plan.accepted.assign(requests.size(), true);
    for (auto& [i, r] : round.rejected) {
        plan.accepted[i] = false;
        plan.rejected.push_back(r);
    }

    plan.listeners = std::move(round.listeners);
    // Drop listeners left without virtual hosts
    plan.listeners.erase(std::remove_if(plan.listeners.begin(), plan.listeners.end(),
                                        [](const PlannedListener& l) { return l.virtual_hosts.empty(); }),
                         plan.listeners.end());
    std::sort(plan.listeners.begin(), plan.listeners.end(),
              [](const PlannedListener& a, const PlannedListener& b) { return a.name < b.name; });

    spdlog::debug("listener plan: {} requests, {} listeners, {} rejected",
                  requests.size(), plan.listeners.size(), plan.rejected.size());

    return plan;
}

// ============================================================================
// Hostnames
// ============================================================================

bool is_wildcard_hostname(const std::string& hostname) {
    return hostname.size() > 2 && hostname[0] == '*' && hostname[1] == '.';
}

bool is_valid_hostname(const std::string& hostname) {
    if (hostname.empty() || hostname.size() > 253) return false;

    std::string name = is_wildcard_hostname(hostname) ? hostname.substr(2) : hostname;

    std::size_t start = 0;
    while (start <= name.size()) {
        std::size_t dot = name.find('.', start);
        std::size_t end = dot == std::string::npos ? name.size() : dot;
        std::size_t len = end - start;
        if (len == 0 || len > 63) return false;

        for (std::size_t i = start; i < end; ++i) {
            unsigned char c = static_cast<unsigned char>(name[i]);
            if (!std::isalnum(c) && c != '-') return false;
        }
        if (name[start] == '-' || name[end - 1] == '-') return false;

        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return true;
}

bool hostname_matches(const std::string& pattern, const std::string& hostname) {
    std::string p = to_lower(pattern);
    std::string h = to_lower(hostname);

    if (!is_wildcard_hostname(p)) {
        return p == h;
    }

    std::string suffix = p.substr(1);  // ".example.com"
    return h.size() > suffix.size() &&
           h.compare(h.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> intersect_hostnames(const std::string& listener_hostname,
                                             const std::vector<std::string>& route_hostnames) {
    std::string listener = to_lower(listener_hostname);
    if (route_hostnames.empty()) {
        return {listener};
    }

    std::vector<std::string> hosts;
    auto add = [&hosts](const std::string& h) {
        if (std::find(hosts.begin(), hosts.end(), h) == hosts.end()) {
            hosts.push_back(h);
        }
    };

    for (const auto& route_hostname : route_hostnames) {
        std::string h = to_lower(route_hostname);
        if (listener.empty() || h == listener || hostname_matches(listener, h)) {
            add(h);
        } else if (hostname_matches(h, listener)) {
            add(listener);
        }
    }
    return hosts;
}

} // namespace trellis
