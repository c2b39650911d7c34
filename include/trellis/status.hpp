#pragma once

#include "trellis/types.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace trellis {

using ConditionPolicy = std::unordered_map<std::string, PolicyAction>;

// ============================================================================
// Status Collector
// ============================================================================

// Collects the conditions found for one source document during a build.
// Warnings go through the condition policy (keyed by lower-case reason):
// "ignore" drops them, "error" upgrades them. Errors are never downgraded.
class StatusCollector {
public:
    StatusCollector() = default;

    explicit StatusCollector(const ConditionPolicy* policy) : policy_(policy) {}

    void add_error(ConditionType type, const std::string& reason, const std::string& message);
    void add_warning(ConditionType type, const std::string& reason, const std::string& message);

    void set_vhost(const std::string& fqdn) { vhost_ = fqdn; }
    const std::string& vhost() const { return vhost_; }

    // After policy application
    bool has_errors() const;
    bool has_warnings() const;

    // Effective conditions in insertion order, duplicates removed,
    // ignored warnings excluded
    std::vector<StatusCondition> conditions() const;

    void clear();

private:
    struct Collected {
        StatusCondition condition;
        PolicyAction action;
    };

    PolicyAction effective_action(const std::string& reason) const;

    const ConditionPolicy* policy_ = nullptr;
    std::vector<Collected> collected_;
    std::string vhost_;
};

// ============================================================================
// Status Cache
// ============================================================================

// One collector per tracked source document for a single build.
class StatusCache {
public:
    explicit StatusCache(ConditionPolicy policy = {});

    // Collectors point at policy_
    StatusCache(const StatusCache&) = delete;
    StatusCache& operator=(const StatusCache&) = delete;
    StatusCache(StatusCache&&) = delete;
    StatusCache& operator=(StatusCache&&) = delete;

    // Register a document. Orphanable documents are reported orphaned
    // unless marked reachable.
    void track(const ResourceKey& key, bool orphanable);

    void mark_reachable(const ResourceKey& key);

    // Collector for a document, tracking it if needed
    StatusCollector& accessor(const ResourceKey& key);

    bool has_errors(const ResourceKey& key) const;

    // One record per tracked document, sorted by key
    std::vector<StatusRecord> records() const;

private:
    struct Entry {
        StatusCollector collector;
        bool orphanable = false;
        bool reachable = false;
    };

    ConditionPolicy policy_;
    std::map<ResourceKey, Entry> entries_;
};

// Verdict of a finished record: invalid if any error, else orphaned if
// unreachable, else valid-with-warnings if any warning, else valid
Verdict compute_verdict(const std::vector<StatusCondition>& conditions, bool orphaned);

// Deterministic JSON array of records
std::string serialize_status_json(const std::vector<StatusRecord>& records);

} // namespace trellis
