#include "trellis/status.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace trellis {

// ============================================================================
// StatusCollector
// ============================================================================

void StatusCollector::add_error(ConditionType type, const std::string& reason, const std::string& message) {
    Collected c;
    c.condition.severity = Severity::Error;
    c.condition.type = type;
    c.condition.reason = reason;
    c.condition.message = message;
    c.action = PolicyAction::Error;
    collected_.push_back(std::move(c));
}

void StatusCollector::add_warning(ConditionType type, const std::string& reason, const std::string& message) {
    Collected c;
    c.condition.severity = Severity::Warning;
    c.condition.type = type;
    c.condition.reason = reason;
    c.condition.message = message;
    c.action = effective_action(reason);
    collected_.push_back(std::move(c));
}

PolicyAction StatusCollector::effective_action(const std::string& reason) const {
    if (policy_) {
        auto it = policy_->find(to_lower(reason));
        if (it != policy_->end()) {
            return it->second;
        }
    }
    return PolicyAction::Warn;
}

bool StatusCollector::has_errors() const {
    for (const auto& c : collected_) {
        if (c.action == PolicyAction::Error) {
            return true;
        }
    }
    return false;
}

bool StatusCollector::has_warnings() const {
    for (const auto& c : collected_) {
        if (c.action == PolicyAction::Warn) {
            return true;
        }
    }
    return false;
}

std::vector<StatusCondition> StatusCollector::conditions() const {
    std::vector<StatusCondition> result;

    for (const auto& c : collected_) {
        if (c.action == PolicyAction::Ignore) {
            continue;
        }

        StatusCondition cond = c.condition;
        if (c.action == PolicyAction::Error) {
            cond.severity = Severity::Error;
        }

        if (std::find(result.begin(), result.end(), cond) == result.end()) {
            result.push_back(std::move(cond));
        }
    }

    return result;
}

void StatusCollector::clear() {
    collected_.clear();
    vhost_.clear();
}

// ============================================================================
// StatusCache
// ============================================================================

StatusCache::StatusCache(ConditionPolicy policy) {
    for (auto& [reason, action] : policy) {
        policy_[to_lower(reason)] = action;
    }
}

void StatusCache::track(const ResourceKey& key, bool orphanable) {
    accessor(key);
    entries_[key].orphanable = orphanable;
}

void StatusCache::mark_reachable(const ResourceKey& key) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.reachable = true;
    }
}

StatusCollector& StatusCache::accessor(const ResourceKey& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        Entry entry;
        entry.collector = StatusCollector(&policy_);
        it = entries_.emplace(key, std::move(entry)).first;
    }
    return it->second.collector;
}

bool StatusCache::has_errors(const ResourceKey& key) const {
    auto it = entries_.find(key);
    return it != entries_.end() && it->second.collector.has_errors();
}

std::vector<StatusRecord> StatusCache::records() const {
    std::vector<StatusRecord> records;
    records.reserve(entries_.size());

    for (const auto& [key, entry] : entries_) {
        StatusRecord record;
        record.key = key;
        record.vhost = entry.collector.vhost();
        record.conditions = entry.collector.conditions();

        bool orphaned = entry.orphanable && !entry.reachable;
        record.verdict = compute_verdict(record.conditions, orphaned);

        if (record.verdict == Verdict::Orphaned) {
            StatusCondition cond;
            cond.severity = Severity::Warning;
            cond.type = ConditionType::OrphanedError;
            cond.reason = "Orphaned";
            cond.message = "this proxy is not part of a delegation chain from a root proxy";
            record.conditions.push_back(std::move(cond));
        }

        records.push_back(std::move(record));
    }

    return records;
}

Verdict compute_verdict(const std::vector<StatusCondition>& conditions, bool orphaned) {
    bool warnings = false;
    for (const auto& c : conditions) {
        if (c.severity == Severity::Error) return Verdict::Invalid;
        warnings = true;
    }
    if (orphaned) return Verdict::Orphaned;
    if (warnings) return Verdict::ValidWithWarnings;
    return Verdict::Valid;
}

std::string serialize_status_json(const std::vector<StatusRecord>& records) {
    nlohmann::ordered_json j = nlohmann::ordered_json::array();

    for (const auto& r : records) {
        nlohmann::ordered_json rec;
        rec["kind"] = kind_to_string(r.key.kind);
        rec["namespace"] = r.key.ns;
        rec["name"] = r.key.name;
        rec["verdict"] = verdict_to_string(r.verdict);
        if (!r.vhost.empty()) {
            rec["vhost"] = r.vhost;
        }

        nlohmann::ordered_json conds = nlohmann::ordered_json::array();
        for (const auto& c : r.conditions) {
            nlohmann::ordered_json cj;
            cj["severity"] = severity_to_string(c.severity);
            cj["type"] = condition_type_to_string(c.type);
            cj["reason"] = c.reason;
            cj["message"] = c.message;
            conds.push_back(std::move(cj));
        }
        rec["conditions"] = std::move(conds);

        j.push_back(std::move(rec));
    }

    return j.dump(2);
}

} // namespace trellis
