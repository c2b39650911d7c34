#include "trellis/policy.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>

namespace trellis {

namespace {

const std::set<std::string>& known_retry_on() {
    static const std::set<std::string> values = {
        "5xx", "gateway-error", "reset", "connect-failure", "retriable-4xx",
        "refused-stream", "retriable-status-codes", "retriable-headers",
        "cancelled", "deadline-exceeded", "internal", "resource-exhausted", "unavailable",
    };
    return values;
}

bool is_tchar(unsigned char c) {
    if (std::isalnum(c)) return true;
    static const std::string extra = "!#$%&'*+-.^_`|~";
    return extra.find(static_cast<char>(c)) != std::string::npos;
}

TimeoutSetting parse_timeout_field(const std::string& value, const std::string& field,
                                   StatusCollector& status) {
    TimeoutSetting setting;
    if (value.empty()) {
        return setting;
    }

    auto parsed = parse_duration(value);
    if (!parsed.ok) {
        status.add_warning(ConditionType::PolicyWarning, "TimeoutPolicyNotValid",
                           field + " timeout \"" + value + "\" is invalid (" + parsed.error +
                               "), using the default");
        return setting;
    }

    if (parsed.infinite) {
        setting.mode = TimeoutSetting::Mode::Disabled;
    } else {
        setting.mode = TimeoutSetting::Mode::Value;
        setting.millis = parsed.millis;
    }
    return setting;
}

} // namespace

// ============================================================================
// Durations
// ============================================================================

DurationParseResult parse_duration(const std::string& s) {
    DurationParseResult result;

    std::string lower = to_lower(s);
    if (lower == "infinity" || lower == "infinite") {
        result.ok = true;
        result.infinite = true;
        return result;
    }
    if (lower.empty()) {
        result.error = "empty duration";
        return result;
    }

    double total = 0.0;
    std::size_t i = 0;
    while (i < lower.size()) {
        std::size_t start = i;
        while (i < lower.size() && (std::isdigit(static_cast<unsigned char>(lower[i])) || lower[i] == '.')) {
            ++i;
        }
        if (start == i) {
            result.error = "expected a number at \"" + lower.substr(start) + "\"";
            return result;
        }

        std::string number = lower.substr(start, i - start);
        if (std::count(number.begin(), number.end(), '.') > 1 || number == ".") {
            result.error = "bad number \"" + number + "\"";
            return result;
        }

        double amount = 0.0;
        try {
            amount = std::stod(lower.substr(start, i - start));
        } catch (const std::exception&) {
            result.error = "bad number \"" + lower.substr(start, i - start) + "\"";
            return result;
        }

        std::size_t unit_start = i;
        while (i < lower.size() && std::isalpha(static_cast<unsigned char>(lower[i]))) {
            ++i;
        }
        std::string unit = lower.substr(unit_start, i - unit_start);

        if (unit == "h") total += amount * 3600000.0;
        else if (unit == "m") total += amount * 60000.0;
        else if (unit == "s") total += amount * 1000.0;
        else if (unit == "ms") total += amount;
        else {
            result.error = unit.empty() ? "missing unit" : "unknown unit \"" + unit + "\"";
            return result;
        }
    }

    result.millis = static_cast<int64_t>(std::llround(total));
    result.ok = true;
    return result;
}

std::string timeout_setting_to_string(const TimeoutSetting& t) {
    switch (t.mode) {
        case TimeoutSetting::Mode::Default: return "default";
        case TimeoutSetting::Mode::Disabled: return "disabled";
        case TimeoutSetting::Mode::Value: return std::to_string(t.millis) + "ms";
    }
    return "default";
}

// ============================================================================
// Retry / Timeout
// ============================================================================

RetryPolicy build_retry_policy(const RetryPolicySpec& spec, StatusCollector& status) {
    RetryPolicy policy;

    if (spec.count < 0) {
        status.add_warning(ConditionType::PolicyWarning, "RetryPolicyNotValid",
                           "retry count " + std::to_string(spec.count) + " is negative, using 1");
    } else {
        policy.count = std::max<uint32_t>(1, static_cast<uint32_t>(spec.count));
    }

    if (!spec.per_try_timeout.empty()) {
        auto parsed = parse_duration(spec.per_try_timeout);
        if (!parsed.ok || parsed.infinite) {
            status.add_warning(ConditionType::PolicyWarning, "RetryPolicyNotValid",
                               "per-try timeout \"" + spec.per_try_timeout +
                                   "\" is invalid, using the default");
        } else {
            policy.per_try_timeout.mode = TimeoutSetting::Mode::Value;
            policy.per_try_timeout.millis = parsed.millis;
        }
    }

    std::string retry_on;
    for (const auto& value : spec.retry_on) {
        if (!known_retry_on().count(value)) {
            status.add_warning(ConditionType::PolicyWarning, "RetryPolicyNotValid",
                               "unknown retry condition \"" + value + "\" ignored");
            continue;
        }
        if (!retry_on.empty()) retry_on += ",";
        retry_on += value;
    }
    if (!retry_on.empty()) {
        policy.retry_on = retry_on;
    }

    return policy;
}

TimeoutPolicy build_timeout_policy(const std::optional<TimeoutPolicySpec>& spec, StatusCollector& status) {
    TimeoutPolicy policy;
    if (!spec) {
        return policy;
    }
    policy.response = parse_timeout_field(spec->response, "response", status);
    policy.idle = parse_timeout_field(spec->idle, "idle", status);
    return policy;
}

// ============================================================================
// Headers
// ============================================================================

bool is_valid_header_name(const std::string& name) {
    if (name.empty()) return false;
    for (char c : name) {
        if (!is_tchar(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string canonical_header_name(const std::string& name) {
    std::string out = name;
    bool upper = true;
    for (auto& c : out) {
        unsigned char u = static_cast<unsigned char>(c);
        c = static_cast<char>(upper ? std::toupper(u) : std::tolower(u));
        upper = (c == '-');
    }
    return out;
}

HeadersPolicy build_headers_policy(const HeadersPolicySpec& spec, bool allow_host_rewrite,
                                   const std::string& which, StatusCollector& status) {
    HeadersPolicy policy;

    auto warn = [&](const std::string& message) {
        status.add_warning(ConditionType::PolicyWarning, "HeadersPolicyNotValid",
                           which + " headers policy: " + message);
    };

    std::set<std::string> seen_set;
    for (const auto& entry : spec.set) {
        std::string key = canonical_header_name(entry.name);
        if (!is_valid_header_name(key)) {
            warn("invalid set header \"" + entry.name + "\" ignored");
            continue;
        }
        if (!seen_set.insert(key).second) {
            warn("duplicate header addition \"" + key + "\" ignored");
            continue;
        }
        if (key == "Host") {
            if (!allow_host_rewrite) {
                warn("rewriting the Host header is not supported");
                continue;
            }
            policy.host_rewrite = entry.value;
            continue;
        }
        policy.set.push_back({key, entry.value});
    }

    std::set<std::string> removed;
    for (const auto& entry : spec.remove) {
        std::string key = canonical_header_name(entry);
        if (!is_valid_header_name(key)) {
            warn("invalid remove header \"" + entry + "\" ignored");
            continue;
        }
        if (!removed.insert(key).second) {
            warn("duplicate header removal \"" + key + "\" ignored");
        }
    }
    policy.remove.assign(removed.begin(), removed.end());

    return policy;
}

std::string build_tls_min_version(const std::string& version, StatusCollector& status) {
    if (version.empty() || version == "1.2") return "1.2";
    if (version == "1.3") return "1.3";

    status.add_warning(ConditionType::TLSError, "TLSVersionNotValid",
                       "minimum protocol version \"" + version + "\" is invalid, using 1.2");
    return "1.2";
}

} // namespace trellis
