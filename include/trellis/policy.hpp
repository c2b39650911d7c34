#pragma once

#include "trellis/resources.hpp"
#include "trellis/status.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trellis {

// ============================================================================
// Durations
// ============================================================================

struct DurationParseResult {
    bool ok = false;
    std::string error;
    bool infinite = false;
    int64_t millis = 0;
};

// "250ms", "1s", "1m30s", "1.5h", or "infinity"/"infinite"
DurationParseResult parse_duration(const std::string& s);

struct TimeoutSetting {
    enum class Mode {
        Default,   // data-plane default
        Disabled,  // no timeout
        Value
    };

    Mode mode = Mode::Default;
    int64_t millis = 0;
};

inline bool operator==(const TimeoutSetting& a, const TimeoutSetting& b) {
    return a.mode == b.mode && a.millis == b.millis;
}

// "default", "disabled" or "<n>ms"
std::string timeout_setting_to_string(const TimeoutSetting& t);

// ============================================================================
// Effective Route Policies
// ============================================================================

struct RetryPolicy {
    uint32_t count = 1;
    TimeoutSetting per_try_timeout;
    std::string retry_on = "5xx";
};

struct TimeoutPolicy {
    TimeoutSetting response;
    TimeoutSetting idle;
};

struct HeadersPolicy {
    std::vector<HeaderValue> set;     // canonical names, declaration order
    std::vector<std::string> remove;  // canonical names, sorted
    std::string host_rewrite;

    bool empty() const { return set.empty() && remove.empty() && host_rewrite.empty(); }
};

// Each builder reports a malformed field as a PolicyWarning on the
// collector and falls back to that field's default.

RetryPolicy build_retry_policy(const RetryPolicySpec& spec, StatusCollector& status);

TimeoutPolicy build_timeout_policy(const std::optional<TimeoutPolicySpec>& spec, StatusCollector& status);

// which is "request" or "response"; only request policies may rewrite Host
HeadersPolicy build_headers_policy(const HeadersPolicySpec& spec, bool allow_host_rewrite,
                                   const std::string& which, StatusCollector& status);

// "1.2" or "1.3"; anything else warns and yields "1.2"
std::string build_tls_min_version(const std::string& version, StatusCollector& status);

// RFC 7230 token
bool is_valid_header_name(const std::string& name);

// "x-request-id" -> "X-Request-Id"
std::string canonical_header_name(const std::string& name);

} // namespace trellis
