#pragma once

#include "trellis/route_sorter.hpp"
#include "trellis/status.hpp"

#include <string>
#include <vector>

namespace trellis {

constexpr const char* kBuilderConfigSchema = "trellis.builder.config.v1";

// ============================================================================
// Builder Configuration
// ============================================================================

struct BuilderConfig {
    std::string schema = kBuilderConfigSchema;
    std::string source_path;

    RouteOrdering route_ordering = RouteOrdering::Specificity;

    // Ports requested by root proxies that do not name one
    int http_port = 80;
    int https_port = 443;

    // Namespaces allowed to hold root proxies, empty = any
    std::vector<std::string> root_namespaces;

    // Ignore permit_insecure on routes (always upgrade to HTTPS)
    bool disable_permit_insecure = false;

    // Rebuild debounce
    int holdoff_delay_ms = 100;
    int holdoff_max_delay_ms = 500;

    // Backoff for store and sink failures
    int retry_initial_backoff_ms = 100;
    int retry_max_backoff_ms = 5000;

    // Per-reason treatment of warnings, keys lower-case
    ConditionPolicy condition_policy;

    bool root_namespace_allowed(const std::string& ns) const;
};

BuilderConfig get_default_builder_config();

struct BuilderConfigParseResult {
    bool ok = false;
    std::string error;
    BuilderConfig config;
    std::vector<std::string> warnings;
};

// Parse a configuration file's JSON text. Malformed optional values fall
// back to their defaults with a warning; a missing or wrong $schema fails.
BuilderConfigParseResult parse_builder_config(const std::string& json_str,
                                              const std::string& source_path = "");

} // namespace trellis
