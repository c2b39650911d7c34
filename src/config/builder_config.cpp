#include "trellis/builder_config.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include <nlohmann/json.hpp>

namespace trellis {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

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

// Integer field within [min, max]; otherwise warn and keep the default
void read_int(const nlohmann::json& j, const std::string& key, int min, int max,
              int& target, const std::string& path, std::vector<std::string>& warnings) {
    if (!j.contains(key)) return;
    const auto& v = j[key];
    if (!v.is_number_integer()) {
        warnings.push_back("invalid_configuration:" + path + ":not_an_integer");
        return;
    }
    auto value = v.get<long long>();
    if (value < min || value > max) {
        warnings.push_back("invalid_configuration:" + path + ":out_of_range");
        return;
    }
    target = static_cast<int>(value);
}

} // namespace

bool BuilderConfig::root_namespace_allowed(const std::string& ns) const {
    if (root_namespaces.empty()) return true;
    return std::find(root_namespaces.begin(), root_namespaces.end(), ns) != root_namespaces.end();
}

BuilderConfig get_default_builder_config() {
    BuilderConfig config;
    config.schema = kBuilderConfigSchema;
    return config;
}

BuilderConfigParseResult parse_builder_config(const std::string& json_str,
                                              const std::string& source_path) {
    BuilderConfigParseResult result;
    result.config = get_default_builder_config();
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != kBuilderConfigSchema) {
            result.error = std::string("$schema mismatch: expected ") + kBuilderConfigSchema;
            return result;
        }

        if (auto ordering = get_string(j, "route_ordering")) {
            auto parsed = parse_route_ordering(trim(*ordering));
            if (parsed) {
                result.config.route_ordering = *parsed;
            } else {
                result.warnings.push_back("invalid_configuration:invalid_route_ordering");
            }
        }

        // "listeners" section
        if (j.contains("listeners") && j["listeners"].is_object()) {
            const auto& listeners = j["listeners"];
            read_int(listeners, "http_port", 1, 65535, result.config.http_port,
                     "listeners.http_port", result.warnings);
            read_int(listeners, "https_port", 1, 65535, result.config.https_port,
                     "listeners.https_port", result.warnings);
            if (result.config.http_port == result.config.https_port) {
                result.warnings.push_back("invalid_configuration:listeners:ports_equal");
                result.config.http_port = 80;
                result.config.https_port = 443;
            }
        }

        result.config.root_namespaces = get_string_array(j, "root_namespaces");

        if (j.contains("disable_permit_insecure")) {
            if (j["disable_permit_insecure"].is_boolean()) {
                result.config.disable_permit_insecure = j["disable_permit_insecure"].get<bool>();
            } else {
                result.warnings.push_back("invalid_configuration:disable_permit_insecure:not_a_boolean");
            }
        }

        // "holdoff" section
        if (j.contains("holdoff") && j["holdoff"].is_object()) {
            const auto& holdoff = j["holdoff"];
            read_int(holdoff, "delay_ms", 0, 60000, result.config.holdoff_delay_ms,
                     "holdoff.delay_ms", result.warnings);
            read_int(holdoff, "max_delay_ms", 0, 600000, result.config.holdoff_max_delay_ms,
                     "holdoff.max_delay_ms", result.warnings);
            if (result.config.holdoff_max_delay_ms < result.config.holdoff_delay_ms) {
                result.warnings.push_back("invalid_configuration:holdoff:max_below_delay");
                result.config.holdoff_max_delay_ms = result.config.holdoff_delay_ms;
            }
        }

        // "retry" section
        if (j.contains("retry") && j["retry"].is_object()) {
            const auto& retry = j["retry"];
            read_int(retry, "initial_backoff_ms", 1, 600000, result.config.retry_initial_backoff_ms,
                     "retry.initial_backoff_ms", result.warnings);
            read_int(retry, "max_backoff_ms", 1, 3600000, result.config.retry_max_backoff_ms,
                     "retry.max_backoff_ms", result.warnings);
            if (result.config.retry_max_backoff_ms < result.config.retry_initial_backoff_ms) {
                result.warnings.push_back("invalid_configuration:retry:max_below_initial");
                result.config.retry_max_backoff_ms = result.config.retry_initial_backoff_ms;
            }
        }

        // "conditions" section
        if (j.contains("conditions") && j["conditions"].is_object()) {
            for (auto& [key, val] : j["conditions"].items()) {
                if (val.is_string()) {
                    std::string key_str = to_lower(key);
                    auto action = parse_policy_action(val.get<std::string>());
                    if (action) {
                        result.config.condition_policy[key_str] = *action;
                    } else {
                        result.warnings.push_back("invalid_configuration:invalid_condition_action:" + key_str);
                    }
                }
            }
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
