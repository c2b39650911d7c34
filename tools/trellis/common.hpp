/**
 * trellis CLI - Common utilities and types
 */

#pragma once

#include <trellis/builder_config.hpp>
#include <trellis/resource_json.hpp>
#include <trellis/resources.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace trellis::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

inline void setup_logging(const GlobalOptions& opts) {
    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * Load the builder configuration named by --config, or the built-in
 * default when none is given. Parse warnings are logged.
 */
inline bool load_builder_config(const GlobalOptions& opts, BuilderConfig& config, std::string& error) {
    if (opts.config.empty()) {
        config = get_default_builder_config();
        return true;
    }

    auto content = read_file(opts.config);
    if (!content) {
        error = "cannot read config file: " + opts.config;
        return false;
    }

    auto parsed = parse_builder_config(*content, opts.config);
    if (!parsed.ok) {
        error = opts.config + ": " + parsed.error;
        return false;
    }
    for (const auto& warning : parsed.warnings) {
        spdlog::warn("{}: {}", opts.config, warning);
    }

    config = std::move(parsed.config);
    return true;
}

/**
 * Load documents from files and directories. Directories contribute their
 * *.json files (not recursive) in name order.
 */
inline bool load_documents(const std::vector<std::string>& inputs, std::vector<Document>& documents,
                           std::string& error) {
    namespace fs = std::filesystem;

    std::vector<std::string> files;
    for (const auto& input : inputs) {
        std::error_code ec;
        if (fs::is_directory(input, ec)) {
            std::vector<std::string> found;
            for (const auto& entry : fs::directory_iterator(input, ec)) {
                if (entry.is_regular_file() && entry.path().extension() == ".json") {
                    found.push_back(entry.path().string());
                }
            }
            if (ec) {
                error = "cannot list directory " + input + ": " + ec.message();
                return false;
            }
            std::sort(found.begin(), found.end());
            files.insert(files.end(), found.begin(), found.end());
        } else {
            files.push_back(input);
        }
    }

    for (const auto& path : files) {
        auto content = read_file(path);
        if (!content) {
            error = "cannot read " + path;
            return false;
        }
        auto parsed = parse_resource_documents(*content, path);
        if (!parsed.ok) {
            error = parsed.error;
            return false;
        }
        spdlog::debug("loaded {} documents from {}", parsed.documents.size(), path);
        for (auto& doc : parsed.documents) {
            documents.push_back(std::move(doc));
        }
    }

    return true;
}

} // namespace trellis::cli
