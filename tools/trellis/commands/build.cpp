/**
 * trellis CLI - build and status commands
 *
 * Compile a set of documents into a routing graph once and report the
 * graph and the per-document status records.
 */

#include "../common.hpp"

#include <trellis/builder.hpp>
#include <trellis/resource_cache.hpp>

#include <CLI/CLI.hpp>

namespace trellis::cli::commands {

namespace {

struct BuildOptions {
    std::vector<std::string> inputs;
    bool strict = false;
};

void print_route(const Route& route) {
    std::cout << "      " << route.condition.render() << " -> ";
    if (route.https_upgrade) {
        std::cout << "https upgrade";
    } else if (route.direct_response) {
        std::cout << "direct " << route.direct_response->status_code;
    } else {
        for (std::size_t i = 0; i < route.clusters.size(); ++i) {
            if (i > 0) std::cout << ", ";
            std::cout << route.clusters[i].cluster;
            if (route.clusters.size() > 1) std::cout << " (" << route.clusters[i].weight << ")";
        }
    }
    std::cout << "  [" << route.source.to_string() << "]" << std::endl;
}

void print_graph(const Graph& graph) {
    std::cout << "Graph (revision " << graph.source_revision << ")" << std::endl;
    for (const auto& listener : graph.listeners) {
        std::cout << "  Listener " << listener.name << " (internal port " << listener.internal_port
                  << ")" << std::endl;
        for (const auto& vhost : listener.virtual_hosts) {
            std::cout << "    VirtualHost " << vhost.hostname;
            if (vhost.tls_secret) {
                std::cout << " tls=" << *vhost.tls_secret << " min=" << vhost.min_tls_version;
            }
            std::cout << std::endl;
            for (const auto& route : vhost.routes) {
                print_route(route);
            }
        }
    }
    if (!graph.clusters.empty()) {
        std::cout << "  Clusters" << std::endl;
        for (const auto& cluster : graph.clusters) {
            std::cout << "    " << cluster.name << std::endl;
        }
    }
}

void print_statuses(const std::vector<StatusRecord>& records) {
    std::cout << "Status" << std::endl;
    for (const auto& record : records) {
        std::cout << "  " << kind_to_string(record.key.kind) << " " << record.key.to_string() << ": "
                  << verdict_to_string(record.verdict) << std::endl;
        for (const auto& c : record.conditions) {
            std::cout << "    " << severity_to_string(c.severity) << " " << condition_type_to_string(c.type)
                      << "/" << c.reason << ": " << c.message << std::endl;
        }
    }
}

int cmd_build(const GlobalOptions& opts, const BuildOptions& build_opts, bool graph_output) {
    setup_logging(opts);

    BuilderConfig config;
    std::string error;
    if (!load_builder_config(opts, config, error)) {
        print_error(error, opts.json);
        return 1;
    }

    std::vector<Document> documents;
    if (!load_documents(build_opts.inputs, documents, error)) {
        print_error(error, opts.json);
        return 1;
    }

    ResourceCache cache;
    cache.replace_all(std::move(documents));

    Builder builder(std::move(config));
    auto result = builder.build(*cache.snapshot());

    bool any_invalid = std::any_of(result.statuses.begin(), result.statuses.end(),
                                   [](const StatusRecord& r) { return r.verdict == Verdict::Invalid; });

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = !(build_opts.strict && any_invalid);
        if (graph_output) {
            j["graph"] = nlohmann::json::parse(serialize_graph_json(*result.graph));
        }
        j["status"] = nlohmann::json::parse(serialize_status_json(result.statuses));
        std::cout << j.dump(2) << std::endl;
    } else {
        if (graph_output) {
            print_graph(*result.graph);
        }
        print_statuses(result.statuses);
    }

    if (build_opts.strict && any_invalid) {
        return 2;
    }
    return 0;
}

void add_build_options(CLI::App* app, BuildOptions& build_opts) {
    app->add_option("inputs", build_opts.inputs, "Document files or directories")->required();
    app->add_flag("--strict", build_opts.strict, "Exit with 2 if any document is invalid");
}

} // anonymous namespace

void setup_build(CLI::App* app, GlobalOptions& opts) {
    static BuildOptions build_opts;
    add_build_options(app, build_opts);

    app->callback([&opts]() {
        std::exit(cmd_build(opts, build_opts, true));
    });
}

void setup_status(CLI::App* app, GlobalOptions& opts) {
    static BuildOptions status_opts;
    add_build_options(app, status_opts);

    app->callback([&opts]() {
        std::exit(cmd_build(opts, status_opts, false));
    });
}

} // namespace trellis::cli::commands
