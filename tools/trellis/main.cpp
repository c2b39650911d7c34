/**
 * trellis CLI - Entry Point
 *
 * Compiles routing documents into a listener/virtual host/route graph.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace trellis::cli::commands {
    void setup_build(CLI::App* app, GlobalOptions& opts);
    void setup_status(CLI::App* app, GlobalOptions& opts);
    void setup_ports(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace trellis::cli;

    CLI::App app{"trellis - routing configuration graph builder"};
    app.set_version_flag("-V,--version", TRELLIS_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Builder configuration file");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    auto* build_cmd = app.add_subcommand("build", "Build the routing graph from documents");
    commands::setup_build(build_cmd, opts);

    auto* status_cmd = app.add_subcommand("status", "Print the status of every document");
    commands::setup_status(status_cmd, opts);

    auto* ports_cmd = app.add_subcommand("ports", "Show external to internal port mapping");
    commands::setup_ports(ports_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
