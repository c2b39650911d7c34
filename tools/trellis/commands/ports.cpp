/**
 * trellis CLI - ports command
 *
 * Print how requested external ports map onto internal listener ports.
 */

#include "../common.hpp"

#include <trellis/listeners.hpp>

#include <CLI/CLI.hpp>

namespace trellis::cli::commands {

namespace {

struct PortsOptions {
    std::vector<int> ports;
};

int cmd_ports(const GlobalOptions& opts, const PortsOptions& ports_opts) {
    setup_logging(opts);

    bool failed = false;
    nlohmann::json mappings = nlohmann::json::array();

    for (int port : ports_opts.ports) {
        auto mapping = map_external_port(port);
        if (opts.json) {
            nlohmann::json m;
            m["external"] = port;
            if (mapping.ok) {
                m["internal"] = mapping.internal_port;
            } else {
                m["error"] = mapping.error;
            }
            mappings.push_back(std::move(m));
        } else if (mapping.ok) {
            std::cout << port << " -> " << mapping.internal_port << std::endl;
        } else {
            std::cerr << "Error: " << mapping.error << std::endl;
        }
        failed = failed || !mapping.ok;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = !failed;
        j["ports"] = std::move(mappings);
        std::cout << j.dump(2) << std::endl;
    }
    return failed ? 1 : 0;
}

} // anonymous namespace

void setup_ports(CLI::App* app, GlobalOptions& opts) {
    static PortsOptions ports_opts;

    app->add_option("ports", ports_opts.ports, "External ports")->required();

    app->callback([&opts]() {
        std::exit(cmd_ports(opts, ports_opts));
    });
}

} // namespace trellis::cli::commands
