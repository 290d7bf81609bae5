#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>

namespace ftpsync {

Config Config::parseArgs(int argc, char* argv[]) {
    Config config;

    CLI::App app{"ftpsync-worker - Run transfers over a bounded pool of connections"};

    // Worker options
    size_t jobs = 0;
    app.add_option("-j,--jobs", jobs, "Maximum concurrent transfers and connections");
    bool debug = false;
    app.add_flag("-d,--debug", debug, "Enable debug tracing");
    app.add_option("--log-file", config.log_file, "Also write the log to this file");

    // Server selection
    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");
    app.add_option("-s,--server", config.server, "Server profile to use");

    std::string remote_root;
    app.add_option("--remote-root", remote_root,
                   "Use a local directory as the remote side (profile 'local')");
    size_t max_connections = 0;
    app.add_option("--max-connections", max_connections,
                   "Session limit of the --remote-root server (0 for none)");

    // Transfer mode
    app.add_flag("--download", config.download, "Download the given remote paths");
    app.add_flag("--remove", config.remove, "Delete the given remote paths");
    app.add_option("-t,--target", config.target, "Local directory for downloads")
        ->default_val(".");

    app.add_option("paths", config.paths, "Files to transfer")->required();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    // Load config file if specified
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            config.worker = file_config->worker;
            config.servers = file_config->servers;
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    if (!remote_root.empty()) {
        RawConfig& local = config.servers["local"];
        local["host"] = "localhost";
        local["path"] = remote_root;
        if (max_connections > 0) {
            local["max_connections"] = std::to_string(max_connections);
        }
        if (config.server.empty()) {
            config.server = "local";
        }
    }

    // Command line overrides file config
    if (jobs > 0) {
        config.worker.limit = jobs;
    }
    if (debug) {
        config.worker.debug = true;
    }

    return config;
}

}  // namespace ftpsync
