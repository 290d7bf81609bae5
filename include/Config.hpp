#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ftpsync {

struct WorkerOptions;

// One server profile as read from the configuration file
using RawConfig = std::map<std::string, std::string>;

struct ConnectionConfig {
    std::string host;
    uint16_t port = 21;
    std::string user;
    std::string password;
    std::string remote_root = "/";

    bool passive = true;
    bool use_tls = false;

    std::chrono::seconds timeout{30};

    // Sessions the remote end accepts at once, 0 for no limit
    size_t max_connections = 0;

    // Map a raw profile into a connection configuration
    static ConnectionConfig fromRaw(const RawConfig& raw);
};

struct WorkerConfig {
    size_t limit = 2;
    bool debug = false;

    std::chrono::milliseconds poll_interval{500};
    std::chrono::milliseconds retry_interval{100};
    std::chrono::milliseconds backoff{1500};

    WorkerOptions options() const;
};

struct Config {
    WorkerConfig worker;
    std::map<std::string, RawConfig> servers;

    std::string server;   // selected profile
    std::string log_file;
    bool download = false;
    bool remove = false;
    std::string target = ".";   // local directory for downloads
    std::vector<std::string> paths;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;

    // Profile selected by --server, or the only profile present
    const RawConfig* selectedServer() const;
};

}  // namespace ftpsync
