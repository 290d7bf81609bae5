#include "Config.hpp"
#include "Worker.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace ftpsync {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

unsigned long parseNumber(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        unsigned long result = std::stoul(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid numeric value for '" + key + "': " + value);
    }
}

std::string lookup(const RawConfig& raw, const std::string& key, const std::string& fallback = "") {
    auto it = raw.find(key);
    return it == raw.end() ? fallback : it->second;
}

constexpr const char* kServerSection = "server ";
constexpr size_t kServerSectionLength = 7;

}  // namespace

ConnectionConfig ConnectionConfig::fromRaw(const RawConfig& raw) {
    ConnectionConfig config;

    config.host = lookup(raw, "host");
    config.user = lookup(raw, "user");
    config.password = lookup(raw, "password");
    config.remote_root = lookup(raw, "path", config.remote_root);

    if (raw.count("port")) {
        unsigned long port = parseNumber("port", raw.at("port"));
        if (port == 0 || port > 65535) {
            throw std::invalid_argument("Port out of range: " + raw.at("port"));
        }
        config.port = static_cast<uint16_t>(port);
    }
    if (raw.count("passive")) config.passive = parseBool(raw.at("passive"));
    if (raw.count("tls")) config.use_tls = parseBool(raw.at("tls"));
    if (raw.count("timeout"))
        config.timeout = std::chrono::seconds(parseNumber("timeout", raw.at("timeout")));
    if (raw.count("max_connections"))
        config.max_connections = parseNumber("max_connections", raw.at("max_connections"));

    // Password from environment if not set
    if (config.password.empty()) {
        const char* env_pwd = std::getenv("FTPSYNC_PASSWORD");
        if (env_pwd) {
            config.password = env_pwd;
        }
    }

    return config;
}

WorkerOptions WorkerConfig::options() const {
    WorkerOptions opts;
    opts.commandPollInterval = poll_interval;
    opts.connectionRetryInterval = retry_interval;
    opts.tooManyConnectionsBackoff = backoff;
    return opts;
}

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            if (current_section.rfind(kServerSection, 0) == 0) {
                config.servers[trim(current_section.substr(kServerSectionLength))];
            }
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (current_section == "worker") {
            if (key == "limit")
                config.worker.limit = parseNumber(key, value);
            else if (key == "debug")
                config.worker.debug = parseBool(value);
            else if (key == "poll_interval_ms")
                config.worker.poll_interval = std::chrono::milliseconds(parseNumber(key, value));
            else if (key == "retry_interval_ms")
                config.worker.retry_interval = std::chrono::milliseconds(parseNumber(key, value));
            else if (key == "backoff_ms")
                config.worker.backoff = std::chrono::milliseconds(parseNumber(key, value));
        }
        else if (current_section.rfind(kServerSection, 0) == 0) {
            config.servers[trim(current_section.substr(kServerSectionLength))][key] = value;
        }
    }

    return config;
}

const RawConfig* Config::selectedServer() const {
    if (server.empty()) {
        if (servers.size() == 1) {
            return &servers.begin()->second;
        }
        return nullptr;
    }

    auto it = servers.find(server);
    return it == servers.end() ? nullptr : &it->second;
}

bool Config::validate() const {
    if (worker.limit == 0) {
        spdlog::error("Worker limit must be at least 1");
        return false;
    }

    const RawConfig* profile = selectedServer();
    if (!profile) {
        if (server.empty()) {
            spdlog::error("No server profile selected (use -s option)");
        } else {
            spdlog::error("Unknown server profile: {}", server);
        }
        return false;
    }

    if (lookup(*profile, "host").empty()) {
        spdlog::error("Server profile has no host");
        return false;
    }

    if (download && remove) {
        spdlog::error("--download and --remove are mutually exclusive");
        return false;
    }

    if (paths.empty()) {
        spdlog::error("No paths given");
        return false;
    }

    return true;
}

}  // namespace ftpsync
