#include "Config.hpp"
#include "LocalConnectionFactory.hpp"
#include "TransferCommands.hpp"
#include "Worker.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <vector>

using namespace ftpsync;

namespace {

void setupLogging(bool debug, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
        sinks.push_back(console_sink);

        if (!logFile.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
                file_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logFile << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("ftpsync", sinks.begin(), sinks.end());
        logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

std::shared_ptr<Command> makeCommand(const Config& config, const std::string& path) {
    namespace fs = std::filesystem;

    if (config.remove) {
        return std::make_shared<RemoveCommand>(path);
    }
    if (config.download) {
        return std::make_shared<DownloadCommand>(
            path, fs::path(config.target) / fs::path(path).filename());
    }
    return std::make_shared<UploadCommand>(path, fs::path(path).filename().string());
}

}  // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-V" || arg == "--version") {
            std::cout << "ftpsync-worker version " << FTPSYNC_VERSION << std::endl;
            return 0;
        }
    }

    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    setupLogging(config.worker.debug, config.log_file);

    if (!config.validate()) {
        return 1;
    }

    const RawConfig profile = *config.selectedServer();

    std::vector<std::shared_ptr<Command>> commands;
    try {
        LocalConnectionFactory factory;
        Worker worker(config.worker.limit, factory, ConnectionConfig::fromRaw,
                      config.worker.options());
        if (config.worker.debug) {
            worker.enableDebug();
        }

        spdlog::info("Running {} transfers with {} connections",
                     config.paths.size(), worker.limit());

        for (const auto& path : config.paths) {
            auto command = makeCommand(config, path);
            commands.push_back(command);
            try {
                worker.addCommand(command, profile);
            } catch (const std::exception& e) {
                spdlog::error("Could not start {}: {}", command->name(), e.what());
            }
        }

        worker.waitUntilEmpty();

        spdlog::info("Opened {} connections ({} refused by the server)",
                     factory.createdCount(), factory.rejectedCount());
    } catch (const std::exception& e) {
        spdlog::error("Worker failed: {}", e.what());
        return 1;
    }

    size_t failed = 0;
    for (const auto& command : commands) {
        if (command->failed()) {
            spdlog::error("{} failed: {}", command->name(), command->errorMessage());
            ++failed;
        }
    }

    spdlog::info("{} of {} transfers succeeded", commands.size() - failed, commands.size());
    return failed == 0 ? 0 : 1;
}
