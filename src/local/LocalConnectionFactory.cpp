#include "LocalConnectionFactory.hpp"
#include "ErrorHandler.hpp"
#include "LocalConnection.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>

namespace ftpsync {

LocalConnectionFactory::LocalConnectionFactory()
    : m_state(std::make_shared<State>()) {
}

ConnectionBatch LocalConnectionFactory::operator()(const ConnectionConfig& config,
                                                   const std::optional<std::string>& remotePath,
                                                   bool verbose) {
    std::filesystem::path root(config.remote_root);
    if (remotePath) {
        root /= std::filesystem::path(*remotePath).relative_path();
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        throw ConnectionError("550 Remote root is not a directory: " + root.string());
    }

    size_t sequence;
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (config.max_connections > 0 && m_state->open >= config.max_connections) {
            ++m_state->rejected;
            throw TooManyConnectionsError("421 Too many connections (" +
                                          std::to_string(config.max_connections) +
                                          ") from this IP");
        }
        ++m_state->open;
        sequence = ++m_state->created;
    }

    std::string name = "local#" + std::to_string(sequence);
    if (verbose) {
        spdlog::info("Connected {} to {}", name, root.string());
    } else {
        spdlog::debug("Connected {} to {}", name, root.string());
    }

    auto state = m_state;
    ConnectionBatch batch;
    batch.push_back(std::make_shared<LocalConnection>(root, name, [state]() {
        std::lock_guard<std::mutex> lock(state->mutex);
        --state->open;
    }));
    return batch;
}

size_t LocalConnectionFactory::openCount() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->open;
}

size_t LocalConnectionFactory::createdCount() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->created;
}

size_t LocalConnectionFactory::rejectedCount() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->rejected;
}

}  // namespace ftpsync
