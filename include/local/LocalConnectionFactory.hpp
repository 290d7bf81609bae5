#pragma once

#include "Connection.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ftpsync {

// Opens LocalConnection sessions and enforces the server-side session limit
// (ConnectionConfig::max_connections). Copies share their counters, so one
// factory can be handed to a Worker as a ConnectionFactory and inspected later.
class LocalConnectionFactory {
public:
    LocalConnectionFactory();

    // Open one session rooted at config.remote_root (joined with remotePath if given).
    // Throws TooManyConnectionsError at the session limit, ConnectionError if the
    // root is not a directory.
    ConnectionBatch operator()(const ConnectionConfig& config,
                               const std::optional<std::string>& remotePath,
                               bool verbose);

    // Sessions currently open
    size_t openCount() const;

    // Sessions opened over the factory's lifetime
    size_t createdCount() const;

    // Rejected because of the session limit
    size_t rejectedCount() const;

private:
    struct State {
        std::mutex mutex;
        size_t open = 0;
        size_t created = 0;
        size_t rejected = 0;
    };

    std::shared_ptr<State> m_state;
};

}  // namespace ftpsync
