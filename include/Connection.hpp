#pragma once

/**
 * @file Connection.hpp
 * @brief Abstract remote session and the capabilities that create them.
 */

#include "Config.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ftpsync {

/**
 * @class Connection
 * @brief A live session to a remote endpoint.
 *
 * Connections are owned by the Worker and lent to one Command at a time.
 * Implementations do not need to be thread-safe; the Worker never binds
 * the same connection to two running commands.
 */
class Connection {
public:
    virtual ~Connection() = default;

    // Non-copyable, non-movable
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * @brief Close the session.
     * @throws ConnectionError if the remote end could not be notified.
     */
    virtual void close() = 0;

    /**
     * @brief Check if close() has been called.
     */
    virtual bool isClosed() const = 0;

    /**
     * @brief Store a local file at a path relative to the remote root.
     * @throws TransferError on failure.
     */
    virtual void upload(const std::filesystem::path& local, const std::string& remote) = 0;

    /**
     * @brief Fetch a remote file into a local path.
     * @throws TransferError on failure.
     */
    virtual void download(const std::string& remote, const std::filesystem::path& local) = 0;

    /**
     * @brief Delete a remote file.
     * @throws TransferError on failure.
     */
    virtual void remove(const std::string& remote) = 0;

    // Display name for tracing
    virtual std::string name() const = 0;

protected:
    Connection() = default;
};

using ConnectionBatch = std::vector<std::shared_ptr<Connection>>;

// Opens zero or more connections for a loaded configuration.
// Throws on failure; a message containing "too many connections" is recoverable.
using ConnectionFactory = std::function<ConnectionBatch(
    const ConnectionConfig& config,
    const std::optional<std::string>& remotePath,
    bool verbose)>;

// Maps a raw server profile into the shape the factory expects
using ConfigLoader = std::function<ConnectionConfig(const RawConfig& raw)>;

}  // namespace ftpsync
