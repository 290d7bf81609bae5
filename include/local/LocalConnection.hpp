#pragma once

/**
 * @file LocalConnection.hpp
 * @brief Transfer session whose remote side is a directory on the local filesystem.
 *
 * Used by the command-line tool and the tests to drive the Worker without a
 * network stack. Uploads and downloads are file copies relative to the
 * configured remote root.
 */

#include "Connection.hpp"
#include <atomic>
#include <filesystem>
#include <functional>
#include <string>

namespace ftpsync {

/**
 * @class LocalConnection
 * @brief Connection backed by a local directory.
 *
 * Remote paths are interpreted relative to the root directory; a leading
 * '/' is ignored and '..' components are rejected so a command cannot
 * escape the root.
 *
 * Thread Safety:
 * - Not thread-safe; the Worker lends a connection to one command at a time.
 * - close() may be called from any thread and is idempotent.
 */
class LocalConnection : public Connection {
public:
    /**
     * @brief Construct an open session.
     * @param root Directory acting as the remote root.
     * @param name Display name for tracing.
     * @param onClose Invoked once when the session is closed or destroyed.
     */
    LocalConnection(std::filesystem::path root,
                    std::string name,
                    std::function<void()> onClose = {});

    /**
     * @brief Destructor - closes the session if still open.
     */
    ~LocalConnection() override;

    void close() override;
    bool isClosed() const override { return m_closed.load(); }

    /**
     * @brief Copy a local file to root/remote, creating parent directories.
     * @throws TransferError if the connection is closed or the copy fails.
     */
    void upload(const std::filesystem::path& local, const std::string& remote) override;

    /**
     * @brief Copy root/remote to a local path, creating parent directories.
     * @throws TransferError if the connection is closed or the copy fails.
     */
    void download(const std::string& remote, const std::filesystem::path& local) override;

    /**
     * @brief Delete root/remote.
     * @throws TransferError if the connection is closed or the file does not exist.
     */
    void remove(const std::string& remote) override;

    std::string name() const override { return m_name; }

    const std::filesystem::path& root() const { return m_root; }

    /**
     * @brief Map a remote path onto the local root.
     * @throws TransferError for paths leaving the root.
     */
    std::filesystem::path resolve(const std::string& remote) const;

private:
    void ensureOpen() const;

    std::filesystem::path m_root;
    std::string m_name;
    std::function<void()> m_onClose;
    std::atomic<bool> m_closed{false};
};

}  // namespace ftpsync
