#include "LocalConnection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

namespace ftpsync {

namespace fs = std::filesystem;

namespace {

void copyFile(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    if (!fs::is_regular_file(from, ec)) {
        throw TransferError("550 No such file: " + from.string());
    }

    if (to.has_parent_path()) {
        fs::create_directories(to.parent_path(), ec);
        if (ec) {
            throw TransferError("553 Cannot create directory " +
                                to.parent_path().string() + ": " + ec.message());
        }
    }

    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw TransferError("451 Transfer of " + from.string() + " failed: " + ec.message());
    }
}

}  // namespace

LocalConnection::LocalConnection(fs::path root,
                                 std::string name,
                                 std::function<void()> onClose)
    : m_root(std::move(root))
    , m_name(std::move(name))
    , m_onClose(std::move(onClose)) {
}

LocalConnection::~LocalConnection() {
    close();
}

void LocalConnection::close() {
    if (m_closed.exchange(true)) {
        return;
    }
    if (m_onClose) {
        m_onClose();
    }
    spdlog::debug("Closed local connection {}", m_name);
}

void LocalConnection::ensureOpen() const {
    if (m_closed) {
        throw TransferError("Connection " + m_name + " is closed");
    }
}

fs::path LocalConnection::resolve(const std::string& remote) const {
    fs::path relative = fs::path(remote).relative_path();
    if (relative.empty()) {
        throw TransferError("Empty remote path");
    }
    for (const auto& part : relative) {
        if (part == "..") {
            throw TransferError("Remote path leaves the root: " + remote);
        }
    }
    return m_root / relative;
}

void LocalConnection::upload(const fs::path& local, const std::string& remote) {
    ensureOpen();
    copyFile(local, resolve(remote));
}

void LocalConnection::download(const std::string& remote, const fs::path& local) {
    ensureOpen();
    copyFile(resolve(remote), local);
}

void LocalConnection::remove(const std::string& remote) {
    ensureOpen();

    fs::path target = resolve(remote);
    std::error_code ec;
    if (!fs::remove(target, ec)) {
        throw TransferError("550 Cannot remove " + remote +
                            (ec ? ": " + ec.message() : ": no such file"));
    }
}

}  // namespace ftpsync
