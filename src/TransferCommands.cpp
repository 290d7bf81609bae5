#include "TransferCommands.hpp"
#include "Connection.hpp"
#include "ErrorHandler.hpp"

namespace ftpsync {

void TransferCommand::setConnection(std::shared_ptr<Connection> connection) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_connection = std::move(connection);
}

std::shared_ptr<Connection> TransferCommand::connection() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connection;
}

std::shared_ptr<Connection> TransferCommand::requireConnection() const {
    auto conn = connection();
    if (!conn) {
        throw TransferError(name() + ": no connection bound");
    }
    return conn;
}

UploadCommand::UploadCommand(std::filesystem::path local, std::string remote)
    : m_local(std::move(local)), m_remote(std::move(remote)) {
}

void UploadCommand::execute() {
    requireConnection()->upload(m_local, m_remote);
}

std::string UploadCommand::name() const {
    return "UploadCommand(" + m_remote + ")";
}

DownloadCommand::DownloadCommand(std::string remote, std::filesystem::path local)
    : m_remote(std::move(remote)), m_local(std::move(local)) {
}

void DownloadCommand::execute() {
    requireConnection()->download(m_remote, m_local);
}

std::string DownloadCommand::name() const {
    return "DownloadCommand(" + m_remote + ")";
}

RemoveCommand::RemoveCommand(std::string remote)
    : m_remote(std::move(remote)) {
}

void RemoveCommand::execute() {
    requireConnection()->remove(m_remote);
}

std::string RemoveCommand::name() const {
    return "RemoveCommand(" + m_remote + ")";
}

}  // namespace ftpsync
