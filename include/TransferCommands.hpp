#pragma once

#include "Command.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace ftpsync {

class Connection;

// Base for commands that run synchronously on their bound connection
class TransferCommand : public Command {
public:
    bool isRunning() const override { return false; }
    void setConnection(std::shared_ptr<Connection> connection) override;

    std::shared_ptr<Connection> connection() const;

protected:
    // Bound connection; throws TransferError if none
    std::shared_ptr<Connection> requireConnection() const;

private:
    mutable std::mutex m_mutex;
    std::shared_ptr<Connection> m_connection;
};

class UploadCommand : public TransferCommand {
public:
    UploadCommand(std::filesystem::path local, std::string remote);

    void execute() override;
    std::string name() const override;

private:
    std::filesystem::path m_local;
    std::string m_remote;
};

class DownloadCommand : public TransferCommand {
public:
    DownloadCommand(std::string remote, std::filesystem::path local);

    void execute() override;
    std::string name() const override;

private:
    std::string m_remote;
    std::filesystem::path m_local;
};

class RemoveCommand : public TransferCommand {
public:
    explicit RemoveCommand(std::string remote);

    void execute() override;
    std::string name() const override;

private:
    std::string m_remote;
};

}  // namespace ftpsync
