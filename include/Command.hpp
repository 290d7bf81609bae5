#pragma once

#include <exception>
#include <memory>
#include <mutex>
#include <string>

namespace ftpsync {

class Connection;

// Unit of work executed on a borrowed connection.
// Commands are identified by address; the Worker never copies them.
class Command {
public:
    virtual ~Command() = default;

    // Non-copyable
    Command(const Command&) = delete;
    Command& operator=(const Command&) = delete;

    // Run the command; throws on failure
    virtual void execute() = 0;

    // Poll for asynchronous completion after execute() returned
    virtual bool isRunning() const = 0;

    // Bind the connection used by the next execute()
    virtual void setConnection(std::shared_ptr<Connection> connection) = 0;

    // Stable display name for tracing
    virtual std::string name() const = 0;

    // Failure that survived the retry, if any
    bool failed() const;
    std::exception_ptr error() const;
    std::string errorMessage() const;

    void setError(std::exception_ptr error);

protected:
    Command() = default;

private:
    mutable std::mutex m_errorMutex;
    std::exception_ptr m_error;
};

}  // namespace ftpsync
