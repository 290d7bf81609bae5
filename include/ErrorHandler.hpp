#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace ftpsync {

// Classification helpers for transfer and connection failures
class ErrorHandler {
public:
    // Check if a failure message reports a server-side connection limit
    static bool isTooManyConnections(const std::string& message);
    static bool isTooManyConnections(const std::exception& e);

    // Get human-readable message from a captured exception
    static std::string describe(const std::exception_ptr& error);
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    ErrorContext(const std::string& context);
    ~ErrorContext();

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

// Failure to open or use a connection
class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& message);
};

// Remote end refused a new session because of its connection limit
class TooManyConnectionsError : public ConnectionError {
public:
    explicit TooManyConnectionsError(const std::string& message);
};

// Dispatch attempted on a worker that is shutting down
class WorkerClosedError : public ConnectionError {
public:
    WorkerClosedError();
};

// Failure while executing a transfer command
class TransferError : public std::runtime_error {
public:
    explicit TransferError(const std::string& message);
};

}  // namespace ftpsync
