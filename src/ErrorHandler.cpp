#include "ErrorHandler.hpp"
#include <algorithm>
#include <cctype>

namespace ftpsync {

thread_local std::string ErrorContext::s_currentContext;

namespace {

constexpr const char* kTooManyConnections = "too many connections";

std::string toLower(const std::string& str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

}  // namespace

bool ErrorHandler::isTooManyConnections(const std::string& message) {
    return toLower(message).find(kTooManyConnections) != std::string::npos;
}

bool ErrorHandler::isTooManyConnections(const std::exception& e) {
    return isTooManyConnections(std::string(e.what()));
}

std::string ErrorHandler::describe(const std::exception_ptr& error) {
    if (!error) {
        return "No error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "Unknown error";
    }
}

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

ConnectionError::ConnectionError(const std::string& message)
    : std::runtime_error(message) {
}

TooManyConnectionsError::TooManyConnectionsError(const std::string& message)
    : ConnectionError(message) {
}

WorkerClosedError::WorkerClosedError()
    : ConnectionError("Worker is shutting down") {
}

TransferError::TransferError(const std::string& message)
    : std::runtime_error(message) {
}

}  // namespace ftpsync
