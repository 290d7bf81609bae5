#include "Command.hpp"
#include "ErrorHandler.hpp"

namespace ftpsync {

bool Command::failed() const {
    std::lock_guard<std::mutex> lock(m_errorMutex);
    return static_cast<bool>(m_error);
}

std::exception_ptr Command::error() const {
    std::lock_guard<std::mutex> lock(m_errorMutex);
    return m_error;
}

std::string Command::errorMessage() const {
    auto err = error();
    return err ? ErrorHandler::describe(err) : std::string();
}

void Command::setError(std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(m_errorMutex);
    m_error = std::move(error);
}

}  // namespace ftpsync
