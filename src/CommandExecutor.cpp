#include "CommandExecutor.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace ftpsync {

CommandExecutor::CommandExecutor(std::shared_ptr<Command> command,
                                 FinishCallback onFinish,
                                 bool debug,
                                 uint64_t id,
                                 std::chrono::milliseconds pollInterval)
    : m_command(std::move(command))
    , m_onFinish(std::move(onFinish))
    , m_debug(debug)
    , m_id(id)
    , m_pollInterval(pollInterval) {
}

CommandExecutor::~CommandExecutor() {
    if (!m_thread.joinable()) {
        return;
    }
    if (m_thread.get_id() == std::this_thread::get_id()) {
        m_thread.detach();
    } else {
        m_thread.join();
    }
}

void CommandExecutor::start() {
    m_thread = std::thread([this]() { run(); });
}

void CommandExecutor::join() {
    if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
        m_thread.join();
    }
}

void CommandExecutor::trace(const std::string& message) const {
    if (m_debug) {
        spdlog::debug("[command {}] {}", m_id, message);
    }
}

void CommandExecutor::run() {
    ErrorContext context("command " + std::to_string(m_id));

    try {
        trace("Executing");
        m_command->execute();
    } catch (...) {
        trace(ErrorHandler::describe(std::current_exception()));
        trace("Retrying");

        try {
            m_command->execute();
        } catch (...) {
            m_command->setError(std::current_exception());
            spdlog::error("[{}] {} failed after retry: {}",
                          ErrorContext::current(), m_command->name(),
                          m_command->errorMessage());
        }
    }

    finalize();

    // Nothing below may touch the executor; the owner reaps it once set
    m_finished = true;
}

void CommandExecutor::finalize() {
    trace("Ending");
    while (m_command->isRunning()) {
        trace("Is running...");
        std::this_thread::sleep_for(m_pollInterval);
    }

    try {
        m_onFinish(m_command);
    } catch (const std::exception& e) {
        spdlog::error("[{}] Finish handler for {} failed: {}",
                      ErrorContext::current(), m_command->name(), e.what());
    } catch (...) {
        spdlog::error("[{}] Finish handler for {} failed: {}",
                      ErrorContext::current(), m_command->name(),
                      ErrorHandler::describe(std::current_exception()));
    }
}

}  // namespace ftpsync
