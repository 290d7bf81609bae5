#pragma once

/**
 * @file CommandExecutor.hpp
 * @brief Runs a single command on its own thread with one retry.
 */

#include "Command.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace ftpsync {

/**
 * @class CommandExecutor
 * @brief Executes one command to completion and reports back.
 *
 * The executor calls Command::execute(); if it throws, the failure is traced
 * and execute() is called exactly once more. A failure of the retry is
 * recorded on the command with Command::setError(). In every case the
 * executor then polls Command::isRunning() until it returns false and
 * invokes the finish callback exactly once.
 *
 * Thread Safety:
 * - The finish callback runs on the executor thread and may run
 *   concurrently with callbacks of other executors.
 */
class CommandExecutor {
public:
    using FinishCallback = std::function<void(const std::shared_ptr<Command>&)>;

    /**
     * @brief Create an executor; the thread is not started yet.
     * @param command Command to run.
     * @param onFinish Invoked once after the command stopped running.
     * @param debug Emit trace messages.
     * @param id Identity used to tag trace messages.
     * @param pollInterval Delay between isRunning() polls.
     */
    CommandExecutor(std::shared_ptr<Command> command,
                    FinishCallback onFinish,
                    bool debug,
                    uint64_t id,
                    std::chrono::milliseconds pollInterval = std::chrono::milliseconds(500));

    /**
     * @brief Joins the thread, or detaches it when destroyed from the
     * executor thread itself.
     */
    ~CommandExecutor();

    CommandExecutor(const CommandExecutor&) = delete;
    CommandExecutor& operator=(const CommandExecutor&) = delete;

    // Launch the executor thread
    void start();

    // Wait for the executor thread to exit
    void join();

    // True once the thread body has returned
    bool finished() const { return m_finished.load(); }

    uint64_t id() const { return m_id; }
    const std::shared_ptr<Command>& command() const { return m_command; }

    /**
     * @brief Execute, retry once, finalize. Runs on the calling thread.
     *
     * Exposed so tests can drive the lifecycle without a thread.
     */
    void run();

private:
    void trace(const std::string& message) const;
    void finalize();

    std::shared_ptr<Command> m_command;
    FinishCallback m_onFinish;
    bool m_debug;
    uint64_t m_id;
    std::chrono::milliseconds m_pollInterval;

    std::thread m_thread;
    std::atomic<bool> m_finished{false};
};

}  // namespace ftpsync
