#pragma once

/**
 * @file Worker.hpp
 * @brief Bounded pool of transfer connections that schedules commands onto them.
 *
 * The Worker owns a limited set of reusable connections. Commands submitted
 * while fewer than `limit` commands run are dispatched at once; the rest wait
 * in a queue and are woken one at a time as running commands finish.
 */

#include "Command.hpp"
#include "CommandExecutor.hpp"
#include "Config.hpp"
#include "Connection.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <vector>

namespace ftpsync {

struct WorkerOptions {
    // Delay between Command::isRunning() polls
    std::chrono::milliseconds commandPollInterval{500};

    // How long a dispatch waits for a freed slot before trying to open a connection again
    std::chrono::milliseconds connectionRetryInterval{100};

    // Sleep after the remote end reported too many connections
    std::chrono::milliseconds tooManyConnectionsBackoff{1500};
};

/**
 * @class Worker
 * @brief Thread-safe scheduler of commands onto a bounded connection pool.
 *
 * Key features:
 * - At most `limit` commands execute at once; commands being dispatched
 *   count towards the limit
 * - Connections are opened lazily through the factory, never more than
 *   `limit` of them
 * - A factory failure mentioning "too many connections" is retried after
 *   a backoff; any other failure is fatal for that dispatch
 * - Commands admitted at the limit are queued and woken in LIFO order,
 *   one per finished command
 * - Each command runs on its own CommandExecutor thread with one retry
 *
 * Connection slots are 1-based indices into the connection list. A slot is
 * either bound to exactly one running command or in the free set.
 *
 * Command and Connection methods are never called with the pool lock
 * held, so implementations may call back into the Worker.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - addCommand() may block the caller until a connection is free
 * - The destructor waits for running commands; queued commands are dropped
 */
class Worker {
public:
    /**
     * @brief Create an empty worker.
     * @param limit Maximum number of concurrently running commands and live connections.
     * @param factory Opens connections for a loaded configuration.
     * @param loader Maps raw server profiles to the configuration the factory expects.
     * @param options Polling and backoff intervals.
     * @throws std::invalid_argument if limit is 0.
     */
    Worker(size_t limit,
           ConnectionFactory factory,
           ConfigLoader loader = ConnectionConfig::fromRaw,
           WorkerOptions options = {});

    /**
     * @brief Stop waking queued commands, wait for running ones, then close
     * all connections.
     */
    ~Worker();

    // Non-copyable, non-movable
    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Enables debug tracing
    void enableDebug();

    // Disables debug tracing
    void disableDebug();

    bool debugEnabled() const { return m_debug.load(); }

    // Sets the callback used for opening connections
    void setConnectionFactory(ConnectionFactory factory);

    /**
     * @brief Add externally opened connections to the pool.
     * @param connections Batch to append; every connection becomes a free slot.
     */
    void addConnection(ConnectionBatch connections);

    /**
     * @brief Open connections through the factory if below the limit.
     * @param config Raw server profile passed through the config loader.
     * @throws Whatever the factory or loader throws, except "too many
     * connections" failures which are absorbed after a backoff.
     */
    void fillConnection(const RawConfig& config);

    /**
     * @brief Submit a command.
     * @param command Command to run; compared by identity.
     * @param config Raw server profile used to open a connection for it.
     * @throws WorkerClosedError if the worker is shutting down.
     * @throws The fatal factory error if dispatch failed; the finish handler
     * has already run for the command and the error is recorded on it.
     *
     * At the limit the command is queued and the call returns immediately.
     * Otherwise the command is bound to a connection and started before
     * the call returns, which may block until a connection is free.
     */
    void addCommand(std::shared_ptr<Command> command, const RawConfig& config);

    // True when no command is running, being dispatched or queued
    bool isEmpty() const;

    // Block until isEmpty()
    void waitUntilEmpty();

    // Block until isEmpty() or timeout; returns isEmpty()
    bool waitUntilEmpty(std::chrono::milliseconds timeout);

    /**
     * @brief Close every connection ever added to the pool.
     *
     * Best effort: failures are logged and skipped, already closed
     * connections are left alone. Must not be called while commands run.
     */
    void closeConnections();

    // ----- Statistics -----

    size_t limit() const { return m_limit; }
    size_t connectionCount() const;
    size_t freeConnectionCount() const;
    size_t runningCount() const;
    size_t queuedCount() const;

    // Executors that finished but whose threads are not joined yet
    size_t retiredCount() const;

private:
    struct PendingExecution {
        std::shared_ptr<Command> command;
        RawConfig config;
        size_t index;
        uint64_t executorId;
        std::unique_ptr<CommandExecutor> executor;
    };

    struct WaitingCommand {
        std::shared_ptr<Command> command;
        RawConfig config;
    };

    // Counting gate bounding concurrent connection provisioning
    class GateGuard {
    public:
        explicit GateGuard(Worker& worker);
        ~GateGuard();

    private:
        Worker& m_worker;
    };

    // Keeps a dispatch counted as running until it is recorded or failed
    class DispatchGuard {
    public:
        explicit DispatchGuard(Worker& worker) : m_worker(worker) {}
        ~DispatchGuard();

    private:
        Worker& m_worker;
    };

    /**
     * @brief Bind a connection to the command and start its executor.
     *
     * The caller must have counted the command in m_dispatching.
     */
    void run(const std::shared_ptr<Command>& command, const RawConfig& config);

    /**
     * @brief Finish callback: free the command's slot and wake one queued command.
     */
    void onFinish(const std::shared_ptr<Command>& command);

    // Join executors whose threads have returned
    void reapExecutors();

    void appendConnections(ConnectionBatch connections);
    bool emptyLocked() const;

    const size_t m_limit;
    ConnectionFactory m_makeConnection;
    ConfigLoader m_makeConfig;
    const WorkerOptions m_options;
    std::atomic<bool> m_debug{false};

    std::vector<std::shared_ptr<Connection>> m_connections;  ///< Every connection ever added
    std::vector<size_t> m_freeConnections;                    ///< Free 1-based slot indices
    std::list<PendingExecution> m_commands;                   ///< Running commands
    std::vector<WaitingCommand> m_waitingCommands;            ///< Queued commands
    std::vector<std::unique_ptr<CommandExecutor>> m_retired;  ///< Finished, not yet joined

    size_t m_dispatching = 0;    ///< Admitted commands not yet recorded
    size_t m_provisioning = 0;   ///< Holders of the gate
    size_t m_creating = 0;       ///< Factory calls in flight
    uint64_t m_executorId = 0;
    bool m_closing = false;

    mutable std::mutex m_mutex;      ///< Protects all state above
    std::condition_variable m_cv;    ///< Signaled on freed slots, finished commands, gate release
};

}  // namespace ftpsync
