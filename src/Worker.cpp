#include "Worker.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <thread>

namespace ftpsync {

Worker::GateGuard::GateGuard(Worker& worker) : m_worker(worker) {
    std::unique_lock<std::mutex> lock(m_worker.m_mutex);
    m_worker.m_cv.wait(lock, [this]() {
        return m_worker.m_provisioning < m_worker.m_limit || m_worker.m_closing;
    });
    if (m_worker.m_closing) {
        throw WorkerClosedError();
    }
    ++m_worker.m_provisioning;
}

Worker::GateGuard::~GateGuard() {
    std::lock_guard<std::mutex> lock(m_worker.m_mutex);
    --m_worker.m_provisioning;
    m_worker.m_cv.notify_all();
}

Worker::DispatchGuard::~DispatchGuard() {
    std::lock_guard<std::mutex> lock(m_worker.m_mutex);
    --m_worker.m_dispatching;
    m_worker.m_cv.notify_all();
}

Worker::Worker(size_t limit,
               ConnectionFactory factory,
               ConfigLoader loader,
               WorkerOptions options)
    : m_limit(limit)
    , m_makeConnection(std::move(factory))
    , m_makeConfig(std::move(loader))
    , m_options(options) {
    if (m_limit == 0) {
        throw std::invalid_argument("Worker limit must be at least 1");
    }
    if (!m_makeConfig) {
        throw std::invalid_argument("Worker requires a config loader");
    }
}

Worker::~Worker() {
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_closing = true;
        if (!m_waitingCommands.empty()) {
            spdlog::warn("Dropping {} queued commands", m_waitingCommands.size());
            m_waitingCommands.clear();
        }
        m_cv.notify_all();

        // Running commands still call back into the worker
        m_cv.wait(lock, [this]() { return emptyLocked(); });
    }

    std::vector<std::unique_ptr<CommandExecutor>> retired;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        retired.swap(m_retired);
    }
    for (auto& executor : retired) {
        executor->join();
    }
    retired.clear();

    closeConnections();
}

void Worker::enableDebug() {
    m_debug = true;
}

void Worker::disableDebug() {
    m_debug = false;
}

void Worker::setConnectionFactory(ConnectionFactory factory) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_makeConnection = std::move(factory);
}

void Worker::addConnection(ConnectionBatch connections) {
    std::lock_guard<std::mutex> lock(m_mutex);
    appendConnections(std::move(connections));
    m_cv.notify_all();
}

void Worker::appendConnections(ConnectionBatch connections) {
    for (auto& connection : connections) {
        if (!connection) continue;
        m_connections.push_back(std::move(connection));
        m_freeConnections.push_back(m_connections.size());
    }
}

void Worker::fillConnection(const RawConfig& config) {
    ConnectionFactory factory;
    ConfigLoader loader;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_makeConnection || m_connections.size() + m_creating >= m_limit) {
            return;
        }
        ++m_creating;
        factory = m_makeConnection;
        loader = m_makeConfig;
    }

    ConnectionBatch batch;
    try {
        batch = factory(loader(config), std::nullopt, false);
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_creating;
        }
        if (ErrorHandler::isTooManyConnections(e)) {
            if (m_debug) {
                spdlog::debug("Too many connections, backing off for {} ms",
                              m_options.tooManyConnectionsBackoff.count());
            }
            std::this_thread::sleep_for(m_options.tooManyConnectionsBackoff);
            return;
        }
        spdlog::error("Failed to create connection: {}", e.what());
        throw;
    } catch (...) {
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_creating;
        throw;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    --m_creating;
    if (batch.empty()) {
        return;
    }
    appendConnections(std::move(batch));
    m_cv.notify_all();

    if (m_debug) {
        spdlog::debug("Creating new connection #{}", m_connections.size());
    }
}

void Worker::addCommand(std::shared_ptr<Command> command, const RawConfig& config) {
    if (!command) {
        throw std::invalid_argument("Cannot add a null command");
    }

    reapExecutors();

    const std::string name = command->name();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closing) {
            throw WorkerClosedError();
        }

        if (m_debug) {
            spdlog::debug("Adding command {}", name);
        }

        size_t running = m_commands.size() + m_dispatching;
        if (running >= m_limit) {
            m_waitingCommands.push_back(WaitingCommand{command, config});
            if (m_debug) {
                spdlog::debug("Queuing command {} (total: {})", name, m_waitingCommands.size());
            }
            return;
        }

        ++m_dispatching;
        if (m_debug) {
            spdlog::debug("Running command {} (total: {})", name, running + 1);
        }
    }

    run(command, config);
}

void Worker::run(const std::shared_ptr<Command>& command, const RawConfig& config) {
    DispatchGuard dispatch(*this);
    const std::string name = command->name();
    ErrorContext context("dispatch " + name);
    std::exception_ptr failure;

    try {
        GateGuard gate(*this);

        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            id = ++m_executorId;
        }

        fillConnection(config);

        size_t index;
        std::shared_ptr<Connection> connection;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            for (;;) {
                if (m_closing) {
                    throw WorkerClosedError();
                }
                if (!m_freeConnections.empty()) {
                    break;
                }
                bool freed = m_cv.wait_for(lock, m_options.connectionRetryInterval, [this]() {
                    return !m_freeConnections.empty() || m_closing;
                });
                if (!freed) {
                    lock.unlock();
                    fillConnection(config);
                    lock.lock();
                }
            }

            index = m_freeConnections.back();
            m_freeConnections.pop_back();
            connection = m_connections[index - 1];
        }

        // The slot is reserved; bind without holding the pool lock
        try {
            command->setConnection(connection);
        } catch (...) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_freeConnections.push_back(index);
            m_cv.notify_all();
            throw;
        }

        if (m_debug) {
            spdlog::debug("Scheduling executor #{} {} run, using connection {}", id, name, index);
        }

        auto executor = std::make_unique<CommandExecutor>(
            command,
            [this](const std::shared_ptr<Command>& finished) { onFinish(finished); },
            m_debug.load(), id, m_options.commandPollInterval);

        std::lock_guard<std::mutex> lock(m_mutex);
        CommandExecutor* started = executor.get();
        m_commands.push_back(PendingExecution{command, config, index, id, std::move(executor)});
        try {
            started->start();
        } catch (...) {
            m_commands.pop_back();
            m_freeConnections.push_back(index);
            m_cv.notify_all();
            throw;
        }
    } catch (...) {
        failure = std::current_exception();
    }

    if (failure) {
        spdlog::error("[{}] Dispatch failed: {}", ErrorContext::current(),
                      ErrorHandler::describe(failure));
        command->setError(failure);
        onFinish(command);
        std::rethrow_exception(failure);
    }
}

void Worker::onFinish(const std::shared_ptr<Command>& command) {
    std::optional<WaitingCommand> awakened;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        // Kick from running commands and free connection
        RawConfig config;
        bool found = false;
        auto it = std::find_if(m_commands.begin(), m_commands.end(),
                               [&command](const PendingExecution& pending) {
                                   return pending.command.get() == command.get();
                               });
        if (it != m_commands.end()) {
            m_freeConnections.push_back(it->index);
            config = it->config;
            found = true;

            if (m_debug) {
                spdlog::debug("Removing executor #{}", it->executorId);
            }

            m_retired.push_back(std::move(it->executor));
            m_commands.erase(it);
        }

        if (m_debug) {
            spdlog::debug("Sleeping commands: {}", m_waitingCommands.size());
        }

        // Wake up the most recently queued command
        if (!m_waitingCommands.empty() && !m_closing) {
            awakened = std::move(m_waitingCommands.back());
            m_waitingCommands.pop_back();
            if (found) {
                awakened->config = std::move(config);
            }
            ++m_dispatching;
        }

        m_cv.notify_all();
    }

    // Executors woken from the queue never pass through addCommand
    reapExecutors();

    if (awakened) {
        run(awakened->command, awakened->config);
    }
}

void Worker::reapExecutors() {
    std::vector<std::unique_ptr<CommandExecutor>> finished;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto split = std::stable_partition(
            m_retired.begin(), m_retired.end(),
            [](const std::unique_ptr<CommandExecutor>& executor) { return !executor->finished(); });
        std::move(split, m_retired.end(), std::back_inserter(finished));
        m_retired.erase(split, m_retired.end());
    }

    for (auto& executor : finished) {
        executor->join();
    }
}

bool Worker::emptyLocked() const {
    return m_commands.empty() && m_dispatching == 0 && m_waitingCommands.empty();
}

bool Worker::isEmpty() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return emptyLocked();
}

void Worker::waitUntilEmpty() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this]() { return emptyLocked(); });
}

bool Worker::waitUntilEmpty(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [this]() { return emptyLocked(); });
}

void Worker::closeConnections() {
    std::vector<std::shared_ptr<Connection>> connections;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        connections = m_connections;
    }

    for (auto& connection : connections) {
        if (connection->isClosed()) {
            continue;
        }
        try {
            connection->close();
            if (m_debug) {
                spdlog::debug("Closing connection {}", connection->name());
            }
        } catch (const std::exception& e) {
            spdlog::warn("Failed to close connection {}: {}", connection->name(), e.what());
        }
    }
}

size_t Worker::connectionCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connections.size();
}

size_t Worker::freeConnectionCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_freeConnections.size();
}

size_t Worker::runningCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_commands.size();
}

size_t Worker::retiredCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_retired.size();
}

size_t Worker::queuedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_waitingCommands.size();
}

}  // namespace ftpsync
