#pragma once

#include <asio.hpp>
#include <atomic>
#include <cstddef>
#include <optional>
#include <thread>
#include <vector>

namespace devmonitor::infra {

/**
 * @brief Event loop shared by the scheduler timer and signal handling.
 *
 * Owns an asio::io_context and the threads that run it. The application owns
 * the single instance and passes it by reference.
 */
class AsioContext {
public:
    /**
     * @param threadCount Number of threads running the io_context (at least 1).
     */
    explicit AsioContext(size_t threadCount = 2);

    /**
     * @brief Stops the loop and joins its threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Spawns the loop threads. No effect if already running.
     */
    void start();

    /**
     * @brief Stops the loop and joins its threads. Pending handlers are discarded.
     *
     * The context can be started again afterwards.
     */
    void stop();

    /**
     * @brief Blocks the calling thread until SIGINT or SIGTERM is delivered.
     * @return The received signal number.
     * @throws std::runtime_error if the loop is not running.
     */
    int waitForTerminationSignal();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    asio::io_context& getContext() { return ioContext_; }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    void joinThreads();

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace devmonitor::infra
