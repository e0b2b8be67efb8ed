#pragma once

#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

namespace devmonitor::infra {

/**
 * @brief Periodically triggers a check cycle.
 *
 * Ticks are driven by a steady_timer on the shared AsioContext at a fixed
 * rate. Each tick hands the cycle to a dedicated single-thread worker, so the
 * timer never blocks. A tick that fires while the previous cycle is still
 * running is dropped.
 *
 * State machine: Stopped -> start() -> Running -> stop() -> Stopped. Repeated
 * start() or stop() calls are no-ops. stop() only suppresses future ticks; a
 * cycle in flight runs to completion and the destructor waits for it.
 */
class CheckScheduler {
public:
    using Cycle = std::function<void()>;

    /**
     * @brief Constructs a stopped scheduler.
     * @param context AsioContext hosting the timer (must be started to tick).
     * @param cycle Function executing one check cycle; exceptions are logged.
     */
    CheckScheduler(AsioContext& context, Cycle cycle);

    /**
     * @brief Stops ticking and waits for an in-flight cycle to finish.
     */
    ~CheckScheduler();

    CheckScheduler(const CheckScheduler&) = delete;
    CheckScheduler& operator=(const CheckScheduler&) = delete;

    /**
     * @brief Starts ticking every interval. The first cycle runs one interval from now.
     * @param interval Time between cycles (values below 1 ms are raised to 1 ms).
     */
    void start(std::chrono::milliseconds interval);

    /**
     * @brief Stops ticking. Does not interrupt a running cycle.
     */
    void stop();

    /**
     * @brief Changes the period. Applies from the next cycle boundary: the tick
     *        already armed keeps its deadline.
     */
    void setInterval(std::chrono::milliseconds interval);

    [[nodiscard]] bool isRunning() const;
    [[nodiscard]] std::chrono::milliseconds interval() const;

    /**
     * @brief Returns true while a cycle is executing.
     */
    [[nodiscard]] bool isCycleInFlight() const { return state_->cycleInFlight.load(); }

    /**
     * @brief Number of cycles started since construction.
     */
    [[nodiscard]] uint64_t cyclesStarted() const { return state_->cyclesStarted.load(); }

    /**
     * @brief Number of ticks dropped because a cycle was still running.
     */
    [[nodiscard]] uint64_t ticksSkipped() const { return state_->ticksSkipped.load(); }

private:
    // Shared with timer handlers so a late tick never touches a destroyed scheduler.
    struct State {
        State(asio::io_context& io, Cycle fn) : timer(io), cycle(std::move(fn)) {}

        asio::steady_timer timer;
        Cycle cycle;
        asio::thread_pool cycleWorker{1};

        std::mutex mutex;
        std::chrono::milliseconds interval{std::chrono::seconds(300)};
        uint64_t generation{0};
        bool running{false};

        std::atomic<bool> cycleInFlight{false};
        std::atomic<uint64_t> cyclesStarted{0};
        std::atomic<uint64_t> ticksSkipped{0};
    };

    static void scheduleNextTick(const std::shared_ptr<State>& state, uint64_t generation);
    static void onTick(const std::shared_ptr<State>& state, uint64_t generation);
    static void runCycle(const std::shared_ptr<State>& state);

    std::shared_ptr<State> state_;
};

} // namespace devmonitor::infra
