#include "infrastructure/scheduling/CheckScheduler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace devmonitor::infra {

namespace {

std::chrono::milliseconds clampInterval(std::chrono::milliseconds interval) {
    return std::max(interval, std::chrono::milliseconds(1));
}

} // namespace

CheckScheduler::CheckScheduler(AsioContext& context, Cycle cycle)
    : state_(std::make_shared<State>(context.getContext(), std::move(cycle))) {
    spdlog::debug("CheckScheduler initialized");
}

CheckScheduler::~CheckScheduler() {
    stop();
    state_->cycleWorker.join();
}

void CheckScheduler::start(std::chrono::milliseconds interval) {
    std::lock_guard lock(state_->mutex);
    if (state_->running) {
        spdlog::debug("CheckScheduler already running");
        return;
    }

    state_->interval = clampInterval(interval);
    state_->running = true;
    ++state_->generation;

    state_->timer.expires_after(state_->interval);
    scheduleNextTick(state_, state_->generation);

    spdlog::info("CheckScheduler started (interval {} ms)", state_->interval.count());
}

void CheckScheduler::stop() {
    std::lock_guard lock(state_->mutex);
    if (!state_->running) {
        return;
    }

    state_->running = false;
    ++state_->generation;
    state_->timer.cancel();

    spdlog::info("CheckScheduler stopped");
}

void CheckScheduler::setInterval(std::chrono::milliseconds interval) {
    std::lock_guard lock(state_->mutex);
    state_->interval = clampInterval(interval);
    spdlog::info("Check interval set to {} ms", state_->interval.count());
}

bool CheckScheduler::isRunning() const {
    std::lock_guard lock(state_->mutex);
    return state_->running;
}

std::chrono::milliseconds CheckScheduler::interval() const {
    std::lock_guard lock(state_->mutex);
    return state_->interval;
}

void CheckScheduler::scheduleNextTick(const std::shared_ptr<State>& state, uint64_t generation) {
    // Caller holds state->mutex.
    state->timer.async_wait([state, generation](const asio::error_code& ec) {
        if (ec) {
            return; // Timer cancelled
        }
        onTick(state, generation);
    });
}

void CheckScheduler::onTick(const std::shared_ptr<State>& state, uint64_t generation) {
    std::lock_guard lock(state->mutex);
    if (!state->running || generation != state->generation) {
        return;
    }

    // Fixed rate; if the timer thread fell behind, realign instead of bursting.
    auto next = state->timer.expiry() + state->interval;
    if (next <= std::chrono::steady_clock::now()) {
        state->timer.expires_after(state->interval);
    } else {
        state->timer.expires_at(next);
    }
    scheduleNextTick(state, generation);

    if (state->cycleInFlight.exchange(true)) {
        ++state->ticksSkipped;
        spdlog::debug("Skipping scheduled check: previous cycle still running");
        return;
    }

    asio::post(state->cycleWorker, [state]() { runCycle(state); });
}

void CheckScheduler::runCycle(const std::shared_ptr<State>& state) {
    {
        std::lock_guard lock(state->mutex);
        if (!state->running) {
            state->cycleInFlight = false;
            return;
        }
    }

    ++state->cyclesStarted;
    try {
        state->cycle();
    } catch (const std::exception& e) {
        spdlog::error("Scheduled check cycle failed: {}", e.what());
    } catch (...) {
        spdlog::error("Scheduled check cycle failed: non-standard exception");
    }
    state->cycleInFlight = false;
}

} // namespace devmonitor::infra
