#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <future>
#include <stdexcept>

namespace devmonitor::infra {

AsioContext::AsioContext(size_t threadCount) : threadCount_(std::max<size_t>(threadCount, 1)) {}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    // Keeps run() from returning while no timer is armed.
    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this]() { ioContext_.run(); });
    }

    spdlog::debug("Event loop running on {} threads", threadCount_);
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();
    joinThreads();

    // Allows a later start() to run the same context again.
    ioContext_.restart();
    spdlog::debug("Event loop stopped");
}

int AsioContext::waitForTerminationSignal() {
    if (!running_.load()) {
        throw std::runtime_error("Event loop is not running");
    }

    asio::signal_set signals(ioContext_, SIGINT, SIGTERM);
    std::promise<int> received;

    signals.async_wait([&received](const asio::error_code& ec, int signalNumber) {
        if (ec) {
            received.set_exception(std::make_exception_ptr(asio::system_error(ec)));
            return;
        }
        received.set_value(signalNumber);
    });

    int signalNumber = received.get_future().get();
    spdlog::info("Received signal {}", signalNumber);
    return signalNumber;
}

void AsioContext::joinThreads() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

} // namespace devmonitor::infra
