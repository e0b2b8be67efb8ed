#pragma once

#include "core/services/IStatusChecker.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <chrono>
#include <cstddef>

namespace devmonitor::infra {

/**
 * @brief TCP connect checker with bounded fan-out.
 *
 * checkOne() resolves the host and attempts a TCP connection on the shared
 * event loop, racing a steady_timer set to the device timeout. The caller
 * returns when either side finishes; a resolve that is still inside the
 * system resolver when the deadline fires completes in the background and is
 * discarded. checkAll() spreads the enabled devices over an asio::thread_pool
 * whose size never exceeds the configured concurrency limit, and joins it
 * before returning.
 *
 * checkOne() blocks its caller, so it must not run on the event loop's own
 * threads.
 *
 * Implements core::IStatusChecker.
 */
class StatusChecker : public core::IStatusChecker {
public:
    /**
     * @brief Constructs a StatusChecker.
     * @param context Running event loop that carries the connection attempts.
     * @param maxConcurrency Maximum number of simultaneous checks (at least 1).
     */
    explicit StatusChecker(AsioContext& context, size_t maxConcurrency = 32);

    /**
     * @brief Checks a device with a TCP connect bounded by its timeout.
     * @param device Device to check.
     * @return Result with reachable=true if the connection was established, or
     *         reachable=false and the failure reason.
     */
    core::CheckResult checkOne(const core::Device& device) override;

    /**
     * @brief Checks all enabled devices concurrently.
     * @param devices Devices to consider; disabled ones are skipped.
     * @return One result per enabled device, in completion order.
     */
    std::vector<core::CheckResult> checkAll(const std::vector<core::Device>& devices) override;

    [[nodiscard]] size_t maxConcurrency() const { return maxConcurrency_; }

private:
    AsioContext& context_;
    size_t maxConcurrency_;
};

} // namespace devmonitor::infra
