/**
 * @file IStatusChecker.hpp
 * @brief Interface for TCP reachability checks.
 */

#pragma once

#include "core/types/CheckResult.hpp"
#include "core/types/Device.hpp"

#include <vector>

namespace devmonitor::core {

/**
 * @brief Checks devices by opening (and immediately closing) a TCP connection.
 *
 * Check failures are reported inside the CheckResult; implementations never
 * throw for an unreachable device.
 */
class IStatusChecker {
public:
    virtual ~IStatusChecker() = default;

    /**
     * @brief Checks a single device, bounded by its timeout.
     * @param device Device to check (enabled or not).
     * @return The check outcome tagged with the device id.
     */
    virtual CheckResult checkOne(const Device& device) = 0;

    /**
     * @brief Checks every enabled device concurrently.
     *
     * Disabled devices are skipped and produce no result. Returns after all
     * checks have completed; result order is unspecified.
     * @param devices Devices to consider.
     * @return One result per enabled device.
     */
    virtual std::vector<CheckResult> checkAll(const std::vector<Device>& devices) = 0;
};

} // namespace devmonitor::core
