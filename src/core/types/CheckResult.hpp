/**
 * @file CheckResult.hpp
 * @brief Outcome of a single TCP reachability check.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace devmonitor::core {

/**
 * @brief Result of probing one device.
 *
 * Ephemeral; never persisted. A failed check is represented as data
 * (reachable == false with an error reason), not as an exception.
 */
struct CheckResult {
    std::string deviceId;                 ///< ID of the checked device
    bool reachable{false};                ///< Whether the TCP connection was established
    std::optional<std::string> error;     ///< Failure reason when not reachable
    std::chrono::milliseconds duration{0}; ///< Time spent on the check
    std::chrono::system_clock::time_point checkedAt; ///< When the check completed

    /**
     * @brief Returns the check duration in fractional seconds.
     */
    [[nodiscard]] double durationSeconds() const {
        return static_cast<double>(duration.count()) / 1000.0;
    }

    bool operator==(const CheckResult& other) const = default;
};

} // namespace devmonitor::core
