/**
 * @file Device.hpp
 * @brief Device definition and status types for the monitoring engine.
 *
 * This file defines the Device record owned by the registry, the DeviceSpec
 * used to request a new device, and the reachability status enumeration.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace devmonitor::core {

/**
 * @brief Last known reachability of a monitored device.
 */
enum class DeviceStatus : int {
    Unknown = 0, ///< Device has not been checked yet
    Online = 1,  ///< Last check established a TCP connection
    Offline = 2  ///< Last check failed (refused, timed out, unresolvable)
};

/**
 * @brief Parameters for registering a new device.
 *
 * Carries everything the caller chooses; the identifier, status and
 * timestamps are assigned by the registry.
 */
struct DeviceSpec {
    std::string name;      ///< Display label
    std::string host;      ///< Hostname or IP literal
    int port{80};          ///< TCP port in [1, 65535]
    int timeoutSeconds{5}; ///< Maximum wait per check
    bool enabled{true};    ///< Whether checks include this device

    bool operator==(const DeviceSpec& other) const = default;
};

/**
 * @brief A monitored network endpoint and its last known status.
 *
 * Instances handed out by the registry are value copies; changing them has no
 * effect on the monitored set.
 */
struct Device {
    std::string id;                     ///< Stable identifier assigned at creation
    std::string name;                   ///< Display label (not required to be unique)
    std::string host;                   ///< Hostname or IP literal
    int port{80};                       ///< TCP port in [1, 65535]
    int timeoutSeconds{5};              ///< Maximum wait per check
    bool enabled{true};                 ///< Disabled devices are skipped by checks
    DeviceStatus status{DeviceStatus::Unknown}; ///< Result of the last check
    std::chrono::system_clock::time_point createdAt; ///< When the device was registered
    std::optional<std::chrono::system_clock::time_point> lastCheckedAt; ///< Last check completion

    /**
     * @brief Returns the check timeout as a duration.
     */
    [[nodiscard]] std::chrono::seconds timeout() const { return std::chrono::seconds(timeoutSeconds); }

    /**
     * @brief Formats the endpoint as "host:port".
     */
    [[nodiscard]] std::string endpoint() const;

    /**
     * @brief Converts the device status to a human-readable string.
     * @return String representation of the status (e.g., "Online", "Offline").
     */
    [[nodiscard]] std::string statusToString() const;

    static std::string statusToString(DeviceStatus status);

    /**
     * @brief Parses a string to get the corresponding DeviceStatus.
     * @param str The string to parse (e.g., "Online", "Offline").
     * @return The corresponding DeviceStatus, Unknown for unrecognized input.
     */
    static DeviceStatus statusFromString(const std::string& str);

    bool operator==(const Device& other) const = default;
};

} // namespace devmonitor::core
