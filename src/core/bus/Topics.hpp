/**
 * @file Topics.hpp
 * @brief Topic names of the command/event surface.
 *
 * Inbound command topics are consumed by the MonitorController; outbound topics
 * are published by the registry and the controller. A failed command publishes
 * "<command>_error" (see errorTopic()).
 */

#pragma once

#include <string>

namespace devmonitor::core::topics {

// Commands (inbound)
inline constexpr const char* ADD_DEVICE = "add_device";               ///< Payload: DeviceSpec
inline constexpr const char* REMOVE_DEVICE = "remove_device";         ///< Payload: device id
inline constexpr const char* ENABLE_DEVICE = "enable_device";         ///< Payload: device id
inline constexpr const char* DISABLE_DEVICE = "disable_device";       ///< Payload: device id
inline constexpr const char* CHECK_ALL_DEVICES = "check_all_devices"; ///< No payload
inline constexpr const char* GET_DEVICES = "get_devices";             ///< No payload

// Outcomes (outbound)
inline constexpr const char* DEVICE_ADDED = "device_added";       ///< Payload: Device
inline constexpr const char* DEVICE_REMOVED = "device_removed";   ///< Payload: device id
inline constexpr const char* DEVICE_UPDATED = "device_updated";   ///< Payload: Device
inline constexpr const char* DEVICES_CHECKED = "devices_checked"; ///< Payload: vector<CheckResult>
inline constexpr const char* DEVICES_LISTED = "devices_listed";   ///< Payload: vector<Device>
inline constexpr const char* HANDLER_ERROR = "handler_error";     ///< Payload: HandlerErrorEvent

/**
 * @brief Returns the error topic for a command topic ("add_device" -> "add_device_error").
 */
inline std::string errorTopic(const std::string& commandTopic) {
    return commandTopic + "_error";
}

} // namespace devmonitor::core::topics
