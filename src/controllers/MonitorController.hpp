#pragma once

#include "core/bus/EventBus.hpp"
#include "core/registry/DeviceRegistry.hpp"
#include "core/services/IStatusChecker.hpp"
#include "core/types/CheckResult.hpp"

#include <functional>
#include <vector>

namespace devmonitor::controllers {

/**
 * @brief Translates bus commands into registry and checker calls.
 *
 * Subscribes to the command topics on construction and unsubscribes on
 * destruction. Payloads are interpreted here and nowhere else: a payload of
 * the wrong type is reported as a ValidationError on "<command>_error".
 *
 * Commands:
 *  - add_device (DeviceSpec): validate, then DeviceRegistry::add.
 *  - remove_device / enable_device / disable_device (std::string id).
 *  - check_all_devices: runs a full cycle and publishes devices_checked.
 *  - get_devices: publishes devices_listed.
 */
class MonitorController {
public:
    MonitorController(core::EventBus& bus, core::DeviceRegistry& registry,
                      core::IStatusChecker& checker);
    ~MonitorController();

    MonitorController(const MonitorController&) = delete;
    MonitorController& operator=(const MonitorController&) = delete;

    /**
     * @brief Runs one check cycle over the current registry contents.
     *
     * Checks every enabled device, applies each result to the registry one
     * device at a time, and publishes a single devices_checked event carrying
     * the whole batch. Results for devices removed during the cycle are dropped.
     * @return The published results.
     */
    std::vector<core::CheckResult> checkAllDevices();

private:
    void subscribe(const char* topic, std::function<void(const core::Event&)> handler);
    void runCommand(const core::Event& event, const std::function<void()>& command);

    void onAddDevice(const core::Event& event);
    void onRemoveDevice(const core::Event& event);
    void onSetEnabled(const core::Event& event, bool enabled);
    void onGetDevices(const core::Event& event);

    core::EventBus& bus_;
    core::DeviceRegistry& registry_;
    core::IStatusChecker& checker_;
    std::vector<core::EventBus::SubscriptionId> subscriptions_;
};

} // namespace devmonitor::controllers
