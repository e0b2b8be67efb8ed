#include "controllers/MonitorController.hpp"

#include "core/Errors.hpp"
#include "core/bus/Topics.hpp"
#include "core/validation/DeviceValidator.hpp"

#include <spdlog/spdlog.h>

namespace devmonitor::controllers {

namespace {

template <typename T>
T payloadAs(const core::Event& event, const char* expected) {
    if (const auto* value = std::any_cast<T>(&event.payload)) {
        return *value;
    }
    throw core::ValidationError("Malformed payload for '" + event.topic + "': expected " + expected);
}

std::string deviceIdFrom(const core::Event& event) {
    if (const auto* literal = std::any_cast<const char*>(&event.payload)) {
        return *literal;
    }
    return payloadAs<std::string>(event, "device id");
}

} // namespace

MonitorController::MonitorController(core::EventBus& bus, core::DeviceRegistry& registry,
                                     core::IStatusChecker& checker)
    : bus_(bus), registry_(registry), checker_(checker) {
    subscribe(core::topics::ADD_DEVICE, [this](const core::Event& e) { onAddDevice(e); });
    subscribe(core::topics::REMOVE_DEVICE, [this](const core::Event& e) { onRemoveDevice(e); });
    subscribe(core::topics::ENABLE_DEVICE, [this](const core::Event& e) { onSetEnabled(e, true); });
    subscribe(core::topics::DISABLE_DEVICE, [this](const core::Event& e) { onSetEnabled(e, false); });
    subscribe(core::topics::CHECK_ALL_DEVICES, [this](const core::Event& e) {
        runCommand(e, [this]() { checkAllDevices(); });
    });
    subscribe(core::topics::GET_DEVICES, [this](const core::Event& e) { onGetDevices(e); });

    spdlog::info("MonitorController initialized");
}

MonitorController::~MonitorController() {
    for (auto id : subscriptions_) {
        bus_.unsubscribe(id);
    }
}

void MonitorController::subscribe(const char* topic,
                                  std::function<void(const core::Event&)> handler) {
    subscriptions_.push_back(bus_.subscribe(topic, std::move(handler)));
}

void MonitorController::runCommand(const core::Event& event, const std::function<void()>& command) {
    try {
        command();
    } catch (const core::DevMonitorError& e) {
        spdlog::warn("Command '{}' failed: {} ({})", event.topic, e.what(),
                     core::errorKindToString(e.kind()));
        bus_.publish(core::topics::errorTopic(event.topic), core::ErrorEvent{e.kind(), e.what()});
    }
}

void MonitorController::onAddDevice(const core::Event& event) {
    runCommand(event, [this, &event]() {
        auto spec = core::DeviceValidator::validate(payloadAs<core::DeviceSpec>(event, "DeviceSpec"));
        registry_.add(spec);
    });
}

void MonitorController::onRemoveDevice(const core::Event& event) {
    runCommand(event, [this, &event]() { registry_.remove(deviceIdFrom(event)); });
}

void MonitorController::onSetEnabled(const core::Event& event, bool enabled) {
    runCommand(event, [this, &event, enabled]() { registry_.setEnabled(deviceIdFrom(event), enabled); });
}

void MonitorController::onGetDevices(const core::Event& event) {
    runCommand(event, [this]() { bus_.publish(core::topics::DEVICES_LISTED, registry_.getAll()); });
}

std::vector<core::CheckResult> MonitorController::checkAllDevices() {
    auto results = checker_.checkAll(registry_.getAll());

    std::vector<core::CheckResult> applied;
    applied.reserve(results.size());

    for (auto& result : results) {
        try {
            registry_.updateStatus(result.deviceId, result);
            applied.push_back(std::move(result));
        } catch (const core::NotFoundError&) {
            spdlog::info("Dropping result for device {} removed during the check", result.deviceId);
        } catch (const core::PersistenceError& e) {
            spdlog::error("Failed to record status of device {}: {}", result.deviceId, e.what());
            bus_.publish(core::topics::errorTopic(core::topics::CHECK_ALL_DEVICES),
                         core::ErrorEvent{e.kind(), e.what()});
            applied.push_back(std::move(result));
        }
    }

    bus_.publish(core::topics::DEVICES_CHECKED, applied);
    return applied;
}

} // namespace devmonitor::controllers
