#include "core/registry/DeviceRegistry.hpp"

#include "core/Errors.hpp"
#include "core/bus/Topics.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace devmonitor::core {

DeviceRegistry::DeviceRegistry(std::shared_ptr<IDeviceStore> store, EventBus& bus)
    : store_(std::move(store)), bus_(bus), idGenerator_(std::random_device{}()) {}

size_t DeviceRegistry::load() {
    auto loaded = store_->loadAll();

    std::unique_lock lock(mutex_);
    devices_ = std::move(loaded);
    spdlog::info("Device registry loaded {} devices", devices_.size());
    return devices_.size();
}

Device DeviceRegistry::add(const DeviceSpec& spec) {
    Device device;

    {
        std::unique_lock lock(mutex_);

        auto duplicate = std::find_if(devices_.begin(), devices_.end(), [&spec](const Device& d) {
            return d.host == spec.host && d.port == spec.port;
        });
        if (duplicate != devices_.end()) {
            throw DuplicateDeviceError(fmt::format("Endpoint {}:{} is already monitored by '{}'",
                                                   spec.host, spec.port, duplicate->name));
        }

        device.id = generateId();
        device.name = spec.name;
        device.host = spec.host;
        device.port = spec.port;
        device.timeoutSeconds = spec.timeoutSeconds;
        device.enabled = spec.enabled;
        device.createdAt = std::chrono::system_clock::now();

        DeviceList updated = devices_;
        updated.push_back(device);
        store_->saveAll(updated);
        devices_ = std::move(updated);
    }

    spdlog::info("Added device: {} ({}) id={}", device.name, device.endpoint(), device.id);
    bus_.publish(topics::DEVICE_ADDED, device);
    return device;
}

bool DeviceRegistry::remove(const std::string& id) {
    Device removed;

    {
        std::unique_lock lock(mutex_);

        DeviceList updated = devices_;
        auto it = findById(updated, id);
        if (it == updated.end()) {
            throw NotFoundError(fmt::format("Device not found: {}", id));
        }
        removed = *it;
        updated.erase(it);

        store_->saveAll(updated);
        devices_ = std::move(updated);
    }

    spdlog::info("Removed device: {} ({}) id={}", removed.name, removed.endpoint(), removed.id);
    bus_.publish(topics::DEVICE_REMOVED, removed.id);
    return true;
}

std::vector<Device> DeviceRegistry::getAll() const {
    std::shared_lock lock(mutex_);
    return devices_;
}

std::optional<Device> DeviceRegistry::find(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = std::find_if(devices_.begin(), devices_.end(),
                           [&id](const Device& d) { return d.id == id; });
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return *it;
}

Device DeviceRegistry::updateStatus(const std::string& id, const CheckResult& result) {
    std::unique_lock lock(mutex_);

    DeviceList updated = devices_;
    auto it = findById(updated, id);
    if (it == updated.end()) {
        throw NotFoundError(fmt::format("Device not found: {}", id));
    }

    it->status = result.reachable ? DeviceStatus::Online : DeviceStatus::Offline;
    it->lastCheckedAt = result.checkedAt;
    Device device = *it;

    store_->saveAll(updated);
    devices_ = std::move(updated);

    spdlog::debug("Device {} is {}", device.name, device.statusToString());
    return device;
}

Device DeviceRegistry::setEnabled(const std::string& id, bool enabled) {
    Device device;

    {
        std::unique_lock lock(mutex_);

        DeviceList updated = devices_;
        auto it = findById(updated, id);
        if (it == updated.end()) {
            throw NotFoundError(fmt::format("Device not found: {}", id));
        }
        it->enabled = enabled;
        device = *it;

        store_->saveAll(updated);
        devices_ = std::move(updated);
    }

    spdlog::info("Device {} {}", device.name, enabled ? "enabled" : "disabled");
    bus_.publish(topics::DEVICE_UPDATED, device);
    return device;
}

size_t DeviceRegistry::size() const {
    std::shared_lock lock(mutex_);
    return devices_.size();
}

std::string DeviceRegistry::generateId() {
    // Caller holds the exclusive lock.
    std::string id;
    do {
        id = fmt::format("{:016x}", idGenerator_());
    } while (findById(devices_, id) != devices_.end());
    return id;
}

DeviceRegistry::DeviceList::iterator DeviceRegistry::findById(DeviceList& devices,
                                                              const std::string& id) {
    return std::find_if(devices.begin(), devices.end(),
                        [&id](const Device& d) { return d.id == id; });
}

} // namespace devmonitor::core
