#pragma once

#include "core/bus/EventBus.hpp"
#include "core/services/IDeviceStore.hpp"
#include "core/types/CheckResult.hpp"
#include "core/types/Device.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <vector>

namespace devmonitor::core {

/**
 * @brief Authoritative in-memory set of monitored devices.
 *
 * Owns every Device record. All mutations are written through to the store
 * before they are committed in memory, and the matching event is published
 * only after the write succeeded. Readers receive copies.
 *
 * Guarded by a reader/writer lock: getAll() and find() may run concurrently,
 * mutations are exclusive. Events are published after the lock is released so
 * subscribers may call back into the registry.
 */
class DeviceRegistry {
public:
    /**
     * @brief Constructs a registry backed by the given store.
     * @param store Persistence backend.
     * @param bus Bus used to announce device_added/device_removed/device_updated.
     */
    DeviceRegistry(std::shared_ptr<IDeviceStore> store, EventBus& bus);

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /**
     * @brief Replaces the in-memory set with the store contents.
     * @return Number of devices loaded.
     */
    size_t load();

    /**
     * @brief Registers a new device.
     * @param spec Already validated device parameters.
     * @return Copy of the created device, with its assigned id.
     * @throws DuplicateDeviceError if (host, port) is already monitored.
     * @throws PersistenceError if the store write fails.
     */
    Device add(const DeviceSpec& spec);

    /**
     * @brief Removes a device.
     * @return True once the device has been removed and persisted.
     * @throws NotFoundError if no device has this id.
     * @throws PersistenceError if the store write fails.
     */
    bool remove(const std::string& id);

    /**
     * @brief Returns a copy of all devices in insertion order.
     */
    [[nodiscard]] std::vector<Device> getAll() const;

    /**
     * @brief Returns a copy of one device.
     */
    [[nodiscard]] std::optional<Device> find(const std::string& id) const;

    /**
     * @brief Applies a check outcome to a device.
     *
     * Sets status and last-checked time together; on a store failure both keep
     * their previous values.
     * @return Copy of the updated device.
     * @throws NotFoundError if the device was removed in the meantime.
     * @throws PersistenceError if the store write fails.
     */
    Device updateStatus(const std::string& id, const CheckResult& result);

    /**
     * @brief Enables or disables checks for a device.
     * @return Copy of the updated device.
     * @throws NotFoundError if no device has this id.
     * @throws PersistenceError if the store write fails.
     */
    Device setEnabled(const std::string& id, bool enabled);

    [[nodiscard]] size_t size() const;

private:
    using DeviceList = std::vector<Device>;

    std::string generateId();
    static DeviceList::iterator findById(DeviceList& devices, const std::string& id);

    std::shared_ptr<IDeviceStore> store_;
    EventBus& bus_;
    mutable std::shared_mutex mutex_;
    DeviceList devices_;
    std::mt19937_64 idGenerator_;
};

} // namespace devmonitor::core
