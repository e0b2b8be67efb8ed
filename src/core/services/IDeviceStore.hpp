/**
 * @file IDeviceStore.hpp
 * @brief Interface for durable device storage.
 *
 * The store offers no concurrency guarantees; the DeviceRegistry serializes
 * every call.
 */

#pragma once

#include "core/types/Device.hpp"

#include <string>
#include <vector>

namespace devmonitor::core {

/**
 * @brief Durable keyed storage for device records.
 */
class IDeviceStore {
public:
    virtual ~IDeviceStore() = default;

    /**
     * @brief Loads every stored device.
     *
     * A missing or unreadable backing store yields an empty list rather than an
     * error, so the application can always start.
     * @return Stored devices in their persisted order.
     */
    virtual std::vector<Device> loadAll() = 0;

    /**
     * @brief Replaces the stored set with the given devices.
     * @param devices Complete set to persist, in order.
     * @throws PersistenceError if the write fails; the previous contents stay intact.
     */
    virtual void saveAll(const std::vector<Device>& devices) = 0;

    /**
     * @brief Inserts a device or replaces the stored device with the same id.
     * @throws PersistenceError if the write fails.
     */
    virtual void upsert(const Device& device) = 0;

    /**
     * @brief Deletes the device with the given id.
     * @return True if a record was removed, false if none matched.
     * @throws PersistenceError if the write fails.
     */
    virtual bool remove(const std::string& id) = 0;
};

} // namespace devmonitor::core
