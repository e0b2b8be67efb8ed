#pragma once

#include "core/services/IDeviceStore.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>

namespace devmonitor::infra {

/**
 * @brief Device store backed by a single JSON file.
 *
 * The file holds an array of device records. Every write rewrites the whole
 * file through a temporary sibling that is renamed over the original, so a
 * failed write never leaves a truncated file behind.
 *
 * Not thread-safe; the DeviceRegistry serializes access.
 */
class JsonDeviceStore : public core::IDeviceStore {
public:
    /**
     * @brief Constructs a store for the given file, creating its parent directory.
     * @param path Path to the devices file (e.g. ~/.dev_monitor/devices.json).
     */
    explicit JsonDeviceStore(std::filesystem::path path);

    /**
     * @brief Reads all devices from the file.
     *
     * A missing file, invalid JSON or a non-array document yields an empty list.
     * Individual records that cannot be decoded are skipped with a warning.
     */
    std::vector<core::Device> loadAll() override;

    void saveAll(const std::vector<core::Device>& devices) override;
    void upsert(const core::Device& device) override;
    bool remove(const std::string& id) override;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    static nlohmann::json toJson(const core::Device& device);

    /**
     * @throws nlohmann::json::exception or std::invalid_argument on a malformed record.
     */
    static core::Device fromJson(const nlohmann::json& j);

private:
    std::filesystem::path path_;
};

} // namespace devmonitor::infra
