#include "infrastructure/storage/JsonDeviceStore.hpp"

#include "core/Errors.hpp"
#include "core/types/Timestamp.hpp"
#include "core/validation/DeviceValidator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <fstream>

namespace devmonitor::infra {

JsonDeviceStore::JsonDeviceStore(std::filesystem::path path) : path_(std::move(path)) {
    auto parent = path_.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
    spdlog::info("Device store initialized at {}", path_.string());
}

std::vector<core::Device> JsonDeviceStore::loadAll() {
    std::vector<core::Device> devices;

    if (!std::filesystem::exists(path_)) {
        spdlog::info("No devices file found at {}, starting empty", path_.string());
        return devices;
    }

    nlohmann::json j;
    try {
        std::ifstream file(path_);
        if (!file) {
            spdlog::error("Failed to open devices file: {}", path_.string());
            return devices;
        }
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Error decoding JSON from {}: {}", path_.string(), e.what());
        return devices;
    }

    if (!j.is_array()) {
        spdlog::error("Devices file {} does not contain a list of devices", path_.string());
        return devices;
    }

    for (const auto& record : j) {
        try {
            devices.push_back(fromJson(record));
        } catch (const std::exception& e) {
            spdlog::warn("Skipping malformed device record in {}: {}", path_.string(), e.what());
        }
    }

    spdlog::info("Loaded {} devices from {}", devices.size(), path_.string());
    return devices;
}

void JsonDeviceStore::saveAll(const std::vector<core::Device>& devices) {
    auto data = nlohmann::json::array();
    for (const auto& device : devices) {
        data.push_back(toJson(device));
    }

    auto tmpPath = path_;
    tmpPath += ".tmp";

    try {
        {
            std::ofstream file(tmpPath, std::ios::trunc);
            if (!file) {
                throw core::PersistenceError("Failed to open " + tmpPath.string() + " for writing");
            }
            file << data.dump(2);
            file.flush();
            if (!file) {
                throw core::PersistenceError("Failed to write " + tmpPath.string());
            }
        }
        std::filesystem::rename(tmpPath, path_);
    } catch (const std::filesystem::filesystem_error& e) {
        std::error_code ignored;
        std::filesystem::remove(tmpPath, ignored);
        spdlog::error("Error saving devices: {}", e.what());
        throw core::PersistenceError(std::string("Failed to replace devices file: ") + e.what());
    } catch (const core::PersistenceError& e) {
        std::error_code ignored;
        std::filesystem::remove(tmpPath, ignored);
        spdlog::error("Error saving devices: {}", e.what());
        throw;
    }

    spdlog::debug("Saved {} devices to {}", devices.size(), path_.string());
}

void JsonDeviceStore::upsert(const core::Device& device) {
    auto devices = loadAll();
    auto it = std::find_if(devices.begin(), devices.end(),
                           [&device](const core::Device& d) { return d.id == device.id; });
    if (it != devices.end()) {
        *it = device;
    } else {
        devices.push_back(device);
    }
    saveAll(devices);
}

bool JsonDeviceStore::remove(const std::string& id) {
    auto devices = loadAll();
    auto it = std::remove_if(devices.begin(), devices.end(),
                             [&id](const core::Device& d) { return d.id == id; });
    if (it == devices.end()) {
        spdlog::warn("Device not found in store: {}", id);
        return false;
    }
    devices.erase(it, devices.end());
    saveAll(devices);
    return true;
}

nlohmann::json JsonDeviceStore::toJson(const core::Device& device) {
    nlohmann::json j;
    j["id"] = device.id;
    j["name"] = device.name;
    j["host"] = device.host;
    j["port"] = device.port;
    j["timeout_seconds"] = device.timeoutSeconds;
    j["enabled"] = device.enabled;
    j["status"] = device.statusToString();
    j["created_at"] = core::formatTimestamp(device.createdAt);
    if (device.lastCheckedAt) {
        j["last_checked_at"] = core::formatTimestamp(*device.lastCheckedAt);
    } else {
        j["last_checked_at"] = nullptr;
    }
    return j;
}

core::Device JsonDeviceStore::fromJson(const nlohmann::json& j) {
    core::Device device;
    device.id = j.at("id").get<std::string>();
    device.name = j.at("name").get<std::string>();
    device.host = j.at("host").get<std::string>();
    device.enabled = j.value("enabled", true);
    device.status = core::Device::statusFromString(j.value("status", "Unknown"));

    if (device.id.empty()) {
        throw std::invalid_argument("record has an empty id");
    }

    // Range checks run on the full width so large numbers cannot wrap into range.
    auto port = j.at("port").get<int64_t>();
    if (port < 1 || port > 65535) {
        throw std::invalid_argument("port out of range: " + std::to_string(port));
    }
    auto timeoutSeconds = j.value("timeout_seconds", int64_t{5});
    if (timeoutSeconds < core::DeviceValidator::MIN_TIMEOUT_SECONDS ||
        timeoutSeconds > core::DeviceValidator::MAX_TIMEOUT_SECONDS) {
        throw std::invalid_argument("timeout out of range: " + std::to_string(timeoutSeconds));
    }
    device.port = static_cast<int>(port);
    device.timeoutSeconds = static_cast<int>(timeoutSeconds);

    if (j.contains("created_at") && j["created_at"].is_string()) {
        if (auto createdAt = core::parseTimestamp(j["created_at"].get<std::string>())) {
            device.createdAt = *createdAt;
        }
    }
    if (j.contains("last_checked_at") && j["last_checked_at"].is_string()) {
        device.lastCheckedAt = core::parseTimestamp(j["last_checked_at"].get<std::string>());
    }

    return device;
}

} // namespace devmonitor::infra
