#include "core/types/Device.hpp"

namespace devmonitor::core {

std::string Device::endpoint() const {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

std::string Device::statusToString() const {
    return statusToString(status);
}

std::string Device::statusToString(DeviceStatus status) {
    switch (status) {
    case DeviceStatus::Unknown:
        return "Unknown";
    case DeviceStatus::Online:
        return "Online";
    case DeviceStatus::Offline:
        return "Offline";
    }
    return "Unknown";
}

DeviceStatus Device::statusFromString(const std::string& str) {
    if (str == "Online")
        return DeviceStatus::Online;
    if (str == "Offline")
        return DeviceStatus::Offline;
    return DeviceStatus::Unknown;
}

} // namespace devmonitor::core
