#pragma once

#include "core/types/Device.hpp"

#include <cstddef>
#include <string>

namespace devmonitor::core {

/**
 * @brief Syntax checks for device input.
 *
 * Each validate* function returns the normalized value (trimmed where that
 * applies) or throws ValidationError with a message suitable for the user.
 */
class DeviceValidator {
public:
    static constexpr size_t MAX_NAME_LENGTH = 50;
    static constexpr int MIN_TIMEOUT_SECONDS = 1;
    static constexpr int MAX_TIMEOUT_SECONDS = 300;

    static std::string validateName(const std::string& name);

    /**
     * @brief Accepts an IPv4 or IPv6 literal, or an RFC 1123 hostname.
     */
    static std::string validateHost(const std::string& host);

    static int validatePort(int port);
    static int validateTimeout(int timeoutSeconds);

    /**
     * @brief Validates every field of a spec.
     * @return A copy of the input with normalized name and host.
     * @throws ValidationError on the first invalid field.
     */
    static DeviceSpec validate(const DeviceSpec& spec);

    [[nodiscard]] static bool isIpAddress(const std::string& host);
};

} // namespace devmonitor::core
