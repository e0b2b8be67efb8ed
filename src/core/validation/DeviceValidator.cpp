#include "core/validation/DeviceValidator.hpp"

#include "core/Errors.hpp"

#include <spdlog/fmt/fmt.h>

#include <arpa/inet.h>
#include <netinet/in.h>

#include <regex>

namespace devmonitor::core {

namespace {

const std::regex NAME_PATTERN(R"(^[a-zA-Z0-9_\-\.]+$)");
const std::regex HOSTNAME_LABEL_PATTERN(R"(^[a-zA-Z0-9]([a-zA-Z0-9\-]{0,61}[a-zA-Z0-9])?$)");
const std::regex DOTTED_NUMERIC_PATTERN(R"(^[0-9\.]+$)");

std::string trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    auto begin = str.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return {};
    }
    auto end = str.find_last_not_of(whitespace);
    return str.substr(begin, end - begin + 1);
}

bool isValidHostname(const std::string& host) {
    if (host.size() > 253) {
        return false;
    }

    size_t start = 0;
    while (start <= host.size()) {
        auto dot = host.find('.', start);
        auto label = host.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!std::regex_match(label, HOSTNAME_LABEL_PATTERN)) {
            return false;
        }
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return true;
}

} // namespace

std::string DeviceValidator::validateName(const std::string& name) {
    auto trimmed = trim(name);
    if (trimmed.empty()) {
        throw ValidationError("Device name cannot be empty");
    }
    if (trimmed.size() > MAX_NAME_LENGTH) {
        throw ValidationError(
            fmt::format("Device name cannot exceed {} characters", MAX_NAME_LENGTH));
    }
    if (!std::regex_match(trimmed, NAME_PATTERN)) {
        throw ValidationError("Device name contains invalid characters");
    }
    return trimmed;
}

std::string DeviceValidator::validateHost(const std::string& host) {
    auto trimmed = trim(host);
    if (trimmed.empty()) {
        throw ValidationError("Host cannot be empty");
    }
    if (isIpAddress(trimmed)) {
        return trimmed;
    }
    // All-numeric names that failed to parse are malformed IPv4 ("300.1.1.1").
    if (std::regex_match(trimmed, DOTTED_NUMERIC_PATTERN) || !isValidHostname(trimmed)) {
        throw ValidationError(fmt::format("Invalid host: {}", trimmed));
    }
    return trimmed;
}

int DeviceValidator::validatePort(int port) {
    if (port < 1 || port > 65535) {
        throw ValidationError(fmt::format("Port must be between 1 and 65535, got {}", port));
    }
    return port;
}

int DeviceValidator::validateTimeout(int timeoutSeconds) {
    if (timeoutSeconds < MIN_TIMEOUT_SECONDS) {
        throw ValidationError(fmt::format("Timeout must be at least {} second, got {}",
                                          MIN_TIMEOUT_SECONDS, timeoutSeconds));
    }
    if (timeoutSeconds > MAX_TIMEOUT_SECONDS) {
        throw ValidationError(fmt::format("Timeout cannot exceed {} seconds, got {}",
                                          MAX_TIMEOUT_SECONDS, timeoutSeconds));
    }
    return timeoutSeconds;
}

DeviceSpec DeviceValidator::validate(const DeviceSpec& spec) {
    DeviceSpec validated = spec;
    validated.name = validateName(spec.name);
    validated.host = validateHost(spec.host);
    validated.port = validatePort(spec.port);
    validated.timeoutSeconds = validateTimeout(spec.timeoutSeconds);
    return validated;
}

bool DeviceValidator::isIpAddress(const std::string& host) {
    in_addr v4{};
    in6_addr v6{};
    return inet_pton(AF_INET, host.c_str(), &v4) == 1 || inet_pton(AF_INET6, host.c_str(), &v6) == 1;
}

} // namespace devmonitor::core
