/**
 * @file Errors.hpp
 * @brief Exception hierarchy for command-level failures.
 *
 * Check failures and subscriber failures are not represented here: they are
 * reported as data (CheckResult::error, handler_error events).
 */

#pragma once

#include <stdexcept>
#include <string>

namespace devmonitor::core {

/**
 * @brief Category of a failure surfaced to a command initiator.
 */
enum class ErrorKind : int {
    Validation = 0,
    DuplicateDevice = 1,
    NotFound = 2,
    Persistence = 3
};

/**
 * @brief Converts an ErrorKind to its event name ("ValidationError", ...).
 */
std::string errorKindToString(ErrorKind kind);

/**
 * @brief Base class of all DevMonitor command failures.
 */
class DevMonitorError : public std::runtime_error {
public:
    DevMonitorError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/// Malformed device parameters or command payload.
class ValidationError : public DevMonitorError {
public:
    explicit ValidationError(const std::string& message)
        : DevMonitorError(ErrorKind::Validation, message) {}
};

/// The (host, port) endpoint is already monitored.
class DuplicateDeviceError : public DevMonitorError {
public:
    explicit DuplicateDeviceError(const std::string& message)
        : DevMonitorError(ErrorKind::DuplicateDevice, message) {}
};

/// The referenced device id is not in the registry.
class NotFoundError : public DevMonitorError {
public:
    explicit NotFoundError(const std::string& message)
        : DevMonitorError(ErrorKind::NotFound, message) {}
};

/// The device store failed to read or write.
class PersistenceError : public DevMonitorError {
public:
    explicit PersistenceError(const std::string& message)
        : DevMonitorError(ErrorKind::Persistence, message) {}
};

} // namespace devmonitor::core
