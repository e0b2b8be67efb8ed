#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace devmonitor::core {

/**
 * @brief Formats a time point as an ISO 8601 UTC string ("2024-01-31T12:00:00Z").
 */
std::string formatTimestamp(std::chrono::system_clock::time_point tp);

/**
 * @brief Parses a string produced by formatTimestamp().
 * @return The time point, or nullopt if the string is not in the expected format.
 */
std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& str);

} // namespace devmonitor::core
