/**
 * @file Events.hpp
 * @brief Event envelope and the payload types carried on the bus.
 */

#pragma once

#include "core/Errors.hpp"

#include <any>
#include <chrono>
#include <string>

namespace devmonitor::core {

/**
 * @brief A published event as seen by subscribers.
 *
 * The payload type depends on the topic (see bus/Topics.hpp); only the
 * controller and presentation code cast it back to a concrete type.
 */
struct Event {
    std::string topic;   ///< Semantic event name
    std::any payload;    ///< Topic-specific data, empty for payload-less commands
    std::chrono::system_clock::time_point publishedAt; ///< When publish() was called
};

/**
 * @brief Payload of "<command>_error" events.
 */
struct ErrorEvent {
    ErrorKind kind{ErrorKind::Validation}; ///< Failure category
    std::string message;                   ///< Human-readable reason
};

/**
 * @brief Payload of "handler_error" events.
 */
struct HandlerErrorEvent {
    std::string topic;   ///< Topic whose handler failed
    std::string message; ///< What the handler threw
};

} // namespace devmonitor::core
