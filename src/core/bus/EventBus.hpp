#pragma once

#include "core/types/Events.hpp"

#include <any>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace devmonitor::core {

/**
 * @brief In-process publish/subscribe bus keyed by topic name.
 *
 * Handlers for a topic are invoked synchronously on the publishing thread in
 * subscription order. Each invocation is isolated: a handler that throws is
 * logged and reported on the "handler_error" topic, and delivery continues with
 * the next handler. Nothing is stored, so late subscribers never see past events.
 *
 * Thread-safe. Handlers may publish, subscribe or unsubscribe while being
 * delivered to; the subscriber list is snapshotted before each delivery.
 */
class EventBus {
public:
    using SubscriptionId = int64_t;
    using Handler = std::function<void(const Event&)>;

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Registers a handler for a topic.
     * @param topic Topic to listen on.
     * @param handler Function called for every event published on the topic.
     * @return Subscription ID for later unsubscription.
     */
    SubscriptionId subscribe(const std::string& topic, Handler handler);

    /**
     * @brief Removes a subscription. Unknown or already removed IDs are ignored.
     * @param subscriptionId ID returned from subscribe().
     */
    void unsubscribe(SubscriptionId subscriptionId);

    /**
     * @brief Delivers an event to every current subscriber of the topic.
     * @param topic Topic to publish on.
     * @param payload Topic-specific payload (may be empty).
     */
    void publish(const std::string& topic, std::any payload = {});

    /**
     * @brief Returns the number of handlers subscribed to a topic.
     */
    [[nodiscard]] size_t subscriberCount(const std::string& topic) const;

private:
    struct Subscription {
        SubscriptionId id;
        std::string topic;
        Handler handler;
    };

    void reportHandlerError(const std::string& topic, const std::string& message);

    mutable std::mutex mutex_;
    std::vector<Subscription> subscriptions_;
    std::atomic<SubscriptionId> nextSubscriptionId_{1};
};

} // namespace devmonitor::core
