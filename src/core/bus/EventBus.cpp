#include "core/bus/EventBus.hpp"

#include "core/bus/Topics.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace devmonitor::core {

EventBus::SubscriptionId EventBus::subscribe(const std::string& topic, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = nextSubscriptionId_++;
    subscriptions_.push_back({id, topic, std::move(handler)});
    spdlog::debug("Subscribed to '{}' (id={})", topic, id);
    return id;
}

void EventBus::unsubscribe(SubscriptionId subscriptionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::remove_if(subscriptions_.begin(), subscriptions_.end(),
                             [subscriptionId](const Subscription& sub) {
                                 return sub.id == subscriptionId;
                             });
    if (it == subscriptions_.end()) {
        return;
    }
    subscriptions_.erase(it, subscriptions_.end());
    spdlog::debug("Unsubscribed (id={})", subscriptionId);
}

void EventBus::publish(const std::string& topic, std::any payload) {
    std::vector<Handler> handlers;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& sub : subscriptions_) {
            if (sub.topic == topic) {
                handlers.push_back(sub.handler);
            }
        }
    }

    if (handlers.empty()) {
        spdlog::debug("Event '{}' published with no subscribers", topic);
        return;
    }

    Event event{topic, std::move(payload), std::chrono::system_clock::now()};

    for (const auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            reportHandlerError(topic, e.what());
        } catch (...) {
            reportHandlerError(topic, "non-standard exception");
        }
    }
}

size_t EventBus::subscriberCount(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(
        subscriptions_.begin(), subscriptions_.end(),
        [&topic](const Subscription& sub) { return sub.topic == topic; }));
}

void EventBus::reportHandlerError(const std::string& topic, const std::string& message) {
    spdlog::error("Error in event handler for '{}': {}", topic, message);

    // A failing handler_error subscriber is only logged.
    if (topic == topics::HANDLER_ERROR) {
        return;
    }
    publish(topics::HANDLER_ERROR, HandlerErrorEvent{topic, message});
}

} // namespace devmonitor::core
