#include "agentswarm/engine/event_bus.hpp"
#include <algorithm>

namespace agentswarm {
namespace engine {

bool Subscription::offer(const Event& event) {
    if (sink_.try_push(event) == BoundedMailbox<Event>::push_result::accepted) {
        return true;
    }
    dropped_++;
    return false;
}

EventBus::~EventBus() {
    close();
}

subscription_ptr EventBus::subscribe() {
    auto sub = std::make_shared<Subscription>(subscriber_buffer_);
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) {
        sub->close();
        return sub;
    }
    subscribers_.push_back(sub);
    return sub;
}

void EventBus::unsubscribe(const subscription_ptr& sub) {
    if (!sub) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mu_);
        subscribers_.erase(std::remove(subscribers_.begin(), subscribers_.end(), sub),
                           subscribers_.end());
    }
    sub->close();
}

void EventBus::publish(const Event& event) {
    // Snapshot so slow sinks never hold the registry lock
    std::vector<subscription_ptr> targets;
    {
        std::lock_guard<std::mutex> lock(mu_);
        targets = subscribers_;
    }
    published_++;
    for (const auto& sub : targets) {
        if (!sub->offer(event)) {
            dropped_++;
        }
    }
}

void EventBus::close() {
    std::vector<subscription_ptr> targets;
    {
        std::lock_guard<std::mutex> lock(mu_);
        closed_ = true;
        targets.swap(subscribers_);
    }
    for (const auto& sub : targets) {
        sub->close();
    }
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return subscribers_.size();
}

} // namespace engine
} // namespace agentswarm
