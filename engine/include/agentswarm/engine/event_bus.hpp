#pragma once

#include "agentswarm/engine/core.hpp"
#include "agentswarm/engine/mailbox.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace agentswarm {
namespace engine {

// A subscriber's private bounded sink. Events published while the sink is
// full are dropped for this subscriber only.
class Subscription {
public:
    explicit Subscription(size_t capacity) : sink_(capacity) {}

    caf::optional<Event> try_receive() { return sink_.try_pop(); }

    template <class Rep, class Period>
    caf::optional<Event> receive_for(std::chrono::duration<Rep, Period> timeout) {
        return sink_.pop_for(timeout);
    }

    bool closed() const { return sink_.closed(); }
    size_t pending() const { return sink_.size(); }
    uint64_t dropped() const { return dropped_.load(); }

private:
    friend class EventBus;

    // Returns false if the event was dropped
    bool offer(const Event& event);
    void close() { sink_.close(); }

    BoundedMailbox<Event> sink_;
    std::atomic<uint64_t> dropped_{0};
};

using subscription_ptr = std::shared_ptr<Subscription>;

// Best-effort multicast of events. Publish never blocks and never fails.
class EventBus {
public:
    explicit EventBus(size_t subscriber_buffer = 100) : subscriber_buffer_(subscriber_buffer) {}
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    subscription_ptr subscribe();

    // Removes and closes the sink; unknown subscriptions are ignored
    void unsubscribe(const subscription_ptr& sub);

    void publish(const Event& event);

    // Closes every sink. Later publishes reach nobody and later
    // subscriptions are handed out already closed.
    void close();

    size_t subscriber_count() const;
    uint64_t published_total() const { return published_.load(); }
    uint64_t dropped_total() const { return dropped_.load(); }

private:
    const size_t subscriber_buffer_;
    mutable std::mutex mu_;
    std::vector<subscription_ptr> subscribers_;
    bool closed_ = false;
    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace engine
} // namespace agentswarm
