#pragma once

#include "agentswarm/engine/cancellation.hpp"
#include <caf/none.hpp>
#include <caf/optional.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace agentswarm {
namespace engine {

// Bounded FIFO queue with non-blocking producers and a blocking consumer.
// Used as the actor mailbox and as the per-subscriber event sink.
template <class T>
class BoundedMailbox {
public:
    enum class push_result {
        accepted,
        full,
        closed
    };

    explicit BoundedMailbox(size_t capacity) : capacity_(capacity) {}

    BoundedMailbox(const BoundedMailbox&) = delete;
    BoundedMailbox& operator=(const BoundedMailbox&) = delete;

    // Never blocks
    push_result try_push(T item) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_) {
                return push_result::closed;
            }
            if (q_.size() >= capacity_) {
                return push_result::full;
            }
            q_.push_back(std::move(item));
        }
        cv_.notify_one();
        return push_result::accepted;
    }

    caf::optional<T> try_pop() {
        std::lock_guard<std::mutex> lk(mu_);
        if (q_.empty()) {
            return caf::none;
        }
        T item = std::move(q_.front());
        q_.pop_front();
        return item;
    }

    // Blocks until an item arrives, the scope is cancelled or the mailbox is closed.
    // Returns none on cancellation or close; remaining items stay queued.
    caf::optional<T> wait_pop(const CancellationScope& scope) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&] { return scope.is_cancelled() || closed_ || !q_.empty(); });
        if (scope.is_cancelled() || q_.empty()) {
            return caf::none;
        }
        T item = std::move(q_.front());
        q_.pop_front();
        return item;
    }

    // Blocks for at most `timeout`. Returns none on timeout or on a closed, drained mailbox.
    template <class Rep, class Period>
    caf::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait_for(lk, timeout, [&] { return closed_ || !q_.empty(); });
        if (q_.empty()) {
            return caf::none;
        }
        T item = std::move(q_.front());
        q_.pop_front();
        return item;
    }

    // Wakes blocked consumers so they can re-check their cancellation scope
    void wake() {
        std::lock_guard<std::mutex> lk(mu_);
        cv_.notify_all();
    }

    // Further pushes fail; queued items can still be popped
    void close() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<T> q_;
    bool closed_ = false;
};

} // namespace engine
} // namespace agentswarm
