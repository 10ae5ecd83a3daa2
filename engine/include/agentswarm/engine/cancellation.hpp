#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace agentswarm {
namespace engine {

class CancellationScope;

using cancellation_token = std::shared_ptr<CancellationScope>;

// Hierarchical cooperative cancellation. Cancelling a scope cancels every
// scope derived from it; cancelling a child leaves the parent untouched.
class CancellationScope : public std::enable_shared_from_this<CancellationScope> {
public:
    using callback_id = uint64_t;

    static cancellation_token make_root();

    ~CancellationScope();

    CancellationScope(const CancellationScope&) = delete;
    CancellationScope& operator=(const CancellationScope&) = delete;

    // Child scope, already cancelled if this scope is
    cancellation_token derive();

    // Idempotent. Callbacks run on the calling thread, outside the scope lock.
    void cancel();

    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    // Runs cb on cancellation. If already cancelled, runs it immediately and returns 0.
    callback_id on_cancel(std::function<void()> cb);

    void remove_callback(callback_id id);

private:
    CancellationScope() = default;

    std::atomic<bool> cancelled_{false};
    std::mutex mu_;
    callback_id next_id_ = 1;
    std::unordered_map<callback_id, std::function<void()>> callbacks_;

    // Link to the parent so the child's cancel hook is removed on destruction
    std::weak_ptr<CancellationScope> parent_;
    callback_id parent_hook_ = 0;
};

} // namespace engine
} // namespace agentswarm
