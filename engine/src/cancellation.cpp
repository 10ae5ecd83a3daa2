#include "agentswarm/engine/cancellation.hpp"
#include <vector>

namespace agentswarm {
namespace engine {

cancellation_token CancellationScope::make_root() {
    return cancellation_token(new CancellationScope());
}

CancellationScope::~CancellationScope() {
    if (parent_hook_ != 0) {
        if (auto parent = parent_.lock()) {
            parent->remove_callback(parent_hook_);
        }
    }
}

cancellation_token CancellationScope::derive() {
    cancellation_token child(new CancellationScope());
    std::weak_ptr<CancellationScope> weak_child = child;
    auto hook = on_cancel([weak_child] {
        if (auto c = weak_child.lock()) {
            c->cancel();
        }
    });
    child->parent_ = shared_from_this();
    child->parent_hook_ = hook;
    return child;
}

void CancellationScope::cancel() {
    std::vector<std::function<void()>> to_run;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (cancelled_.load(std::memory_order_acquire)) {
            return;
        }
        cancelled_.store(true, std::memory_order_release);
        to_run.reserve(callbacks_.size());
        for (auto& entry : callbacks_) {
            to_run.push_back(std::move(entry.second));
        }
        callbacks_.clear();
    }
    for (auto& cb : to_run) {
        cb();
    }
}

CancellationScope::callback_id CancellationScope::on_cancel(std::function<void()> cb) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!cancelled_.load(std::memory_order_acquire)) {
            auto id = next_id_++;
            callbacks_.emplace(id, std::move(cb));
            return id;
        }
    }
    cb();
    return 0;
}

void CancellationScope::remove_callback(callback_id id) {
    if (id == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mu_);
    callbacks_.erase(id);
}

} // namespace engine
} // namespace agentswarm
