#pragma once

#include "agentswarm/engine/core.hpp"
#include "agentswarm/engine/cancellation.hpp"
#include "agentswarm/engine/errors.hpp"
#include "agentswarm/engine/event_bus.hpp"
#include "agentswarm/engine/mailbox.hpp"
#include "agentswarm/engine/observability.hpp"
#include <caf/expected.hpp>
#include <caf/optional.hpp>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace agentswarm {
namespace engine {

/**
 * Actor with a private bounded mailbox and one run-loop thread
 *
 * Lifecycle: idle -> processing (start) -> stopped (stop, terminal).
 * Messages are handled strictly one at a time in send order, so handler
 * code may touch actor-local fields without locking.
 *
 * An actor owned by a shared_ptr stays alive while its run loop is running,
 * even if every other owner lets go from inside a handler; it is destroyed on
 * the loop thread once the loop exits. An actor not owned by a shared_ptr
 * must outlive its run loop.
 */
class Actor : public std::enable_shared_from_this<Actor> {
public:
    using message_handler = std::function<caf::expected<void>(const Message&)>;

    // bus is borrowed and may be null; a private Observability is created when obs is null
    Actor(std::string id,
          EventBus* bus = nullptr,
          std::shared_ptr<Observability> obs = nullptr,
          size_t mailbox_capacity = 100);

    virtual ~Actor();

    Actor(const Actor&) = delete;
    Actor& operator=(const Actor&) = delete;

    const std::string& id() const { return id_; }

    ActorState state() const;

    // Non-blocking. Fails with already_running unless idle.
    caf::expected<void> start(const cancellation_token& parent);

    // Idempotent. Waits for the run loop to exit, then closes the mailbox.
    caf::expected<void> stop();

    // Never blocks. Fails with stopped or mailbox_full.
    caf::expected<void> send(Message msg);

    // Direct poll that bypasses the run loop
    caf::optional<Message> try_receive();

    // Last registration for a type wins
    void register_handler(MessageType type, message_handler handler);

    // Default work: trivially succeeds. Specialized actors override this.
    virtual Result process_task(const Task& task);

    // Used by the coordinator to hand its bus to actors created without one.
    // No-op when a bus is already attached.
    void attach_event_bus(EventBus* bus);

    EventBus* event_bus() const { return bus_.load(); }

    size_t pending_messages() const { return mailbox_->size(); }

    size_t mailbox_capacity() const { return mailbox_->capacity(); }

protected:
    void publish(EventKind kind, const std::string& task_id, const std::string& message,
                 std::variant<std::monostate, Result, nlohmann::json> data = std::monostate{});

    Observability& observability() { return *obs_; }

private:
    void run_loop(cancellation_token scope);
    void handle_message(const Message& msg);
    void handle_task_default(const Task& task);
    void report_handler_failure(const Message& msg, const std::string& description);

    const std::string id_;
    std::atomic<EventBus*> bus_;
    std::shared_ptr<Observability> obs_;
    std::shared_ptr<BoundedMailbox<Message>> mailbox_;

    mutable std::mutex state_mutex_;
    ActorState state_ = ActorState::idle;
    cancellation_token scope_;
    std::thread worker_;
    std::atomic<bool> loop_exited_{false};

    // Serializes stop() callers; never held by the run loop
    std::mutex stop_mutex_;

    std::mutex handlers_mutex_;
    std::map<MessageType, message_handler> handlers_;
};

} // namespace engine
} // namespace agentswarm
