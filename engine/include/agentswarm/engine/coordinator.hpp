#pragma once

#include "agentswarm/engine/actor.hpp"
#include "agentswarm/engine/cancellation.hpp"
#include "agentswarm/engine/event_bus.hpp"
#include "agentswarm/engine/observability.hpp"
#include <caf/expected.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentswarm {
namespace engine {

using actor_ptr = std::shared_ptr<Actor>;

/**
 * Actor registry and router
 *
 * Owns one EventBus and the registry (id -> actor). Routing is a round-robin
 * cursor over registration order that skips stopped actors.
 */
class Coordinator {
public:
    explicit Coordinator(size_t subscriber_buffer = 100,
                         std::shared_ptr<Observability> obs = nullptr);

    // Stops every actor still registered
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // Fails with duplicate_id; the actor is not started.
    // Actors without a bus get the coordinator's bus attached.
    caf::expected<void> register_actor(actor_ptr actor);

    // Stops the actor, then removes it. Fails with not_found.
    caf::expected<void> deregister(const std::string& id);

    // Starts every registered actor under one shared scope derived from parent.
    // Partial starts are not rolled back.
    caf::expected<void> start_all(const cancellation_token& parent);

    // Cancels the shared scope, then stops every actor
    caf::expected<void> stop_all();

    // Sends the task to the next live actor. Fails with no_available_actor,
    // or with the chosen actor's send error.
    caf::expected<std::string> distribute(Task task);

    // Same message to every actor, tagged broadcast
    caf::expected<void> broadcast(Message msg);

    // Direct send to one named actor
    caf::expected<void> send(const std::string& from, const std::string& to, Message msg);

    // Point-in-time snapshot
    std::map<std::string, ActorState> status() const;

    // Registration order
    std::vector<std::string> list_actors() const;

    // Fails with not_found
    caf::expected<actor_ptr> get_actor(const std::string& id) const;

    size_t size() const;

    EventBus& event_bus() { return bus_; }

    Observability& observability() { return *obs_; }

private:
    std::vector<actor_ptr> snapshot() const;
    actor_ptr find(const std::string& id) const;

    std::shared_ptr<Observability> obs_;
    EventBus bus_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, actor_ptr> actors_;
    std::vector<std::string> order_;
    size_t next_ = 0;
    cancellation_token scope_;
};

} // namespace engine
} // namespace agentswarm
