#include "agentswarm/engine/coordinator.hpp"
#include <algorithm>

namespace agentswarm {
namespace engine {

namespace {

// One multiple_failures error listing every "<actor id>: <error>" pair
caf::error aggregate_failures(const std::string& operation, const std::vector<std::string>& failures) {
    std::string context = operation + " failed for " + std::to_string(failures.size()) + " actor(s): ";
    for (size_t i = 0; i < failures.size(); ++i) {
        if (i > 0) {
            context += "; ";
        }
        context += failures[i];
    }
    return make_error(swarm_errc::multiple_failures, std::move(context));
}

} // namespace

Coordinator::Coordinator(size_t subscriber_buffer, std::shared_ptr<Observability> obs)
    : obs_(obs ? std::move(obs) : std::make_shared<Observability>("coordinator")),
      bus_(subscriber_buffer) {}

Coordinator::~Coordinator() {
    auto res = stop_all();
    if (!res) {
        obs_->log_error("Coordinator shut down with actor stop failures", "", "", "", "", {
            {"error", describe(res.error())}
        });
    }
    bus_.close();
}

caf::expected<void> Coordinator::register_actor(actor_ptr actor) {
    if (!actor) {
        return make_error(swarm_errc::invalid_argument, "cannot register a null actor");
    }
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (actors_.count(actor->id()) > 0) {
            return make_error(swarm_errc::duplicate_id, "actor " + actor->id() + " already registered");
        }
        actor->attach_event_bus(&bus_);
        actors_.emplace(actor->id(), actor);
        order_.push_back(actor->id());
    }
    obs_->log_info("Actor registered", actor->id());
    return caf::unit;
}

caf::expected<void> Coordinator::deregister(const std::string& id) {
    auto actor = find(id);
    if (!actor) {
        return make_error(swarm_errc::not_found, "actor " + id + " is not registered");
    }

    // Stop outside the registry lock: it blocks until the run loop exits
    auto res = actor->stop();
    if (!res) {
        return res.error();
    }

    {
        std::lock_guard<std::mutex> lock(mu_);
        actors_.erase(id);
        auto it = std::find(order_.begin(), order_.end(), id);
        if (it != order_.end()) {
            auto index = static_cast<size_t>(std::distance(order_.begin(), it));
            order_.erase(it);
            if (index < next_) {
                next_--;
            }
            if (next_ >= order_.size()) {
                next_ = 0;
            }
        }
    }
    obs_->log_info("Actor deregistered", id);
    return caf::unit;
}

caf::expected<void> Coordinator::start_all(const cancellation_token& parent) {
    if (!parent) {
        return make_error(swarm_errc::invalid_argument, "start_all needs a cancellation scope");
    }

    cancellation_token scope;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!scope_ || scope_->is_cancelled()) {
            scope_ = parent->derive();
        }
        scope = scope_;
    }

    std::vector<std::string> failures;
    for (const auto& actor : snapshot()) {
        auto res = actor->start(scope);
        if (!res) {
            failures.push_back(actor->id() + ": " + describe(res.error()));
        }
    }

    if (!failures.empty()) {
        auto err = aggregate_failures("start", failures);
        obs_->log_error("Some actors failed to start", "", "", "", "", {
            {"error", describe(err)}
        });
        return err;
    }

    obs_->log_info("All actors started", "", "", "", "", {
        {"actors", std::to_string(size())}
    });
    return caf::unit;
}

caf::expected<void> Coordinator::stop_all() {
    cancellation_token scope;
    {
        std::lock_guard<std::mutex> lock(mu_);
        scope = scope_;
    }
    if (scope) {
        scope->cancel();
    }

    std::vector<std::string> failures;
    for (const auto& actor : snapshot()) {
        auto res = actor->stop();
        if (!res) {
            failures.push_back(actor->id() + ": " + describe(res.error()));
        }
    }

    if (!failures.empty()) {
        return aggregate_failures("stop", failures);
    }
    return caf::unit;
}

caf::expected<std::string> Coordinator::distribute(Task task) {
    actor_ptr chosen;
    {
        std::lock_guard<std::mutex> lock(mu_);
        for (size_t i = 0; i < order_.size(); ++i) {
            size_t index = (next_ + i) % order_.size();
            const auto& candidate = actors_.at(order_[index]);
            if (candidate->state() != ActorState::stopped) {
                chosen = candidate;
                next_ = (index + 1) % order_.size();
                break;
            }
        }
    }

    if (!chosen) {
        obs_->record_distribution("no_available_actor");
        obs_->log_warn("No available actor for task", "", task.id);
        return make_error(swarm_errc::no_available_actor, "no live actor for task " + task.id);
    }

    auto task_id = task.id;
    auto res = chosen->send(Message::for_task("coordinator", chosen->id(), std::move(task)));
    if (!res) {
        obs_->record_distribution("rejected");
        obs_->log_warn("Task rejected by actor", chosen->id(), task_id, "", "", {
            {"error", describe(res.error())}
        });
        return res.error();
    }

    obs_->record_distribution("accepted");
    obs_->log_debug("Task distributed", chosen->id(), task_id);
    return chosen->id();
}

caf::expected<void> Coordinator::broadcast(Message msg) {
    msg.type = MessageType::broadcast;

    std::vector<std::string> failures;
    for (const auto& actor : snapshot()) {
        Message copy = msg;
        copy.recipient = actor->id();
        auto res = actor->send(std::move(copy));
        if (!res) {
            failures.push_back(actor->id() + ": " + describe(res.error()));
        }
    }

    if (!failures.empty()) {
        return aggregate_failures("broadcast", failures);
    }
    return caf::unit;
}

caf::expected<void> Coordinator::send(const std::string& from, const std::string& to, Message msg) {
    auto actor = find(to);
    if (!actor) {
        return make_error(swarm_errc::not_found, "actor " + to + " is not registered");
    }
    msg.sender = from;
    msg.recipient = to;
    return actor->send(std::move(msg));
}

std::map<std::string, ActorState> Coordinator::status() const {
    std::map<std::string, ActorState> snapshot_states;
    for (const auto& actor : snapshot()) {
        snapshot_states[actor->id()] = actor->state();
    }
    return snapshot_states;
}

std::vector<std::string> Coordinator::list_actors() const {
    std::lock_guard<std::mutex> lock(mu_);
    return order_;
}

size_t Coordinator::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return actors_.size();
}

std::vector<actor_ptr> Coordinator::snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<actor_ptr> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        result.push_back(actors_.at(id));
    }
    return result;
}

caf::expected<actor_ptr> Coordinator::get_actor(const std::string& id) const {
    auto actor = find(id);
    if (!actor) {
        return make_error(swarm_errc::not_found, "actor " + id + " is not registered");
    }
    return actor;
}

actor_ptr Coordinator::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = actors_.find(id);
    return it == actors_.end() ? nullptr : it->second;
}

} // namespace engine
} // namespace agentswarm
