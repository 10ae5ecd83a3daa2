#include "agentswarm/engine/actor.hpp"
#include "agentswarm/engine/result_converter.hpp"
#include <chrono>
#include <exception>

namespace agentswarm {
namespace engine {

Actor::Actor(std::string id,
             EventBus* bus,
             std::shared_ptr<Observability> obs,
             size_t mailbox_capacity)
    : id_(std::move(id)),
      bus_(bus),
      obs_(obs ? std::move(obs) : std::make_shared<Observability>("actor")),
      mailbox_(std::make_shared<BoundedMailbox<Message>>(mailbox_capacity)) {}

Actor::~Actor() {
    auto res = stop();
    if (!res) {
        obs_->log_error("Actor destroyed without a clean stop", id_, "", "", "", {
            {"error", describe(res.error())}
        });
        if (worker_.joinable()) {
            worker_.detach();
        }
    }
}

ActorState Actor::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

caf::expected<void> Actor::start(const cancellation_token& parent) {
    if (!parent) {
        return make_error(swarm_errc::invalid_argument, "actor " + id_ + " needs a cancellation scope to start");
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != ActorState::idle) {
        return make_error(swarm_errc::already_running,
                          "actor " + id_ + " is " + ResultConverter::state_to_string(state_));
    }

    scope_ = parent->derive();
    // The mailbox is captured by value so a late cancel from the parent never touches a destroyed actor
    auto mailbox = mailbox_;
    scope_->on_cancel([mailbox] { mailbox->wake(); });

    state_ = ActorState::processing;
    // Shared owners are kept alive until the loop returns; empty when not owned by a shared_ptr
    worker_ = std::thread([this, scope = scope_, self = weak_from_this().lock()] {
        run_loop(scope);
    });

    obs_->log_info("Actor started", id_, "", "", "", {
        {"mailbox_capacity", std::to_string(mailbox_->capacity())}
    });
    return caf::unit;
}

caf::expected<void> Actor::stop() {
    std::lock_guard<std::mutex> stop_lock(stop_mutex_);

    cancellation_token scope;
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == ActorState::stopped) {
            return caf::unit;
        }
        if (worker_.joinable() && worker_.get_id() == std::this_thread::get_id()) {
            if (!loop_exited_.load()) {
                return make_error(swarm_errc::invalid_state,
                                  "actor " + id_ + " cannot stop itself from its own run loop");
            }
            // Last owner released by the finished loop thread; nothing left to join
            worker_.detach();
        }
        scope = scope_;
        worker = std::move(worker_);
    }

    if (scope) {
        scope->cancel();
    }
    if (worker.joinable()) {
        worker.join();
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = ActorState::stopped;
        scope_.reset();
    }
    mailbox_->close();

    obs_->log_info("Actor stopped", id_, "", "", "", {
        {"unprocessed_messages", std::to_string(mailbox_->size())}
    });
    return caf::unit;
}

caf::expected<void> Actor::send(Message msg) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == ActorState::stopped) {
            obs_->record_mailbox_rejection(id_, "stopped");
            return make_error(swarm_errc::stopped, "actor " + id_ + " is stopped");
        }
    }

    switch (mailbox_->try_push(std::move(msg))) {
        case BoundedMailbox<Message>::push_result::accepted:
            return caf::unit;
        case BoundedMailbox<Message>::push_result::full:
            obs_->record_mailbox_rejection(id_, "full");
            return make_error(swarm_errc::mailbox_full,
                              "actor " + id_ + " mailbox is full (capacity "
                              + std::to_string(mailbox_->capacity()) + ")");
        case BoundedMailbox<Message>::push_result::closed:
            break;
    }
    obs_->record_mailbox_rejection(id_, "stopped");
    return make_error(swarm_errc::stopped, "actor " + id_ + " is stopped");
}

caf::optional<Message> Actor::try_receive() {
    return mailbox_->try_pop();
}

void Actor::register_handler(MessageType type, message_handler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_[type] = std::move(handler);
}

Result Actor::process_task(const Task& task) {
    return Result::ok_result(task.id, "Actor " + id_ + " processed task " + task.id, id_);
}

void Actor::attach_event_bus(EventBus* bus) {
    EventBus* expected = nullptr;
    bus_.compare_exchange_strong(expected, bus);
}

void Actor::publish(EventKind kind, const std::string& task_id, const std::string& message,
                    std::variant<std::monostate, Result, nlohmann::json> data) {
    auto* bus = bus_.load();
    if (bus == nullptr) {
        return;
    }
    Event event;
    event.kind = kind;
    event.actor_id = id_;
    event.task_id = task_id;
    event.message = message;
    event.data = std::move(data);
    bus->publish(event);
    obs_->record_bus_drops(bus->dropped_total());
}

void Actor::run_loop(cancellation_token scope) {
    obs_->log_debug("Run loop entered", id_);
    while (!scope->is_cancelled()) {
        auto msg = mailbox_->wait_pop(*scope);
        if (!msg) {
            break;
        }
        handle_message(*msg);
    }
    loop_exited_ = true;
    obs_->log_debug("Run loop exited", id_, "", "", "", {
        {"pending", std::to_string(mailbox_->size())}
    });
}

void Actor::handle_message(const Message& msg) {
    message_handler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = handlers_.find(msg.type);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }

    if (!handler) {
        if (const auto* task = std::get_if<Task>(&msg.payload)) {
            handle_task_default(*task);
        } else {
            obs_->log_info("Message received", id_, "", "", "", {
                {"type", ResultConverter::message_type_to_string(msg.type)},
                {"sender", msg.sender}
            });
        }
        return;
    }

    try {
        auto res = handler(msg);
        if (!res) {
            report_handler_failure(msg, describe(res.error()));
        }
    } catch (const std::exception& e) {
        report_handler_failure(msg, std::string("handler threw: ") + e.what());
    } catch (...) {
        report_handler_failure(msg, "handler threw a non-standard exception");
    }
}

void Actor::handle_task_default(const Task& task) {
    publish(EventKind::task_received, task.id, "Task received: " + task.description);

    auto span = obs_->start_span("actor.process_task", id_, task.id);
    auto start_time = std::chrono::steady_clock::now();
    publish(EventKind::task_started, task.id, "Processing task: " + task.description);

    Result result;
    try {
        result = process_task(task);
    } catch (const std::exception& e) {
        obs_->record_handler_error(id_);
        result = Result::error_result(task.id, ErrorCode::execution_failed,
                                      std::string("process_task threw: ") + e.what(), id_);
    } catch (...) {
        obs_->record_handler_error(id_);
        result = Result::error_result(task.id, ErrorCode::execution_failed,
                                      "process_task threw a non-standard exception", id_);
    }

    auto latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    if (result.task_id.empty()) {
        result.task_id = task.id;
    }
    if (result.actor_id.empty()) {
        result.actor_id = id_;
    }
    if (result.latency_ms == 0) {
        result.latency_ms = latency_ms;
    }

    obs_->record_task_result(id_, result.status);
    obs_->end_span(span, result.success(), result.data);

    if (result.success()) {
        obs_->log_info("Task completed", id_, task.id, "", "", {
            {"latency_ms", std::to_string(result.latency_ms)}
        });
        publish(EventKind::task_completed, task.id, "Task completed: " + task.description, result);
    } else {
        obs_->log_error("Task failed", id_, task.id, "", "", {
            {"status", ResultConverter::status_to_string(result.status)},
            {"error_code", ResultConverter::error_code_to_string(result.error_code)},
            {"error", result.data}
        });
        publish(EventKind::task_failed, task.id, "Task failed: " + result.data, result);
    }
}

void Actor::report_handler_failure(const Message& msg, const std::string& description) {
    obs_->record_handler_error(id_);

    std::string task_id;
    if (const auto* task = std::get_if<Task>(&msg.payload)) {
        task_id = task->id;
    }

    obs_->log_error("Message handler failed", id_, task_id, "", "", {
        {"type", ResultConverter::message_type_to_string(msg.type)},
        {"sender", msg.sender},
        {"error", description}
    });

    if (!task_id.empty()) {
        publish(EventKind::task_failed, task_id, "Handler failed: " + description,
                Result::error_result(task_id, ErrorCode::handler_failed, description, id_));
    } else {
        publish(EventKind::custom, "", "Handler failed: " + description, nlohmann::json{
            {"type", ResultConverter::message_type_to_string(msg.type)},
            {"sender", msg.sender},
            {"error", description}
        });
    }
}

} // namespace engine
} // namespace agentswarm
