#include "agentswarm/engine/workflow.hpp"
#include "agentswarm/engine/errors.hpp"
#include "agentswarm/engine/result_converter.hpp"
#include <algorithm>

namespace agentswarm {
namespace engine {

namespace {

// Shared by every driver so task ids never collide on one coordinator
std::atomic<uint64_t> workflow_sequence{0};

int64_t epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

nlohmann::json WorkflowResult::to_json() const {
    nlohmann::json out;
    out["workflow_id"] = workflow_id;
    out["name"] = name;
    out["success"] = success;
    out["started_at_ms"] = epoch_ms(started_at);
    out["finished_at_ms"] = epoch_ms(finished_at);
    out["duration_ms"] = duration.count();

    nlohmann::json steps_json = nlohmann::json::array();
    for (const auto& step : steps) {
        nlohmann::json item = ResultConverter::to_json(step.result);
        item["label"] = step.label;
        item["duration_ms"] = step.duration_ms;
        steps_json.push_back(item);
    }
    out["steps"] = steps_json;
    out["step_outputs"] = step_outputs;

    if (success) {
        out["final_output"] = final_output;
    } else {
        out["failure"] = ResultConverter::to_json(failure);
    }
    return out;
}

WorkflowDriver::WorkflowDriver(Coordinator& coordinator,
                               WorkflowOptions options,
                               std::shared_ptr<Observability> obs)
    : coordinator_(coordinator),
      options_(options),
      obs_(obs ? std::move(obs) : std::make_shared<Observability>("workflow")) {}

std::set<std::string> WorkflowDriver::abandoned_tasks() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::set<std::string> ids;
    for (const auto& entry : abandoned_) {
        ids.insert(entry.first);
    }
    return ids;
}

caf::expected<WorkflowResult> WorkflowDriver::execute(const std::string& name,
                                                      const std::vector<WorkflowStep>& steps) {
    if (steps.empty()) {
        return make_error(swarm_errc::invalid_argument, "workflow " + name + " has no steps");
    }
    if (options_.step_timeout_ms <= 0 || options_.poll_interval_ms <= 0) {
        return make_error(swarm_errc::invalid_argument,
                          "workflow " + name + " needs positive step timeout and poll interval");
    }

    std::vector<std::string> labels;
    std::set<std::string> seen;
    std::set<std::string> explicit_ids;
    for (size_t i = 0; i < steps.size(); ++i) {
        auto label = steps[i].label.empty() ? "step" + std::to_string(i + 1) : steps[i].label;
        if (!seen.insert(label).second) {
            return make_error(swarm_errc::invalid_argument,
                              "workflow " + name + " has duplicate step label " + label);
        }
        labels.push_back(label);

        const auto& task_id = steps[i].task_id;
        if (task_id.empty()) {
            continue;
        }
        if (!explicit_ids.insert(task_id).second) {
            return make_error(swarm_errc::invalid_argument,
                              "workflow " + name + " has duplicate task id " + task_id);
        }
        std::lock_guard<std::mutex> lock(mu_);
        if (abandoned_.count(task_id) != 0) {
            return make_error(swarm_errc::invalid_argument,
                              "task id " + task_id + " belongs to an abandoned step");
        }
    }

    WorkflowResult wf;
    wf.workflow_id = name + "-" + std::to_string(++workflow_sequence);
    wf.name = name;
    wf.started_at = std::chrono::system_clock::now();
    auto start_time = std::chrono::steady_clock::now();

    auto finish = [&](const std::string& outcome) {
        wf.finished_at = std::chrono::system_clock::now();
        wf.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        obs_->record_workflow_run(outcome);
    };

    obs_->log_info("Workflow started", "", "", wf.workflow_id, "", {
        {"name", name},
        {"steps", std::to_string(steps.size())}
    });

    std::map<std::string, nlohmann::json> context;
    std::vector<std::string> completed_ids;

    for (size_t i = 0; i < steps.size(); ++i) {
        const auto& step = steps[i];
        const auto& label = labels[i];

        Task task;
        task.id = step.task_id.empty() ? wf.workflow_id + "-" + label : step.task_id;
        task.description = step.description;
        task.payload = step.payload;
        task.priority = step.priority;
        task.context = context;
        task.dependencies = completed_ids;

        auto outcome = run_step(wf.workflow_id, label, std::move(task));
        if (!outcome) {
            finish("error");
            obs_->log_error("Workflow aborted: step could not be distributed", "", "", wf.workflow_id, label, {
                {"error", describe(outcome.error())}
            });
            return outcome.error();
        }

        wf.steps.push_back(*outcome);
        const Result& result = outcome->result;

        if (!result.success()) {
            wf.success = false;
            wf.failure = result;
            finish(ResultConverter::status_to_string(result.status));
            obs_->log_error("Workflow failed", result.actor_id, result.task_id, wf.workflow_id, label, {
                {"status", ResultConverter::status_to_string(result.status)},
                {"error_code", ResultConverter::error_code_to_string(result.error_code)},
                {"error", result.data},
                {"skipped_steps", std::to_string(steps.size() - i - 1)}
            });
            return wf;
        }

        wf.step_outputs[label] = result.data;
        context[label + "_output"] = result.data;
        completed_ids.push_back(result.task_id);
        wf.final_output = result.data;
    }

    wf.success = true;
    finish("success");
    obs_->log_info("Workflow completed", "", "", wf.workflow_id, "", {
        {"name", name},
        {"duration_ms", std::to_string(wf.duration.count())}
    });
    return wf;
}

caf::expected<StepOutcome> WorkflowDriver::run_step(const std::string& workflow_id,
                                                    const std::string& label,
                                                    Task task) {
    auto& bus = coordinator_.event_bus();
    const auto task_id = task.id;

    // Subscribe first so a fast terminal event cannot be missed
    auto sub = bus.subscribe();
    auto span = obs_->start_span("workflow.step", "", task_id, label);
    auto start_time = std::chrono::steady_clock::now();

    auto distributed = coordinator_.distribute(std::move(task));
    if (!distributed) {
        bus.unsubscribe(sub);
        obs_->end_span(span, false, describe(distributed.error()));
        return distributed.error();
    }

    obs_->log_info("Step distributed", *distributed, task_id, workflow_id, label);

    Result result = wait_for_result(*sub, task_id, workflow_id, label);
    bus.unsubscribe(sub);

    auto elapsed = std::chrono::steady_clock::now() - start_time;
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    obs_->record_step_duration(result.status, std::chrono::duration<double>(elapsed).count());
    obs_->end_span(span, result.success(), result.data);

    if (result.is_timeout()) {
        remember_abandoned(task_id);
        obs_->log_warn("Step timed out; task abandoned", *distributed, task_id, workflow_id, label, {
            {"timeout_ms", std::to_string(options_.step_timeout_ms)}
        });
    } else {
        obs_->log_info("Step finished", result.actor_id, task_id, workflow_id, label, {
            {"status", ResultConverter::status_to_string(result.status)},
            {"duration_ms", std::to_string(duration_ms)}
        });
    }

    StepOutcome outcome;
    outcome.label = label;
    outcome.result = std::move(result);
    outcome.duration_ms = duration_ms;
    return outcome;
}

Result WorkflowDriver::wait_for_result(Subscription& sub,
                                       const std::string& task_id,
                                       const std::string& workflow_id,
                                       const std::string& label) {
    const auto deadline = std::chrono::steady_clock::now()
        + std::chrono::milliseconds(options_.step_timeout_ms);
    const std::chrono::steady_clock::duration poll = std::chrono::milliseconds(options_.poll_interval_ms);

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }

        auto event = sub.receive_for(std::min(poll, deadline - now));
        if (!event) {
            if (sub.closed()) {
                return Result::cancelled_result(task_id, "event bus closed while waiting");
            }
            continue;
        }
        if (!event->is_terminal()) {
            continue;
        }
        if (event->task_id != task_id) {
            note_if_late(*event, workflow_id, label);
            continue;
        }

        if (const auto* result = event->result()) {
            return *result;
        }
        if (event->kind == EventKind::task_completed) {
            return Result::ok_result(task_id, event->message, event->actor_id);
        }
        return Result::error_result(task_id, ErrorCode::execution_failed, event->message, event->actor_id);
    }

    return Result::timeout_result(task_id, options_.step_timeout_ms);
}

void WorkflowDriver::remember_abandoned(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mu_);
    abandoned_[task_id] = ++abandon_counter_;
    while (abandoned_.size() > options_.max_abandoned_tasks) {
        auto oldest = std::min_element(abandoned_.begin(), abandoned_.end(),
                                       [](const std::pair<const std::string, uint64_t>& a,
                                          const std::pair<const std::string, uint64_t>& b) {
                                           return a.second < b.second;
                                       });
        abandoned_.erase(oldest);
    }
}

void WorkflowDriver::note_if_late(const Event& event, const std::string& workflow_id, const std::string& label) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (abandoned_.erase(event.task_id) == 0) {
            return;
        }
    }
    late_results_++;
    obs_->record_late_result();
    obs_->log_warn("Late result discarded", event.actor_id, event.task_id, workflow_id, label, {
        {"event", ResultConverter::event_kind_to_string(event.kind)}
    });
}

} // namespace engine
} // namespace agentswarm
