#pragma once

#include "agentswarm/engine/coordinator.hpp"
#include "agentswarm/engine/core.hpp"
#include "agentswarm/engine/event_bus.hpp"
#include "agentswarm/engine/observability.hpp"
#include <caf/expected.hpp>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentswarm {
namespace engine {

struct WorkflowStep {
    std::string label;        // empty -> "step<N>", 1-based
    std::string description;
    nlohmann::json payload;
    int priority = 0;
    std::string task_id;      // empty -> "<workflow id>-<label>"
};

struct WorkflowOptions {
    int64_t step_timeout_ms = 60000;
    int64_t poll_interval_ms = 100;
    // Oldest abandoned ids are forgotten beyond this many
    size_t max_abandoned_tasks = 1000;
};

struct StepOutcome {
    std::string label;
    Result result;
    int64_t duration_ms = 0;
};

struct WorkflowResult {
    std::string workflow_id;
    std::string name;
    bool success = false;
    std::vector<StepOutcome> steps;                  // in execution order
    std::map<std::string, std::string> step_outputs; // label -> output
    std::string final_output;                        // output of the last step on success
    Result failure;                                  // set when success is false
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;
    std::chrono::milliseconds duration{0};

    nlohmann::json to_json() const;
};

/**
 * Sequential, context-threading workflow executor
 *
 * Each step is distributed through the coordinator and awaited on the
 * coordinator's event bus before the next one is built. The task of step N
 * carries "<label>_output" for every earlier step in its context. The first
 * failed or timed-out step ends the workflow.
 *
 * A timed-out step is abandoned, not interrupted: its actor may still finish
 * it. Terminal events for abandoned tasks seen by later waits are logged and
 * discarded.
 */
class WorkflowDriver {
public:
    WorkflowDriver(Coordinator& coordinator,
                   WorkflowOptions options = WorkflowOptions(),
                   std::shared_ptr<Observability> obs = nullptr);

    // Errors: invalid_argument for an empty workflow, duplicate labels or task
    // ids, an explicit task id that is still abandoned, or non-positive
    // timeouts; otherwise the distribution error of the step that could not be sent.
    // Workflow ids are "<name>-<n>" with n unique within the process.
    // Failed and timed-out steps are reported in the returned WorkflowResult.
    caf::expected<WorkflowResult> execute(const std::string& name, const std::vector<WorkflowStep>& steps);

    const WorkflowOptions& options() const { return options_; }

    std::set<std::string> abandoned_tasks() const;

    uint64_t late_results() const { return late_results_.load(); }

private:
    caf::expected<StepOutcome> run_step(const std::string& workflow_id, const std::string& label, Task task);

    // Polls the subscription until a terminal event for task_id or the deadline
    Result wait_for_result(Subscription& sub, const std::string& task_id,
                           const std::string& workflow_id, const std::string& label);

    void note_if_late(const Event& event, const std::string& workflow_id, const std::string& label);

    void remember_abandoned(const std::string& task_id);

    Coordinator& coordinator_;
    WorkflowOptions options_;
    std::shared_ptr<Observability> obs_;

    mutable std::mutex mu_;
    std::map<std::string, uint64_t> abandoned_; // task id -> abandon order
    uint64_t abandon_counter_ = 0;
    std::atomic<uint64_t> late_results_{0};
};

} // namespace engine
} // namespace agentswarm
