#pragma once

#include "agentswarm/engine/coordinator.hpp"
#include "agentswarm/engine/core.hpp"
#include "agentswarm/engine/observability.hpp"
#include "agentswarm/engine/retry_policy.hpp"
#include "agentswarm/engine/workflow.hpp"
#include <caf/expected.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentswarm {
namespace engine {

// A batch of independent tasks handed to the coordinator in one go
struct Scenario {
    std::string name;
    std::string description;
    std::vector<Task> tasks;
};

// research-001 -> analyze-001 -> report-001 (dependencies are advisory)
Scenario research_analysis_scenario(const std::string& topic);

// parallel-001 .. parallel-NNN
Scenario parallel_processing_scenario(int count);

// stress-0001 .. stress-NNNN, priorities cycling 1..3
Scenario stress_test_scenario(int count);

// "research" | "parallel" | "stress". Empty topic and non-positive count select
// the defaults ("artificial intelligence", 10 and 50).
caf::expected<Scenario> make_scenario(const std::string& name, const std::string& topic, int count);

// Three dependent steps for the workflow driver: research, analysis, report
std::vector<WorkflowStep> research_workflow_steps(const std::string& topic);

struct ScenarioOptions {
    int64_t timeout_ms = 60000;             // wait for terminal events after distribution
    int64_t poll_interval_ms = 100;
    int64_t distribute_interval_ms = 0;     // pause between two distributions
    bool wait_for_completion = true;
    RetryPolicy::Config retry;              // applied to mailbox_full rejections
    std::function<void(size_t, size_t)> progress;  // (distributed, total)
};

struct ScenarioReport {
    std::string name;
    size_t total = 0;
    std::vector<std::string> distributed;           // in distribution order
    std::map<std::string, std::string> assignments; // task id -> actor id
    std::vector<std::string> completed;             // in completion order
    std::vector<std::string> failed;
    std::vector<std::string> pending;               // no terminal event before the deadline
    std::chrono::milliseconds duration{0};

    bool all_completed() const { return completed.size() == total; }

    nlohmann::json to_json() const;
};

// Distributes every task, then (optionally) waits on the coordinator's bus
// until each one reached a terminal event or the timeout expired.
// A task that cannot be distributed aborts the run with the distribution error.
caf::expected<ScenarioReport> execute_scenario(Coordinator& coordinator,
                                               const Scenario& scenario,
                                               const ScenarioOptions& options = ScenarioOptions(),
                                               std::shared_ptr<Observability> obs = nullptr);

} // namespace engine
} // namespace agentswarm
