#include "agentswarm/engine/scenarios.hpp"
#include "agentswarm/engine/errors.hpp"
#include <algorithm>
#include <cstdio>
#include <map>
#include <set>
#include <thread>

namespace agentswarm {
namespace engine {

namespace {

std::string numbered(const char* prefix, int width, int n) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%s-%0*d", prefix, width, n);
    return std::string(buf);
}

std::string research_description(const std::string& topic) {
    return "Research the topic: " + topic
        + ". Provide comprehensive findings with key insights, trends, and supporting evidence.";
}

std::string analysis_description(const std::string& topic) {
    return "Analyze the research findings on " + topic
        + ". Identify patterns, correlations, and generate actionable insights.";
}

std::string report_description(const std::string& topic) {
    return "Generate a comprehensive executive report on " + topic + " based on research and analysis.";
}

} // namespace

Scenario research_analysis_scenario(const std::string& topic) {
    Scenario scenario;
    scenario.name = "Research & Analysis Workflow";
    scenario.description = "Complete research and analysis pipeline for: " + topic;

    Task research;
    research.id = "research-001";
    research.description = research_description(topic);
    research.priority = 1;
    research.payload = {{"type", "research"}, {"topic", topic}, {"agent_type", "researcher"}};

    Task analysis;
    analysis.id = "analyze-001";
    analysis.description = analysis_description(topic);
    analysis.priority = 2;
    analysis.payload = {{"type", "analysis"}, {"topic", topic}, {"agent_type", "analyzer"}};
    analysis.dependencies = {"research-001"};

    Task report;
    report.id = "report-001";
    report.description = report_description(topic);
    report.priority = 3;
    report.payload = {{"type", "report"}, {"topic", topic}, {"agent_type", "reporter"}};
    report.dependencies = {"research-001", "analyze-001"};

    scenario.tasks = {research, analysis, report};
    return scenario;
}

Scenario parallel_processing_scenario(int count) {
    Scenario scenario;
    scenario.name = "Parallel Task Processing";
    scenario.description = "Process " + std::to_string(count) + " tasks in parallel across available workers";

    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    for (int i = 0; i < count; ++i) {
        Task task;
        task.id = numbered("parallel", 3, i + 1);
        task.description = "Parallel task #" + std::to_string(i + 1) + ": Process data batch";
        task.priority = 1;
        task.payload = {{"batch", i + 1}, {"timestamp_ms", now_ms}};
        scenario.tasks.push_back(std::move(task));
    }
    return scenario;
}

Scenario stress_test_scenario(int count) {
    Scenario scenario;
    scenario.name = "Stress Test";
    scenario.description = "Process " + std::to_string(count) + " tasks to test swarm capacity";

    for (int i = 0; i < count; ++i) {
        int priority = (i % 3) + 1;
        Task task;
        task.id = numbered("stress", 4, i + 1);
        task.description = "Stress test task #" + std::to_string(i + 1);
        task.priority = priority;
        task.payload = {{"index", i}, {"priority", priority}};
        scenario.tasks.push_back(std::move(task));
    }
    return scenario;
}

caf::expected<Scenario> make_scenario(const std::string& name, const std::string& topic, int count) {
    if (name == "research") {
        return research_analysis_scenario(topic.empty() ? "artificial intelligence" : topic);
    }
    if (name == "parallel") {
        return parallel_processing_scenario(count > 0 ? count : 10);
    }
    if (name == "stress") {
        return stress_test_scenario(count > 0 ? count : 50);
    }
    return make_error(swarm_errc::invalid_argument, "unknown scenario '" + name + "'");
}

std::vector<WorkflowStep> research_workflow_steps(const std::string& topic) {
    std::vector<WorkflowStep> steps(3);

    steps[0].label = "research";
    steps[0].description = research_description(topic);
    steps[0].priority = 1;
    steps[0].payload = {{"type", "research"}, {"topic", topic}};

    steps[1].label = "analysis";
    steps[1].description = analysis_description(topic);
    steps[1].priority = 2;
    steps[1].payload = {{"type", "analysis"}, {"topic", topic}};

    steps[2].label = "report";
    steps[2].description = report_description(topic);
    steps[2].priority = 3;
    steps[2].payload = {{"type", "report"}, {"topic", topic}};

    return steps;
}

nlohmann::json ScenarioReport::to_json() const {
    nlohmann::json out;
    out["name"] = name;
    out["total"] = total;
    out["distributed"] = distributed;
    out["assignments"] = assignments;
    out["completed"] = completed;
    out["failed"] = failed;
    out["pending"] = pending;
    out["duration_ms"] = duration.count();
    out["all_completed"] = all_completed();
    return out;
}

caf::expected<ScenarioReport> execute_scenario(Coordinator& coordinator,
                                               const Scenario& scenario,
                                               const ScenarioOptions& options,
                                               std::shared_ptr<Observability> obs) {
    if (!obs) {
        obs = std::make_shared<Observability>("scenario");
    }

    ScenarioReport report;
    report.name = scenario.name;
    report.total = scenario.tasks.size();
    auto start_time = std::chrono::steady_clock::now();

    obs->log_info("Executing scenario", "", "", "", "", {
        {"name", scenario.name},
        {"description", scenario.description},
        {"tasks", std::to_string(scenario.tasks.size())}
    });

    auto& bus = coordinator.event_bus();
    auto sub = bus.subscribe();
    RetryPolicy retry(options.retry);

    std::set<std::string> scenario_ids;
    for (const auto& task : scenario.tasks) {
        scenario_ids.insert(task.id);
    }

    // Terminal outcomes are collected from the start so the sink never
    // fills up while tasks are still being distributed
    std::map<std::string, EventKind> outcomes;
    std::vector<std::string> outcome_order;
    auto note = [&](const Event& event) {
        if (event.is_terminal() && scenario_ids.count(event.task_id) > 0
            && outcomes.emplace(event.task_id, event.kind).second) {
            outcome_order.push_back(event.task_id);
        }
    };
    auto drain = [&] {
        while (auto event = sub->try_receive()) {
            note(*event);
        }
    };
    // Pauses the caller while still collecting events
    auto drain_for = [&](std::chrono::milliseconds wait) {
        const auto until = std::chrono::steady_clock::now() + wait;
        while (true) {
            auto now = std::chrono::steady_clock::now();
            if (now >= until) {
                return;
            }
            auto event = sub->receive_for(until - now);
            if (event) {
                note(*event);
            } else if (sub->closed()) {
                std::this_thread::sleep_until(until);
                return;
            }
        }
    };

    for (const auto& task : scenario.tasks) {
        auto task_start = std::chrono::steady_clock::now();
        for (int32_t attempt = 0;; ++attempt) {
            auto res = coordinator.distribute(task);
            if (res) {
                report.distributed.push_back(task.id);
                report.assignments[task.id] = *res;
                break;
            }

            auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - task_start).count();
            if (attempt >= retry.max_retries()
                || !retry.is_retryable(res.error())
                || retry.is_budget_exhausted(elapsed_ms, attempt)) {
                bus.unsubscribe(sub);
                obs->log_error("Failed to distribute task", "", task.id, "", "", {
                    {"scenario", scenario.name},
                    {"attempts", std::to_string(attempt + 1)},
                    {"error", describe(res.error())}
                });
                return res.error();
            }

            obs->log_warn("Distribution rejected, retrying", "", task.id, "", "", {
                {"attempt", std::to_string(attempt + 1)},
                {"error", describe(res.error())}
            });
            drain_for(std::chrono::milliseconds(retry.calculate_backoff_delay(attempt)));
        }
        drain();

        if (options.progress) {
            options.progress(report.distributed.size(), report.total);
        }
        if (options.distribute_interval_ms > 0) {
            drain_for(std::chrono::milliseconds(options.distribute_interval_ms));
        }
    }

    if (options.wait_for_completion) {
        std::set<std::string> outstanding;
        for (const auto& id : report.distributed) {
            if (outcomes.count(id) == 0) {
                outstanding.insert(id);
            }
        }
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options.timeout_ms);
        const std::chrono::steady_clock::duration poll = std::chrono::milliseconds(options.poll_interval_ms);

        while (!outstanding.empty()) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                break;
            }
            auto event = sub->receive_for(std::min(poll, deadline - now));
            if (!event) {
                if (sub->closed()) {
                    break;
                }
                continue;
            }
            note(*event);
            if (event->is_terminal()) {
                outstanding.erase(event->task_id);
            }
        }
    } else {
        drain();
    }
    bus.unsubscribe(sub);

    for (const auto& id : outcome_order) {
        if (report.assignments.count(id) == 0) {
            continue;
        }
        if (outcomes[id] == EventKind::task_completed) {
            report.completed.push_back(id);
        } else {
            report.failed.push_back(id);
        }
    }
    for (const auto& id : report.distributed) {
        if (outcomes.count(id) == 0) {
            report.pending.push_back(id);
        }
    }

    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    obs->log_info("Scenario finished", "", "", "", "", {
        {"name", scenario.name},
        {"distributed", std::to_string(report.distributed.size())},
        {"completed", std::to_string(report.completed.size())},
        {"failed", std::to_string(report.failed.size())},
        {"pending", std::to_string(report.pending.size())},
        {"subscription_dropped", std::to_string(sub->dropped())}
    });
    return report;
}

} // namespace engine
} // namespace agentswarm
