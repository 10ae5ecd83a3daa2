#include <algorithm>
#include <iostream>
#include <caf/actor_system_config.hpp>
#include <caf/optional.hpp>
#include <caf/config_option_adder.hpp>
#include "agentswarm/engine/core.hpp"
#include "agentswarm/engine/agents.hpp"
#include "agentswarm/engine/config.hpp"
#include "agentswarm/engine/coordinator.hpp"
#include "agentswarm/engine/observability.hpp"
#include "agentswarm/engine/result_converter.hpp"
#include "agentswarm/engine/scenarios.hpp"
#include "agentswarm/engine/workflow.hpp"
#include <unistd.h>

using namespace agentswarm::engine;

struct CliOptions {
    std::string mode = "workflow";
    std::string topic = "artificial intelligence";
    int count = 0;
    int step_timeout_ms = 60000;
    int mailbox_capacity = 100;
    std::string status_endpoint = "0.0.0.0:8080";
    std::string llm_provider;
    std::string llm_model;
    std::string env_file = ".env";
};

class SwarmCliConfig : public caf::actor_system_config {
public:
    SwarmCliConfig() {
        opt_group{custom_options_, "global"}
            .add(cli.mode, "mode", "workflow | research | parallel | stress")
            .add(cli.topic, "topic", "Topic for the research workflow and scenario")
            .add(cli.count, "count", "Task count for the parallel and stress scenarios")
            .add(cli.step_timeout_ms, "step-timeout-ms", "Per-step deadline (ms)")
            .add(cli.mailbox_capacity, "mailbox-capacity", "Mailbox capacity per actor")
            .add(cli.status_endpoint, "status-endpoint", "host:port of the status endpoint, empty disables")
            .add(cli.llm_provider, "llm-provider", "openai | anthropic | mock (default: from environment)")
            .add(cli.llm_model, "llm-model", "Model override")
            .add(cli.env_file, "env-file", "Optional KEY=VALUE file loaded before startup");
    }

    CliOptions cli;
};

static int run(const SwarmCliConfig& config) {
    const auto& cli = config.cli;

    SwarmConfig swarm;
    swarm.step_timeout_ms = cli.step_timeout_ms;
    swarm.mailbox_capacity = cli.mailbox_capacity;
    swarm.status_endpoint = cli.status_endpoint;

    load_env_file(cli.env_file);
    swarm.llm = llm_config_from_env();
    if (!cli.llm_provider.empty()) {
        swarm.llm.provider = cli.llm_provider;
    }
    if (!cli.llm_model.empty()) {
        swarm.llm.model = cli.llm_model;
    }

    auto observability = std::make_shared<Observability>("agentswarm_" + std::to_string(getpid()));
    observability->log_info("Swarm starting", "", "", "", "", {
        {"mode", cli.mode},
        {"llm_provider", swarm.llm.provider},
        {"llm_model", swarm.llm.model},
        {"mailbox_capacity", std::to_string(swarm.mailbox_capacity)},
        {"step_timeout_ms", std::to_string(swarm.step_timeout_ms)}
    });

    if (swarm.mailbox_capacity <= 0 || swarm.step_timeout_ms <= 0) {
        observability->log_error("mailbox-capacity and step-timeout-ms must be positive");
        return 1;
    }

    caf::optional<Scenario> scenario;
    if (cli.mode != "workflow") {
        auto made = make_scenario(cli.mode, cli.topic, cli.count);
        if (!made) {
            observability->log_error("Unknown mode", "", "", "", "", {
                {"mode", cli.mode},
                {"error", describe(made.error())}
            });
            return 1;
        }
        scenario = std::move(*made);
        // Room for the three events every task produces
        swarm.subscriber_buffer = std::max(swarm.subscriber_buffer,
                                           static_cast<int32_t>(scenario->tasks.size() * 4));
    }

    Coordinator coordinator(static_cast<size_t>(swarm.subscriber_buffer), observability);
    auto client = make_completion_client(swarm.llm);

    // Registration order is the round-robin order: workflow steps land on
    // researcher, analyzer, reporter in turn.
    std::vector<actor_ptr> agents = {
        std::make_shared<LlmAgent>("researcher-1", research_profile(), client, &coordinator.event_bus(),
                                   observability, swarm.mailbox_capacity, swarm.history_limit),
        std::make_shared<LlmAgent>("analyzer-1", analysis_profile(), client, &coordinator.event_bus(),
                                   observability, swarm.mailbox_capacity, swarm.history_limit),
        std::make_shared<LlmAgent>("reporter-1", report_profile(), client, &coordinator.event_bus(),
                                   observability, swarm.mailbox_capacity, swarm.history_limit)
    };
    for (const auto& agent : agents) {
        if (auto res = coordinator.register_actor(agent); !res) {
            observability->log_error("Failed to register agent", agent->id(), "", "", "", {
                {"error", describe(res.error())}
            });
            return 1;
        }
    }

    if (!swarm.status_endpoint.empty()) {
        auto endpoint = parse_endpoint(swarm.status_endpoint);
        if (!endpoint) {
            observability->log_error("Invalid status endpoint", "", "", "", "", {
                {"error", describe(endpoint.error())}
            });
            return 1;
        }
        Coordinator* coord = &coordinator;
        if (!observability->start_http_endpoint(endpoint->first, endpoint->second, [coord] {
                return ResultConverter::to_json(coord->status());
            })) {
            observability->log_warn("Status endpoint unavailable, continuing without it");
        }
    }

    auto root = CancellationScope::make_root();
    if (auto res = coordinator.start_all(root); !res) {
        observability->log_error("Failed to start agents", "", "", "", "", {
            {"error", describe(res.error())}
        });
        observability->stop_http_endpoint();
        return 1;
    }

    int exit_code = 0;
    if (cli.mode == "workflow") {
        WorkflowOptions options;
        options.step_timeout_ms = swarm.step_timeout_ms;
        options.poll_interval_ms = swarm.poll_interval_ms;
        WorkflowDriver driver(coordinator, options, observability);

        auto result = driver.execute("research-workflow", research_workflow_steps(cli.topic));
        if (!result) {
            observability->log_error("Workflow could not run", "", "", "", "", {
                {"error", describe(result.error())}
            });
            exit_code = 1;
        } else {
            std::cout << result->to_json().dump(2) << std::endl;
            exit_code = result->success ? 0 : 2;
        }
    } else {
        ScenarioOptions options;
        options.timeout_ms = swarm.step_timeout_ms;
        options.poll_interval_ms = swarm.poll_interval_ms;
        options.progress = [observability](size_t distributed, size_t total) {
            if (distributed % 5 == 0 || distributed == total) {
                observability->log_info("Scenario progress", "", "", "", "", {
                    {"distributed", std::to_string(distributed)},
                    {"total", std::to_string(total)}
                });
            }
        };

        auto report = execute_scenario(coordinator, *scenario, options, observability);
        if (!report) {
            observability->log_error("Scenario aborted", "", "", "", "", {
                {"error", describe(report.error())}
            });
            exit_code = 1;
        } else {
            std::cout << report->to_json().dump(2) << std::endl;
            exit_code = report->all_completed() ? 0 : 2;
        }
    }

    observability->stop_http_endpoint();
    if (auto res = coordinator.stop_all(); !res) {
        observability->log_error("Some agents failed to stop", "", "", "", "", {
            {"error", describe(res.error())}
        });
        exit_code = exit_code == 0 ? 1 : exit_code;
    }

    observability->log_info("Swarm stopped", "", "", "", "", {
        {"exit_code", std::to_string(exit_code)}
    });
    return exit_code;
}

int main(int argc, char** argv) {
    SwarmCliConfig config;

    // Parse command line arguments
    if (auto err = config.parse(argc, argv)) {
        std::cerr << "Failed to parse arguments: " << caf::to_string(err) << std::endl;
        return 1;
    }
    if (config.cli_helptext_printed) {
        return 0;
    }

    try {
        return run(config);
    } catch (const std::exception& e) {
        std::cerr << "agentswarm fatal error: " << e.what() << std::endl;
        return 1;
    }
}
