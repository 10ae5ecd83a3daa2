#pragma once

#include "agentswarm/engine/actor.hpp"
#include "agentswarm/engine/completion_client.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentswarm {
namespace engine {

// What a specialized agent asks the completion backend
struct AgentProfile {
    std::string specialty;                               // "research" | "analysis" | "report"
    std::string system_prompt;
    std::function<std::string(const Task&)> build_prompt;
    std::string failure_prefix;                          // e.g. "Research failed"
};

AgentProfile research_profile();
AgentProfile analysis_profile();
AgentProfile report_profile();

// Prior step outputs as "## <key>" sections, sorted by key; strings verbatim
std::string render_context(const std::map<std::string, nlohmann::json>& context);

/**
 * Actor whose work is one completion call per task
 *
 * Keeps a rolling history of user/assistant exchanges, trimmed to the last
 * history_limit entries, and sends it with every call.
 */
class LlmAgent : public Actor {
public:
    LlmAgent(std::string id,
             AgentProfile profile,
             completion_client_ptr client,
             EventBus* bus = nullptr,
             std::shared_ptr<Observability> obs = nullptr,
             size_t mailbox_capacity = 100,
             size_t history_limit = 6);

    ~LlmAgent() override;

    Result process_task(const Task& task) override;

    const std::string& specialty() const { return profile_.specialty; }

    std::vector<ChatMessage> history() const;

private:
    AgentProfile profile_;
    completion_client_ptr client_;
    const size_t history_limit_;

    mutable std::mutex history_mutex_;
    std::vector<ChatMessage> history_;
};

} // namespace engine
} // namespace agentswarm
