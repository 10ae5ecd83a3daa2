#include "agentswarm/engine/agents.hpp"
#include "agentswarm/engine/errors.hpp"

namespace agentswarm {
namespace engine {

std::string render_context(const std::map<std::string, nlohmann::json>& context) {
    std::string out;
    for (const auto& [key, value] : context) {
        out += "## " + key + "\n";
        out += value.is_string() ? value.get<std::string>() : value.dump();
        out += "\n\n";
    }
    return out;
}

AgentProfile research_profile() {
    AgentProfile profile;
    profile.specialty = "research";
    profile.failure_prefix = "Research failed";
    profile.system_prompt =
        "You are a research specialist agent. Your role is to:\n"
        "1. Break down the research topic into key questions\n"
        "2. Gather and synthesize relevant information\n"
        "3. Identify patterns and insights\n"
        "4. Present findings clearly with evidence\n\n"
        "Provide comprehensive, well-structured research output.";
    profile.build_prompt = [](const Task& task) {
        return "Research Task: " + task.description + "\n\n"
               "Please provide a thorough research report including:\n"
               "- Executive summary\n"
               "- Key findings (3-5 main points)\n"
               "- Supporting details and evidence\n"
               "- Trends and patterns identified\n"
               "- Recommendations for next steps\n\n"
               "Context from previous tasks:\n" + render_context(task.context);
    };
    return profile;
}

AgentProfile analysis_profile() {
    AgentProfile profile;
    profile.specialty = "analysis";
    profile.failure_prefix = "Analysis failed";
    profile.system_prompt =
        "You are a data analysis specialist agent. Your role is to:\n"
        "1. Assess data quality and completeness\n"
        "2. Identify patterns, trends, and anomalies\n"
        "3. Apply analytical techniques\n"
        "4. Generate actionable insights\n\n"
        "Provide thorough, evidence-based analysis.";
    profile.build_prompt = [](const Task& task) {
        return "Analysis Task: " + task.description + "\n\n"
               "Data/Research to analyze:\n" + render_context(task.context) + "\n"
               "Please provide a comprehensive analysis including:\n"
               "- Data quality assessment\n"
               "- Key patterns and trends identified\n"
               "- Statistical insights\n"
               "- Correlations and relationships\n"
               "- Actionable recommendations\n"
               "- Confidence levels in findings";
    };
    return profile;
}

AgentProfile report_profile() {
    AgentProfile profile;
    profile.specialty = "report";
    profile.failure_prefix = "Report generation failed";
    profile.system_prompt =
        "You are a professional report writer agent. Your role is to:\n"
        "1. Synthesize information from research and analysis\n"
        "2. Create clear, well-structured reports\n"
        "3. Present findings in an executive-friendly format\n"
        "4. Provide actionable recommendations\n\n"
        "Create comprehensive, professional reports.";
    profile.build_prompt = [](const Task& task) {
        return "Report Generation Task: " + task.description + "\n\n"
               "Research and Analysis Results:\n" + render_context(task.context) + "\n"
               "Please create a comprehensive report including:\n"
               "- Executive Summary (2-3 paragraphs)\n"
               "- Key Findings (clearly numbered/bulleted)\n"
               "- Detailed Analysis\n"
               "- Recommendations (actionable next steps)\n"
               "- Conclusion\n\n"
               "Format the report professionally with clear sections and markdown formatting.";
    };
    return profile;
}

LlmAgent::LlmAgent(std::string id,
                   AgentProfile profile,
                   completion_client_ptr client,
                   EventBus* bus,
                   std::shared_ptr<Observability> obs,
                   size_t mailbox_capacity,
                   size_t history_limit)
    : Actor(std::move(id), bus, std::move(obs), mailbox_capacity),
      profile_(std::move(profile)),
      client_(client ? std::move(client) : std::make_shared<MockCompletionClient>()),
      history_limit_(history_limit) {}

LlmAgent::~LlmAgent() {
    // The run loop calls process_task, so it must exit before this object goes away
    auto res = stop();
    if (!res) {
        observability().log_error("Agent destroyed without a clean stop", id(), "", "", "", {
            {"error", describe(res.error())}
        });
    }
}

std::vector<ChatMessage> LlmAgent::history() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return history_;
}

Result LlmAgent::process_task(const Task& task) {
    auto user_prompt = profile_.build_prompt ? profile_.build_prompt(task) : task.description;

    auto response = client_->complete(profile_.system_prompt, user_prompt, history());
    if (!response) {
        observability().log_warn("Completion failed", id(), task.id, "", "", {
            {"provider", client_->provider()},
            {"error", describe(response.error())}
        });
        return Result::error_result(task.id, ErrorCode::completion_failed,
                                    profile_.failure_prefix + ": " + describe(response.error()), id());
    }

    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        history_.push_back(ChatMessage{"user", user_prompt});
        history_.push_back(ChatMessage{"assistant", *response});
        if (history_.size() > history_limit_) {
            history_.erase(history_.begin(), history_.end() - static_cast<std::ptrdiff_t>(history_limit_));
        }
    }

    observability().log_debug("Completion received", id(), task.id, "", "", {
        {"provider", client_->provider()},
        {"specialty", profile_.specialty},
        {"chars", std::to_string(response->size())}
    });
    return Result::ok_result(task.id, *response, id());
}

} // namespace engine
} // namespace agentswarm
