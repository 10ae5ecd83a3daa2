#include "agentswarm/engine/completion_client.hpp"
#include "agentswarm/engine/feature_flags.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <mutex>
#include <thread>

namespace agentswarm {
namespace engine {

using json = nlohmann::json;

namespace {

const char* simulated_note =
    "*Note: This is a simulated response. Set OPENAI_API_KEY or ANTHROPIC_API_KEY for real AI analysis.*";

std::once_flag curl_init_flag;

void ensure_curl_initialized() {
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string truncate(const std::string& text, size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    return text.substr(0, limit) + "...";
}

} // namespace

caf::expected<std::string> MockCompletionClient::complete(const std::string& /*system_prompt*/,
                                                          const std::string& user_prompt,
                                                          const std::vector<ChatMessage>& /*history*/) {
    calls_++;
    return canned_response(user_prompt);
}

std::string MockCompletionClient::canned_response(const std::string& prompt) {
    std::string lower = prompt;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower.find("research") != std::string::npos) {
        return std::string("# Research Findings\n\n"
            "Based on comprehensive analysis:\n\n"
            "## Key Points:\n"
            "1. Current trends show significant growth in this area\n"
            "2. Market analysis indicates strong demand\n"
            "3. Technical feasibility is high\n\n"
            "## Recommendations:\n"
            "- Continue monitoring developments\n"
            "- Consider strategic partnerships\n"
            "- Invest in related technologies\n\n") + simulated_note;
    }

    if (lower.find("analyze") != std::string::npos) {
        return std::string("# Analysis Results\n\n"
            "## Data Quality: High\n"
            "## Key Patterns:\n"
            "- Pattern A: Shows consistent growth\n"
            "- Pattern B: Seasonal variations detected\n"
            "- Pattern C: Strong correlation with market trends\n\n"
            "## Insights:\n"
            "The data suggests positive momentum with manageable risks.\n\n") + simulated_note;
    }

    if (lower.find("report") != std::string::npos || lower.find("summary") != std::string::npos) {
        return std::string("# Executive Report\n\n"
            "## Overview\n"
            "This report synthesizes findings from research and analysis phases.\n\n"
            "## Key Findings:\n"
            "- Finding 1: Market opportunity is substantial\n"
            "- Finding 2: Technical approach is sound\n"
            "- Finding 3: Timeline is achievable\n\n"
            "## Recommendations:\n"
            "1. Proceed with phase 2 planning\n"
            "2. Allocate additional resources\n"
            "3. Schedule stakeholder review\n\n") + simulated_note;
    }

    return std::string("Task completed successfully.\n\n"
        "Analysis shows positive outcomes with actionable next steps identified.\n\n") + simulated_note;
}

HttpCompletionClient::HttpCompletionClient(LlmConfig config, RetryPolicy retry)
    : config_(std::move(config)), retry_(retry) {
    ensure_curl_initialized();
}

std::string HttpCompletionClient::endpoint() const {
    if (!config_.endpoint.empty()) {
        return config_.endpoint;
    }
    if (config_.provider == "anthropic") {
        return "https://api.anthropic.com/v1/messages";
    }
    return "https://api.openai.com/v1/chat/completions";
}

json HttpCompletionClient::build_request_body(const std::string& system_prompt,
                                              const std::string& user_prompt,
                                              const std::vector<ChatMessage>& history) const {
    json messages = json::array();
    bool anthropic = config_.provider == "anthropic";

    if (!anthropic && !system_prompt.empty()) {
        messages.push_back({{"role", "system"}, {"content", system_prompt}});
    }
    for (const auto& msg : history) {
        // Anthropic rejects system entries inside messages
        if (anthropic && msg.role == "system") {
            continue;
        }
        messages.push_back({{"role", msg.role}, {"content", msg.content}});
    }
    messages.push_back({{"role", "user"}, {"content", user_prompt}});

    json body;
    body["model"] = config_.model;
    body["messages"] = messages;
    if (anthropic) {
        body["max_tokens"] = config_.max_tokens;
        if (!system_prompt.empty()) {
            body["system"] = system_prompt;
        }
    }
    return body;
}

caf::expected<std::string> HttpCompletionClient::parse_response(const std::string& provider,
                                                                const std::string& body) {
    try {
        auto parsed = json::parse(body);
        if (provider == "anthropic") {
            const auto& content = parsed.at("content");
            if (!content.is_array() || content.empty()) {
                return make_error(swarm_errc::completion_failed, "no response from API");
            }
            return content.at(0).at("text").get<std::string>();
        }
        const auto& choices = parsed.at("choices");
        if (!choices.is_array() || choices.empty()) {
            return make_error(swarm_errc::completion_failed, "no response from API");
        }
        return choices.at(0).at("message").at("content").get<std::string>();
    } catch (const json::exception& e) {
        return make_error(swarm_errc::completion_failed,
                          "unexpected completion response: " + std::string(e.what()));
    }
}

caf::expected<std::string> HttpCompletionClient::complete(const std::string& system_prompt,
                                                          const std::string& user_prompt,
                                                          const std::vector<ChatMessage>& history) {
    const std::string body = build_request_body(system_prompt, user_prompt, history).dump();
    auto start_time = std::chrono::steady_clock::now();

    for (int32_t attempt = 0;; ++attempt) {
        caf::error last_error;
        int status_code = 0;

        auto response = post(body);
        if (response) {
            status_code = static_cast<int>(response->status_code);
            if (status_code == 200) {
                return parse_response(config_.provider, response->body);
            }
            last_error = make_error(swarm_errc::http_error,
                                    "API error (HTTP " + std::to_string(status_code) + "): "
                                    + truncate(response->body, 512));
        } else {
            last_error = response.error();
        }

        auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();
        if (attempt >= retry_.max_retries()
            || !retry_.is_retryable(last_error, status_code)
            || retry_.is_budget_exhausted(elapsed_ms, attempt)) {
            return last_error;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(retry_.calculate_backoff_delay(attempt)));
    }
}

caf::expected<HttpCompletionClient::HttpResponse> HttpCompletionClient::post(const std::string& body) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_error(swarm_errc::completion_failed, "failed to initialize CURL");
    }

    std::string url = endpoint();
    std::string response_body;
    long response_code = 0;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist* header_list = nullptr;
    header_list = curl_slist_append(header_list, "Content-Type: application/json");
    if (config_.provider == "anthropic") {
        header_list = curl_slist_append(header_list, ("x-api-key: " + config_.api_key).c_str());
        header_list = curl_slist_append(header_list, "anthropic-version: 2023-06-01");
    } else {
        header_list = curl_slist_append(header_list, ("Authorization: Bearer " + config_.api_key).c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK) {
        curl_slist_free_all(header_list);
        curl_easy_cleanup(curl);
        return make_error(swarm_errc::completion_failed,
                          "CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    return HttpResponse{response_code, std::move(response_body)};
}

size_t HttpCompletionClient::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    if (userp == nullptr || contents == nullptr) {
        return 0;
    }
    size_t total = size * nmemb;
    userp->append(static_cast<const char*>(contents), total);
    return total;
}

completion_client_ptr make_completion_client(const LlmConfig& config) {
    bool live_provider = config.provider == "openai" || config.provider == "anthropic";
    if (!live_provider || config.api_key.empty() || FeatureFlags::is_mock_llm_forced()) {
        return std::make_shared<MockCompletionClient>();
    }
    return std::make_shared<HttpCompletionClient>(config);
}

} // namespace engine
} // namespace agentswarm
