#pragma once

#include "agentswarm/engine/core.hpp"
#include "agentswarm/engine/errors.hpp"
#include "agentswarm/engine/retry_policy.hpp"
#include <caf/expected.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentswarm {
namespace engine {

struct ChatMessage {
    std::string role;     // "user" | "assistant" | "system"
    std::string content;
};

/**
 * Language completion capability consumed by specialized actors
 *
 * complete() is synchronous and may be called from any actor thread.
 * Failures are returned as completion_failed or http_error.
 */
class CompletionClient {
public:
    virtual ~CompletionClient() = default;

    virtual caf::expected<std::string> complete(const std::string& system_prompt,
                                                const std::string& user_prompt,
                                                const std::vector<ChatMessage>& history) = 0;

    // "openai" | "anthropic" | "mock"
    virtual std::string provider() const = 0;
};

using completion_client_ptr = std::shared_ptr<CompletionClient>;

// Offline stub: keyword-triggered canned text, no network
class MockCompletionClient : public CompletionClient {
public:
    caf::expected<std::string> complete(const std::string& system_prompt,
                                        const std::string& user_prompt,
                                        const std::vector<ChatMessage>& history) override;

    std::string provider() const override { return "mock"; }

    uint64_t calls() const { return calls_.load(); }

    // "research" -> findings, "analyze" -> analysis, "report"/"summary" -> report, else generic
    static std::string canned_response(const std::string& prompt);

private:
    std::atomic<uint64_t> calls_{0};
};

// OpenAI chat-completions / Anthropic messages over libcurl
class HttpCompletionClient : public CompletionClient {
public:
    explicit HttpCompletionClient(LlmConfig config, RetryPolicy retry = RetryPolicy());

    caf::expected<std::string> complete(const std::string& system_prompt,
                                        const std::string& user_prompt,
                                        const std::vector<ChatMessage>& history) override;

    std::string provider() const override { return config_.provider; }

    std::string endpoint() const;

    // Provider wire format. Anthropic takes the system prompt as a top-level field.
    nlohmann::json build_request_body(const std::string& system_prompt,
                                      const std::string& user_prompt,
                                      const std::vector<ChatMessage>& history) const;

    // Extracts the assistant text from a 200 response body
    static caf::expected<std::string> parse_response(const std::string& provider, const std::string& body);

private:
    struct HttpResponse {
        long status_code;
        std::string body;
    };

    caf::expected<HttpResponse> post(const std::string& body) const;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp);

    LlmConfig config_;
    RetryPolicy retry_;
};

// Mock when the provider is "mock", no API key is set, or AGENTSWARM_FORCE_MOCK_LLM is on
completion_client_ptr make_completion_client(const LlmConfig& config);

} // namespace engine
} // namespace agentswarm
