#include <iostream>
#include <cassert>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>
#include "agentswarm/engine/agents.hpp"
#include "agentswarm/engine/completion_client.hpp"
#include "agentswarm/engine/config.hpp"
#include <unistd.h>

using namespace agentswarm::engine;

class FailingCompletionClient : public CompletionClient {
public:
    caf::expected<std::string> complete(const std::string&, const std::string&,
                                        const std::vector<ChatMessage>&) override {
        calls++;
        return make_error(swarm_errc::completion_failed, "backend down");
    }

    std::string provider() const override { return "failing"; }

    int calls = 0;
};

// Remembers what it was asked
class CapturingCompletionClient : public CompletionClient {
public:
    caf::expected<std::string> complete(const std::string& system_prompt, const std::string& user_prompt,
                                        const std::vector<ChatMessage>& history) override {
        last_system = system_prompt;
        last_user = user_prompt;
        last_history_size = history.size();
        return "reply " + std::to_string(++calls);
    }

    std::string provider() const override { return "capturing"; }

    std::string last_system;
    std::string last_user;
    size_t last_history_size = 0;
    int calls = 0;
};

static Task make_task(const std::string& id, const std::string& description) {
    Task task;
    task.id = id;
    task.description = description;
    return task;
}

static void clear_llm_env() {
    unsetenv("OPENAI_API_KEY");
    unsetenv("ANTHROPIC_API_KEY");
    unsetenv("AGENTSWARM_FORCE_MOCK_LLM");
}

void test_mock_canned_responses() {
    std::cout << "Testing mock completion responses..." << std::endl;

    MockCompletionClient mock;
    auto research = mock.complete("", "Please RESEARCH quantum computing", {});
    assert(research);
    assert(research->find("# Research Findings") == 0);
    assert(research->find("simulated response") != std::string::npos);

    auto analysis = mock.complete("", "analyze these numbers", {});
    assert(analysis && analysis->find("# Analysis Results") == 0);

    auto report = mock.complete("", "write a summary", {});
    assert(report && report->find("# Executive Report") == 0);

    auto generic = mock.complete("", "hello", {});
    assert(generic && generic->find("Task completed successfully.") == 0);

    assert(mock.calls() == 4);
    assert(mock.provider() == "mock");

    std::cout << "✓ Mock completion responses test passed" << std::endl;
}

void test_profiles_and_prompts() {
    std::cout << "Testing agent profiles..." << std::endl;

    auto research = research_profile();
    auto analysis = analysis_profile();
    auto report = report_profile();
    assert(research.specialty == "research");
    assert(analysis.specialty == "analysis");
    assert(report.specialty == "report");
    assert(report.failure_prefix == "Report generation failed");

    Task task = make_task("t1", "Investigate solar storage");
    task.context["research_output"] = "battery costs fell";
    task.context["analysis_output"] = "costs trend downward";

    auto prompt = report.build_prompt(task);
    assert(prompt.find("Report Generation Task: Investigate solar storage") == 0);
    assert(prompt.find("## research_output\nbattery costs fell\n") != std::string::npos);

    // Sections come out sorted by key
    auto rendered = render_context(task.context);
    assert(rendered == "## analysis_output\ncosts trend downward\n\n## research_output\nbattery costs fell\n\n");
    assert(render_context({}).empty());

    std::cout << "✓ Agent profiles test passed" << std::endl;
}

void test_agent_history_trimmed() {
    std::cout << "Testing agent history trimming..." << std::endl;

    auto client = std::make_shared<CapturingCompletionClient>();
    LlmAgent agent("researcher-1", research_profile(), client, nullptr, nullptr, 10, 6);

    for (int i = 1; i <= 5; ++i) {
        auto result = agent.process_task(make_task("t" + std::to_string(i), "topic " + std::to_string(i)));
        assert(result.success());
        assert(result.data == "reply " + std::to_string(i));
        assert(result.actor_id == "researcher-1");
    }

    auto history = agent.history();
    assert(history.size() == 6);
    // Oldest exchanges dropped, order kept
    assert(history.front().role == "user");
    assert(history.front().content.find("topic 3") != std::string::npos);
    assert(history.back().role == "assistant");
    assert(history.back().content == "reply 5");

    // The call for t5 carried the already trimmed history
    assert(client->last_history_size == 6);
    assert(client->last_system == research_profile().system_prompt);

    std::cout << "✓ Agent history trimming test passed" << std::endl;
}

void test_agent_completion_failure() {
    std::cout << "Testing agent completion failure..." << std::endl;

    auto client = std::make_shared<FailingCompletionClient>();
    LlmAgent agent("researcher-1", research_profile(), client);

    auto result = agent.process_task(make_task("t1", "anything"));
    assert(result.is_error());
    assert(result.error_code == ErrorCode::completion_failed);
    assert(result.data.find("Research failed: ") == 0);
    assert(result.data.find("backend down") != std::string::npos);
    assert(agent.history().empty());
    assert(client->calls == 1);

    std::cout << "✓ Agent completion failure test passed" << std::endl;
}

void test_agent_runs_as_actor() {
    std::cout << "Testing agent inside the run loop..." << std::endl;

    EventBus bus;
    auto sub = bus.subscribe();
    auto client = std::make_shared<MockCompletionClient>();
    LlmAgent agent("researcher-1", research_profile(), client, &bus);
    assert(agent.start(CancellationScope::make_root()));

    assert(agent.send(Message::for_task("test", "researcher-1", make_task("t1", "edge computing"))));

    caf::optional<Event> terminal;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!terminal && std::chrono::steady_clock::now() < deadline) {
        auto event = sub->receive_for(std::chrono::milliseconds(50));
        if (event && event->is_terminal()) {
            terminal = event;
        }
    }
    assert(terminal);
    assert(terminal->kind == EventKind::task_completed);
    assert(terminal->result()->data.find("# Research Findings") == 0);
    assert(client->calls() == 1);

    assert(agent.stop());
    std::cout << "✓ Agent inside the run loop test passed" << std::endl;
}

void test_request_body_openai() {
    std::cout << "Testing OpenAI request body..." << std::endl;

    LlmConfig config;
    config.provider = "openai";
    config.api_key = "sk-test";
    config.model = "gpt-4";
    HttpCompletionClient client(config);
    assert(client.endpoint() == "https://api.openai.com/v1/chat/completions");

    std::vector<ChatMessage> history = {{"user", "earlier"}, {"assistant", "earlier reply"}};
    auto body = client.build_request_body("be helpful", "now", history);
    assert(body["model"] == "gpt-4");
    assert(body["messages"].size() == 4);
    assert(body["messages"][0]["role"] == "system");
    assert(body["messages"][0]["content"] == "be helpful");
    assert(body["messages"][1]["content"] == "earlier");
    assert(body["messages"][3]["role"] == "user");
    assert(body["messages"][3]["content"] == "now");
    assert(!body.contains("system"));

    std::cout << "✓ OpenAI request body test passed" << std::endl;
}

void test_request_body_anthropic() {
    std::cout << "Testing Anthropic request body..." << std::endl;

    LlmConfig config;
    config.provider = "anthropic";
    config.api_key = "key";
    config.model = "claude-3-5-sonnet-20241022";
    config.max_tokens = 1024;
    HttpCompletionClient client(config);
    assert(client.endpoint() == "https://api.anthropic.com/v1/messages");

    std::vector<ChatMessage> history = {{"system", "dropped"}, {"user", "earlier"}};
    auto body = client.build_request_body("be precise", "now", history);
    assert(body["system"] == "be precise");
    assert(body["max_tokens"] == 1024);
    assert(body["messages"].size() == 2);
    for (const auto& msg : body["messages"]) {
        assert(msg["role"] != "system");
    }

    LlmConfig custom = config;
    custom.endpoint = "http://localhost:9000/v1/messages";
    assert(HttpCompletionClient(custom).endpoint() == "http://localhost:9000/v1/messages");

    std::cout << "✓ Anthropic request body test passed" << std::endl;
}

void test_parse_response() {
    std::cout << "Testing completion response parsing..." << std::endl;

    auto openai = HttpCompletionClient::parse_response(
        "openai", R"({"choices":[{"message":{"role":"assistant","content":"hi there"}}]})");
    assert(openai && *openai == "hi there");

    auto anthropic = HttpCompletionClient::parse_response(
        "anthropic", R"({"content":[{"type":"text","text":"hello"}]})");
    assert(anthropic && *anthropic == "hello");

    auto empty = HttpCompletionClient::parse_response("openai", R"({"choices":[]})");
    assert(!empty);
    assert(is(empty.error(), swarm_errc::completion_failed));

    auto garbage = HttpCompletionClient::parse_response("anthropic", "not json");
    assert(!garbage);
    assert(is(garbage.error(), swarm_errc::completion_failed));

    auto wrong_shape = HttpCompletionClient::parse_response("openai", R"({"content":[]})");
    assert(!wrong_shape);

    std::cout << "✓ Completion response parsing test passed" << std::endl;
}

void test_client_selection() {
    std::cout << "Testing completion client selection..." << std::endl;
    clear_llm_env();

    LlmConfig mock;
    assert(make_completion_client(mock)->provider() == "mock");

    LlmConfig keyless;
    keyless.provider = "openai";
    assert(make_completion_client(keyless)->provider() == "mock");

    LlmConfig live;
    live.provider = "anthropic";
    live.api_key = "key";
    assert(make_completion_client(live)->provider() == "anthropic");

    setenv("AGENTSWARM_FORCE_MOCK_LLM", "true", 1);
    assert(make_completion_client(live)->provider() == "mock");
    clear_llm_env();

    std::cout << "✓ Completion client selection test passed" << std::endl;
}

void test_llm_config_from_env() {
    std::cout << "Testing LLM configuration from environment..." << std::endl;
    clear_llm_env();

    auto none = llm_config_from_env();
    assert(none.provider == "mock");
    assert(none.api_key.empty());

    setenv("ANTHROPIC_API_KEY", "ak", 1);
    auto anthropic = llm_config_from_env();
    assert(anthropic.provider == "anthropic");
    assert(anthropic.model == "claude-3-5-sonnet-20241022");

    // OpenAI wins when both are set
    setenv("OPENAI_API_KEY", "ok", 1);
    auto openai = llm_config_from_env();
    assert(openai.provider == "openai");
    assert(openai.api_key == "ok");
    assert(openai.model == "gpt-4");

    setenv("AGENTSWARM_FORCE_MOCK_LLM", "1", 1);
    assert(llm_config_from_env().provider == "mock");

    clear_llm_env();
    std::cout << "✓ LLM configuration from environment test passed" << std::endl;
}

void test_load_env_file() {
    std::cout << "Testing env file loading..." << std::endl;

    std::string path = "/tmp/agentswarm_test_" + std::to_string(getpid()) + ".env";
    {
        std::ofstream out(path);
        out << "# comment line\n"
            << "\n"
            << "AGENTSWARM_TEST_PLAIN=plain value\n"
            << "export AGENTSWARM_TEST_EXPORTED=\"quoted\"\n"
            << "AGENTSWARM_TEST_SINGLE='single'\n"
            << "AGENTSWARM_TEST_PRESET=from file\n"
            << "not a pair\n";
    }
    unsetenv("AGENTSWARM_TEST_PLAIN");
    unsetenv("AGENTSWARM_TEST_EXPORTED");
    unsetenv("AGENTSWARM_TEST_SINGLE");
    setenv("AGENTSWARM_TEST_PRESET", "from env", 1);

    auto loaded = load_env_file(path);
    assert(loaded == 3);
    assert(std::string(std::getenv("AGENTSWARM_TEST_PLAIN")) == "plain value");
    assert(std::string(std::getenv("AGENTSWARM_TEST_EXPORTED")) == "quoted");
    assert(std::string(std::getenv("AGENTSWARM_TEST_SINGLE")) == "single");
    // Already-set variables win over the file
    assert(std::string(std::getenv("AGENTSWARM_TEST_PRESET")) == "from env");

    assert(load_env_file("/tmp/agentswarm_missing_file.env") == 0);

    std::remove(path.c_str());
    std::cout << "✓ Env file loading test passed" << std::endl;
}

void test_parse_endpoint() {
    std::cout << "Testing endpoint parsing..." << std::endl;

    auto full = parse_endpoint("127.0.0.1:9090");
    assert(full);
    assert(full->first == "127.0.0.1");
    assert(full->second == 9090);

    auto bare = parse_endpoint(":8080");
    assert(bare && bare->first == "0.0.0.0" && bare->second == 8080);

    for (const auto& bad : {"localhost", "host:", "host:abc", "host:70000", "host:0"}) {
        auto res = parse_endpoint(bad);
        assert(!res);
        assert(is(res.error(), swarm_errc::invalid_argument));
    }

    std::cout << "✓ Endpoint parsing test passed" << std::endl;
}

int main() {
    std::cout << "Running agent tests..." << std::endl;

    test_mock_canned_responses();
    test_profiles_and_prompts();
    test_agent_history_trimmed();
    test_agent_completion_failure();
    test_agent_runs_as_actor();
    test_request_body_openai();
    test_request_body_anthropic();
    test_parse_response();
    test_client_selection();
    test_llm_config_from_env();
    test_load_env_file();
    test_parse_endpoint();

    std::cout << "All agent tests passed!" << std::endl;
    return 0;
}
