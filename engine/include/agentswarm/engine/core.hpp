#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentswarm {
namespace engine {

// Lifecycle of an actor: idle -> processing (started) -> stopped (terminal).
// "processing" means the run loop is alive, not that a task is executing.
enum class ActorState {
    idle,
    processing,
    stopped
};

// Dispatch tag carried by every message
enum class MessageType {
    task,
    result,
    query,
    broadcast
};

// Unit of work. Passed by value; never shared across actors.
struct Task {
    std::string id;
    std::string description;
    nlohmann::json payload;
    int priority = 0;                               // advisory only
    std::map<std::string, nlohmann::json> context;  // accumulated outputs of prior steps
    std::vector<std::string> dependencies;          // advisory bookkeeping
};

// Task outcome status, ExecResult-style: success|error|timeout|cancelled
enum class ResultStatus {
    ok,
    error,
    timeout,
    cancelled
};

// Structured error attached to a Result
enum class ErrorCode {
    none = 0,
    // Validation errors (1xxx)
    invalid_input = 1001,
    // Execution errors (2xxx)
    execution_failed = 2001,
    completion_failed = 2002,
    handler_failed = 2003,
    // Cancellation (5xxx)
    cancelled = 5001,
    step_timeout = 5002
};

struct Result {
    std::string task_id;
    ResultStatus status = ResultStatus::ok;
    ErrorCode error_code = ErrorCode::none;
    std::string data;       // output on success, error description otherwise
    std::string actor_id;   // actor that produced it, empty for synthetic results
    int64_t latency_ms = 0;

    bool success() const { return status == ResultStatus::ok; }
    bool is_error() const { return status == ResultStatus::error; }
    bool is_timeout() const { return status == ResultStatus::timeout; }
    bool is_cancelled() const { return status == ResultStatus::cancelled; }

    static Result ok_result(const std::string& task_id, std::string data,
                            const std::string& actor_id = "", int64_t latency_ms = 0) {
        Result result;
        result.task_id = task_id;
        result.status = ResultStatus::ok;
        result.data = std::move(data);
        result.actor_id = actor_id;
        result.latency_ms = latency_ms;
        return result;
    }

    static Result error_result(const std::string& task_id, ErrorCode code, std::string description,
                               const std::string& actor_id = "", int64_t latency_ms = 0) {
        Result result;
        result.task_id = task_id;
        result.status = ResultStatus::error;
        result.error_code = code;
        result.data = std::move(description);
        result.actor_id = actor_id;
        result.latency_ms = latency_ms;
        return result;
    }

    // Synthesized by the workflow driver when a step never answered
    static Result timeout_result(const std::string& task_id, int64_t waited_ms) {
        Result result;
        result.task_id = task_id;
        result.status = ResultStatus::timeout;
        result.error_code = ErrorCode::step_timeout;
        result.data = "Task timeout after " + std::to_string(waited_ms) + "ms";
        result.latency_ms = waited_ms;
        return result;
    }

    static Result cancelled_result(const std::string& task_id, std::string reason) {
        Result result;
        result.task_id = task_id;
        result.status = ResultStatus::cancelled;
        result.error_code = ErrorCode::cancelled;
        result.data = std::move(reason);
        return result;
    }
};

struct BroadcastPayload {
    std::string topic;
    nlohmann::json body;
};

struct Query {
    std::string question;
    nlohmann::json args;
};

using Payload = std::variant<Task, Result, BroadcastPayload, Query>;

struct Message {
    std::string sender;
    std::string recipient;  // empty when unaddressed
    MessageType type = MessageType::task;
    Payload payload;

    static Message for_task(const std::string& sender, const std::string& recipient, Task task) {
        return Message{sender, recipient, MessageType::task, std::move(task)};
    }
};

enum class EventKind {
    task_received,
    task_started,
    task_completed,
    task_failed,
    custom
};

// Immutable broadcast record. Fire-and-forget; never retried or persisted.
struct Event {
    EventKind kind = EventKind::custom;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::string actor_id;
    std::string task_id;   // empty when not task related
    std::string message;
    std::variant<std::monostate, Result, nlohmann::json> data;

    bool is_terminal() const {
        return kind == EventKind::task_completed || kind == EventKind::task_failed;
    }

    const Result* result() const { return std::get_if<Result>(&data); }
};

// Language completion backend settings
struct LlmConfig {
    std::string provider = "mock";  // openai | anthropic | mock
    std::string api_key;
    std::string model;
    std::string endpoint;           // empty selects the provider default
    int32_t max_tokens = 4096;
    int64_t timeout_ms = 60000;
};

// Engine configuration
struct SwarmConfig {
    int32_t mailbox_capacity = 100;
    int32_t subscriber_buffer = 100;
    int64_t step_timeout_ms = 60000;
    int64_t poll_interval_ms = 100;
    int32_t history_limit = 6;
    std::string status_endpoint = "0.0.0.0:8080";
    LlmConfig llm;
};

} // namespace engine
} // namespace agentswarm
