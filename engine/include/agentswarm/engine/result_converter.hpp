#pragma once

#include "agentswarm/engine/core.hpp"
#include <chrono>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace agentswarm {
namespace engine {

// String and JSON renderings of engine records, used by logging,
// the status endpoint and the CLI output.
class ResultConverter {
public:
    // Contract: "success" | "error" | "timeout" | "cancelled"
    static std::string status_to_string(ResultStatus status) {
        switch (status) {
            case ResultStatus::ok:
                return "success";
            case ResultStatus::error:
                return "error";
            case ResultStatus::timeout:
                return "timeout";
            case ResultStatus::cancelled:
                return "cancelled";
            default:
                return "error";
        }
    }

    static std::string error_code_to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::none:
                return "NONE";
            case ErrorCode::invalid_input:
                return "INVALID_INPUT";
            case ErrorCode::execution_failed:
                return "EXECUTION_FAILED";
            case ErrorCode::completion_failed:
                return "COMPLETION_FAILED";
            case ErrorCode::handler_failed:
                return "HANDLER_FAILED";
            case ErrorCode::cancelled:
                return "CANCELLED";
            case ErrorCode::step_timeout:
                return "STEP_TIMEOUT";
            default:
                return "UNKNOWN_ERROR";
        }
    }

    static std::string state_to_string(ActorState state) {
        switch (state) {
            case ActorState::idle:
                return "idle";
            case ActorState::processing:
                return "processing";
            case ActorState::stopped:
                return "stopped";
            default:
                return "unknown";
        }
    }

    static std::string message_type_to_string(MessageType type) {
        switch (type) {
            case MessageType::task:
                return "task";
            case MessageType::result:
                return "result";
            case MessageType::query:
                return "query";
            case MessageType::broadcast:
                return "broadcast";
            default:
                return "unknown";
        }
    }

    static std::string event_kind_to_string(EventKind kind) {
        switch (kind) {
            case EventKind::task_received:
                return "task_received";
            case EventKind::task_started:
                return "task_started";
            case EventKind::task_completed:
                return "task_completed";
            case EventKind::task_failed:
                return "task_failed";
            case EventKind::custom:
                return "custom";
            default:
                return "custom";
        }
    }

    static nlohmann::json to_json(const Result& result) {
        nlohmann::json out;
        out["task_id"] = result.task_id;
        out["status"] = status_to_string(result.status);
        out["success"] = result.success();
        out["data"] = result.data;
        out["latency_ms"] = result.latency_ms;
        if (!result.actor_id.empty()) {
            out["actor_id"] = result.actor_id;
        }
        if (result.error_code != ErrorCode::none) {
            out["error_code"] = error_code_to_string(result.error_code);
        }
        return out;
    }

    static nlohmann::json to_json(const Task& task) {
        nlohmann::json out;
        out["id"] = task.id;
        out["description"] = task.description;
        out["priority"] = task.priority;
        out["payload"] = task.payload;
        out["context"] = task.context;
        out["dependencies"] = task.dependencies;
        return out;
    }

    static nlohmann::json to_json(const Event& event) {
        nlohmann::json out;
        out["type"] = event_kind_to_string(event.kind);
        out["timestamp_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
            event.timestamp.time_since_epoch()).count();
        out["agent_id"] = event.actor_id;
        out["message"] = event.message;
        if (!event.task_id.empty()) {
            out["task_id"] = event.task_id;
        }
        if (const auto* result = event.result()) {
            out["data"] = to_json(*result);
        } else if (const auto* json = std::get_if<nlohmann::json>(&event.data)) {
            out["data"] = *json;
        }
        return out;
    }

    static nlohmann::json to_json(const std::map<std::string, ActorState>& status) {
        nlohmann::json out = nlohmann::json::object();
        for (const auto& [id, state] : status) {
            out[id] = state_to_string(state);
        }
        return out;
    }
};

} // namespace engine
} // namespace agentswarm
