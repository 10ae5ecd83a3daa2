#include "agentswarm/engine/observability.hpp"
#include "agentswarm/engine/feature_flags.hpp"
#include "agentswarm/engine/result_converter.hpp"
#include <prometheus/text_serializer.h>
#include <opentelemetry/trace/provider.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <mutex>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cstring>

namespace agentswarm {
namespace engine {

using json = nlohmann::json;

// Secret fields to filter
static const std::vector<std::string> SECRET_FIELDS = {
    "password", "api_key", "apikey", "secret", "token", "access_token",
    "refresh_token", "authorization", "x-api-key"
};

// Serializes whole lines across threads
static std::mutex g_log_mutex;

// Case-insensitive substring match against SECRET_FIELDS
static bool is_secret_field(const std::string& field_name) {
    std::string lower_field = field_name;
    std::transform(lower_field.begin(), lower_field.end(), lower_field.begin(), ::tolower);

    for (const auto& secret_field : SECRET_FIELDS) {
        if (lower_field.find(secret_field) != std::string::npos) {
            return true;
        }
    }
    return false;
}

static void filter_secrets_recursive(json& obj) {
    if (obj.is_object()) {
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (is_secret_field(it.key())) {
                it.value() = "[REDACTED]";
            } else if (it.value().is_object() || it.value().is_array()) {
                filter_secrets_recursive(it.value());
            }
        }
    } else if (obj.is_array()) {
        for (auto& item : obj) {
            if (item.is_object() || item.is_array()) {
                filter_secrets_recursive(item);
            }
        }
    }
}

// ISO 8601 timestamp with microseconds
static std::string get_iso8601_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto duration = now.time_since_epoch();
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(duration) % 1000000;

    std::tm tm_buf;
    gmtime_r(&time_t, &tm_buf);

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<long>(microseconds.count()));

    return std::string(buf);
}

static const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::debug:
            return "DEBUG";
        case LogLevel::info:
            return "INFO";
        case LogLevel::warn:
            return "WARN";
        case LogLevel::error:
            return "ERROR";
    }
    return "INFO";
}

Observability::Observability(const std::string& source) : source_(source) {
    initialize_metrics();
    initialize_tracing();
}

Observability::~Observability() {
    stop_http_endpoint();
}

void Observability::initialize_metrics() {
    registry_ = std::make_shared<prometheus::Registry>();

    tasks_distributed_family_ = &prometheus::BuildCounter()
        .Name("agentswarm_tasks_distributed_total")
        .Help("Tasks handed to the coordinator, by outcome")
        .Register(*registry_);

    task_results_family_ = &prometheus::BuildCounter()
        .Name("agentswarm_task_results_total")
        .Help("Task results produced by actors")
        .Register(*registry_);

    mailbox_rejections_family_ = &prometheus::BuildCounter()
        .Name("agentswarm_mailbox_rejections_total")
        .Help("Sends rejected by an actor mailbox")
        .Register(*registry_);

    handler_errors_family_ = &prometheus::BuildCounter()
        .Name("agentswarm_handler_errors_total")
        .Help("Message handler failures contained by the actor run loop")
        .Register(*registry_);

    bus_events_dropped_family_ = &prometheus::BuildGauge()
        .Name("agentswarm_bus_events_dropped_total")
        .Help("Events dropped on full subscriber sinks")
        .Register(*registry_);

    workflow_runs_family_ = &prometheus::BuildCounter()
        .Name("agentswarm_workflow_runs_total")
        .Help("Workflow executions, by outcome")
        .Register(*registry_);

    step_duration_family_ = &prometheus::BuildHistogram()
        .Name("agentswarm_workflow_step_duration_seconds")
        .Help("Workflow step wall time from distribution to terminal event")
        .Register(*registry_);

    late_results_family_ = &prometheus::BuildCounter()
        .Name("agentswarm_late_results_total")
        .Help("Terminal events observed for steps that had already timed out")
        .Register(*registry_);
}

void Observability::initialize_tracing() {
    auto provider = opentelemetry::trace::Provider::GetTracerProvider();
    tracer_ = provider->GetTracer("agentswarm", "1.0.0");
}

LogLevel Observability::parse_log_level(const std::string& level) {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "debug") return LogLevel::debug;
    if (lower == "warn" || lower == "warning") return LogLevel::warn;
    if (lower == "error") return LogLevel::error;
    return LogLevel::info;
}

LogLevel Observability::min_log_level() {
    static const LogLevel level =
        parse_log_level(FeatureFlags::get_env_string("AGENTSWARM_LOG_LEVEL", "info"));
    return level;
}

void Observability::emit(LogLevel level,
                         const std::string& message,
                         const std::string& actor_id,
                         const std::string& task_id,
                         const std::string& workflow_id,
                         const std::string& step,
                         const log_context& context) {
    if (level < min_log_level()) {
        return;
    }
    auto line = format_json_log(level_name(level), message, actor_id, task_id, workflow_id, step, context);
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (level == LogLevel::error) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}

void Observability::log_info(const std::string& message,
                             const std::string& actor_id,
                             const std::string& task_id,
                             const std::string& workflow_id,
                             const std::string& step,
                             const log_context& context) {
    emit(LogLevel::info, message, actor_id, task_id, workflow_id, step, context);
}

void Observability::log_warn(const std::string& message,
                             const std::string& actor_id,
                             const std::string& task_id,
                             const std::string& workflow_id,
                             const std::string& step,
                             const log_context& context) {
    emit(LogLevel::warn, message, actor_id, task_id, workflow_id, step, context);
}

void Observability::log_error(const std::string& message,
                              const std::string& actor_id,
                              const std::string& task_id,
                              const std::string& workflow_id,
                              const std::string& step,
                              const log_context& context) {
    emit(LogLevel::error, message, actor_id, task_id, workflow_id, step, context);
}

void Observability::log_debug(const std::string& message,
                              const std::string& actor_id,
                              const std::string& task_id,
                              const std::string& workflow_id,
                              const std::string& step,
                              const log_context& context) {
    emit(LogLevel::debug, message, actor_id, task_id, workflow_id, step, context);
}

std::string Observability::format_json_log(const std::string& level,
                                           const std::string& message,
                                           const std::string& actor_id,
                                           const std::string& task_id,
                                           const std::string& workflow_id,
                                           const std::string& step,
                                           const log_context& context) const {
    json log_entry;

    // Required fields (always present)
    log_entry["timestamp"] = get_iso8601_timestamp();
    log_entry["level"] = level;
    log_entry["component"] = "agentswarm";
    log_entry["message"] = message;

    // Correlation fields (top level, when provided)
    if (!actor_id.empty()) {
        log_entry["actor_id"] = actor_id;
    }
    if (!task_id.empty()) {
        log_entry["task_id"] = task_id;
    }
    if (!workflow_id.empty()) {
        log_entry["workflow_id"] = workflow_id;
    }
    if (!step.empty()) {
        log_entry["step"] = step;
    }

    json context_obj;
    context_obj["source"] = source_;
    for (const auto& [key, value] : context) {
        context_obj[key] = value;
    }
    filter_secrets_recursive(context_obj);
    log_entry["context"] = context_obj;

    return log_entry.dump();
}

void Observability::record_distribution(const std::string& outcome) {
    if (!FeatureFlags::is_observability_metrics_enabled()) {
        return;
    }
    tasks_distributed_family_->Add({{"result", outcome}}).Increment();
}

void Observability::record_task_result(const std::string& actor_id, ResultStatus status) {
    if (!FeatureFlags::is_observability_metrics_enabled()) {
        return;
    }
    task_results_family_->Add({
        {"actor_id", actor_id},
        {"status", ResultConverter::status_to_string(status)}
    }).Increment();
}

void Observability::record_mailbox_rejection(const std::string& actor_id, const std::string& reason) {
    if (!FeatureFlags::is_observability_metrics_enabled()) {
        return;
    }
    mailbox_rejections_family_->Add({{"actor_id", actor_id}, {"reason", reason}}).Increment();
}

void Observability::record_handler_error(const std::string& actor_id) {
    if (!FeatureFlags::is_observability_metrics_enabled()) {
        return;
    }
    handler_errors_family_->Add({{"actor_id", actor_id}}).Increment();
}

void Observability::record_bus_drops(uint64_t dropped_total) {
    if (!FeatureFlags::is_observability_metrics_enabled()) {
        return;
    }
    bus_events_dropped_family_->Add({}).Set(static_cast<double>(dropped_total));
}

void Observability::record_workflow_run(const std::string& outcome) {
    if (!FeatureFlags::is_observability_metrics_enabled()) {
        return;
    }
    workflow_runs_family_->Add({{"status", outcome}}).Increment();
}

void Observability::record_step_duration(ResultStatus status, double duration_seconds) {
    if (!FeatureFlags::is_observability_metrics_enabled()) {
        return;
    }
    auto& histogram = step_duration_family_->Add(
        {{"status", ResultConverter::status_to_string(status)}},
        prometheus::Histogram::BucketBoundaries{0.01, 0.1, 0.5, 1.0, 5.0, 10.0, 30.0, 60.0});
    histogram.Observe(duration_seconds);
}

void Observability::record_late_result() {
    if (!FeatureFlags::is_observability_metrics_enabled()) {
        return;
    }
    late_results_family_->Add({}).Increment();
}

std::string Observability::metrics_text() const {
    if (!FeatureFlags::is_observability_metrics_enabled()) {
        return "";
    }
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

Observability::span_ptr Observability::start_span(const std::string& operation,
                                                  const std::string& actor_id,
                                                  const std::string& task_id,
                                                  const std::string& step) {
    using opentelemetry::nostd::string_view;
    return tracer_->StartSpan(operation, {
        {"actor_id", string_view(actor_id)},
        {"task_id", string_view(task_id)},
        {"step", string_view(step)},
        {"source", string_view(source_)}
    });
}

void Observability::end_span(const span_ptr& span, bool ok, const std::string& description) {
    if (!span) {
        return;
    }
    if (ok) {
        span->SetStatus(opentelemetry::trace::StatusCode::kOk);
    } else {
        span->SetStatus(opentelemetry::trace::StatusCode::kError, description);
    }
    span->End();
}

std::string Observability::get_health_response() const {
    json health_response;
    health_response["status"] = "healthy";
    health_response["timestamp"] = get_iso8601_timestamp();
    return health_response.dump();
}

static std::string http_response(const std::string& status_line,
                                 const std::string& content_type,
                                 const std::string& body) {
    return "HTTP/1.1 " + status_line + "\r\n"
           "Content-Type: " + content_type + "\r\n"
           "Content-Length: " + std::to_string(body.length()) + "\r\n"
           "Connection: close\r\n"
           "\r\n" + body;
}

void Observability::set_status_provider(status_provider provider) {
    std::lock_guard<std::mutex> lock(status_provider_mutex_);
    status_provider_ = std::move(provider);
}

std::string Observability::handle_http_request(const std::string& request) {
    if (request.rfind("GET /_health", 0) == 0) {
        return http_response("200 OK", "application/json", get_health_response());
    }
    if (request.rfind("GET /api/status", 0) == 0) {
        status_provider provider;
        {
            std::lock_guard<std::mutex> lock(status_provider_mutex_);
            provider = status_provider_;
        }
        json body = provider ? provider() : json::object();
        return http_response("200 OK", "application/json", body.dump());
    }
    if (request.rfind("GET /metrics", 0) == 0 && FeatureFlags::is_observability_metrics_enabled()) {
        return http_response("200 OK", "text/plain; version=0.0.4", metrics_text());
    }
    return http_response("404 Not Found", "text/plain", "404 Not Found");
}

void Observability::http_server_loop(int socket_fd) {
    char buffer[4096];

    while (http_server_running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(socket_fd, (struct sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            if (http_server_running_) {
                continue;
            }
            break;
        }

        ssize_t bytes_read = recv(client_fd, buffer, sizeof(buffer) - 1, 0);
        if (bytes_read > 0) {
            buffer[bytes_read] = '\0';
            std::string response = handle_http_request(std::string(buffer));
            ssize_t sent = send(client_fd, response.c_str(), response.length(), MSG_NOSIGNAL);
            if (sent < 0) {
                log_debug("Status endpoint client went away", "", "", "", "", {
                    {"error", std::strerror(errno)}
                });
            }
        }

        close(client_fd);
    }
}

bool Observability::start_http_endpoint(const std::string& address, uint16_t port, status_provider provider) {
    if (http_server_running_) {
        return true;
    }

    set_status_provider(std::move(provider));

    struct sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(port);

    if (address == "0.0.0.0" || address.empty()) {
        server_addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, address.c_str(), &server_addr.sin_addr) != 1) {
        log_error("Invalid status endpoint address", "", "", "", "", {{"address", address}});
        return false;
    }

    int socket_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (socket_fd < 0) {
        log_error("Failed to create status endpoint socket", "", "", "", "", {
            {"error", std::strerror(errno)}
        });
        return false;
    }

    int opt = 1;
    setsockopt(socket_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (bind(socket_fd, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
        log_error("Failed to bind status endpoint socket", "", "", "", "", {
            {"error", std::strerror(errno)},
            {"address", address},
            {"port", std::to_string(port)}
        });
        close(socket_fd);
        return false;
    }

    if (listen(socket_fd, 5) < 0) {
        log_error("Failed to listen on status endpoint socket", "", "", "", "", {
            {"error", std::strerror(errno)}
        });
        close(socket_fd);
        return false;
    }

    http_server_socket_ = socket_fd;
    http_server_running_ = true;
    http_server_thread_ = std::thread(&Observability::http_server_loop, this, socket_fd);

    log_info("Status endpoint started", "", "", "", "", {
        {"address", address},
        {"port", std::to_string(port)}
    });
    return true;
}

void Observability::stop_http_endpoint() {
    if (!http_server_running_) {
        return;
    }

    http_server_running_ = false;

    // Unblock accept()
    if (http_server_socket_ >= 0) {
        shutdown(http_server_socket_, SHUT_RDWR);
        close(http_server_socket_);
        http_server_socket_ = -1;
    }

    if (http_server_thread_.joinable()) {
        http_server_thread_.join();
    }

    log_info("Status endpoint stopped");
}

} // namespace engine
} // namespace agentswarm
