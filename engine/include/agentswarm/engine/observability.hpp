#pragma once

#include "agentswarm/engine/core.hpp"
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/tracer.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace agentswarm {
namespace engine {

enum class LogLevel {
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

class Observability {
public:
    using span_ptr = opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span>;
    using log_context = std::unordered_map<std::string, std::string>;
    // Produces the body of GET /api/status
    using status_provider = std::function<nlohmann::json()>;

    explicit Observability(const std::string& source);
    ~Observability();

    Observability(const Observability&) = delete;
    Observability& operator=(const Observability&) = delete;

    const std::string& source() const { return source_; }

    // Logging
    void log_info(const std::string& message,
                  const std::string& actor_id = "",
                  const std::string& task_id = "",
                  const std::string& workflow_id = "",
                  const std::string& step = "",
                  const log_context& context = {});

    void log_warn(const std::string& message,
                  const std::string& actor_id = "",
                  const std::string& task_id = "",
                  const std::string& workflow_id = "",
                  const std::string& step = "",
                  const log_context& context = {});

    void log_error(const std::string& message,
                   const std::string& actor_id = "",
                   const std::string& task_id = "",
                   const std::string& workflow_id = "",
                   const std::string& step = "",
                   const log_context& context = {});

    void log_debug(const std::string& message,
                   const std::string& actor_id = "",
                   const std::string& task_id = "",
                   const std::string& workflow_id = "",
                   const std::string& step = "",
                   const log_context& context = {});

    // One JSON log line, without the trailing newline
    std::string format_json_log(const std::string& level,
                                const std::string& message,
                                const std::string& actor_id,
                                const std::string& task_id,
                                const std::string& workflow_id,
                                const std::string& step,
                                const log_context& context) const;

    // Threshold from AGENTSWARM_LOG_LEVEL, read once
    static LogLevel min_log_level();
    static LogLevel parse_log_level(const std::string& level);

    // Metrics (gated behind AGENTSWARM_OBSERVABILITY_METRICS_ENABLED)
    void record_distribution(const std::string& outcome);
    void record_task_result(const std::string& actor_id, ResultStatus status);
    void record_mailbox_rejection(const std::string& actor_id, const std::string& reason);
    void record_handler_error(const std::string& actor_id);
    void record_bus_drops(uint64_t dropped_total);
    void record_workflow_run(const std::string& outcome);
    void record_step_duration(ResultStatus status, double duration_seconds);
    void record_late_result();

    // Prometheus text exposition; empty when metrics are disabled
    std::string metrics_text() const;

    std::shared_ptr<prometheus::Registry> registry() { return registry_; }

    // Tracing
    span_ptr start_span(const std::string& operation,
                        const std::string& actor_id,
                        const std::string& task_id,
                        const std::string& step = "");
    void end_span(const span_ptr& span, bool ok, const std::string& description = "");

    // Read-only HTTP endpoint: /_health, /api/status, /metrics
    bool start_http_endpoint(const std::string& address, uint16_t port, status_provider provider);
    void stop_http_endpoint();
    bool http_endpoint_running() const { return http_server_running_; }

    // Body source for GET /api/status; also set by start_http_endpoint
    void set_status_provider(status_provider provider);

    // Routes one request line ("GET /path HTTP/1.1") to a full HTTP response
    std::string handle_http_request(const std::string& request);

private:
    std::string source_;
    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Family<prometheus::Counter>* tasks_distributed_family_;
    prometheus::Family<prometheus::Counter>* task_results_family_;
    prometheus::Family<prometheus::Counter>* mailbox_rejections_family_;
    prometheus::Family<prometheus::Counter>* handler_errors_family_;
    prometheus::Family<prometheus::Gauge>* bus_events_dropped_family_;
    prometheus::Family<prometheus::Counter>* workflow_runs_family_;
    prometheus::Family<prometheus::Histogram>* step_duration_family_;
    prometheus::Family<prometheus::Counter>* late_results_family_;

    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;

    std::thread http_server_thread_;
    std::atomic<bool> http_server_running_{false};
    int http_server_socket_{-1};
    std::mutex status_provider_mutex_;
    status_provider status_provider_;

    void initialize_metrics();
    void initialize_tracing();
    void emit(LogLevel level,
              const std::string& message,
              const std::string& actor_id,
              const std::string& task_id,
              const std::string& workflow_id,
              const std::string& step,
              const log_context& context);
    void http_server_loop(int socket_fd);
    std::string get_health_response() const;
};

} // namespace engine
} // namespace agentswarm
