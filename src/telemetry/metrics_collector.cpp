/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <iomanip>
#include <sstream>

namespace agent_exec {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_task_result(const TaskResult& result,
                                          const TaskAccounting& accounting) {
    std::ostringstream oss;
    oss << R"({"event":"task_result")"
        << R"(,"task":")" << escape_json(result.task_id) << "\""
        << R"(,"project":")" << escape_json(accounting.project_id) << "\""
        << R"(,"model":")" << escape_json(accounting.model) << "\""
        << R"(,"status":")" << to_string(result.status) << "\""
        << R"(,"duration_ms":)" << accounting.duration.count();
    if (result.usage) {
        oss << R"(,"input_tokens":)" << result.usage->input_tokens
            << R"(,"output_tokens":)" << result.usage->output_tokens;
    }
    if (result.cost) {
        oss << R"(,"cost_usd":)" << std::fixed << std::setprecision(6) << *result.cost;
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_sandbox_event(const TaskId& task_id,
                                            const ContainerId& container_id,
                                            std::string_view event_type) {
    std::ostringstream oss;
    oss << R"({"event":"sandbox_)" << event_type << "\""
        << R"(,"task":")" << escape_json(task_id) << "\""
        << R"(,"container":")" << escape_json(container_id) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_drain(size_t completed, size_t killed) {
    std::ostringstream oss;
    oss << R"({"event":"drain_summary")"
        << R"(,"completed":)" << completed
        << R"(,"killed":)" << killed
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << escape_json(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace agent_exec
