/**
 * @file metrics_collector.hpp
 * @brief Structured usage/cost events for budget and audit consumers.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string_view>

namespace agent_exec {

/**
 * @brief Per-task context that TaskResult itself does not carry.
 */
struct TaskAccounting {
    std::string_view project_id;
    std::string_view model;
    Milliseconds duration{0};
};

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_task_result(const TaskResult& result, const TaskAccounting& accounting);
    void record_sandbox_event(const TaskId& task_id, const ContainerId& container_id,
                              std::string_view event_type);
    void record_drain(size_t completed, size_t killed);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace agent_exec
