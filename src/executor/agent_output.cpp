/**
 * @file agent_output.cpp
 * @brief Agent JSON output parsing with nlohmann/json.
 */

#include "executor/agent_output.hpp"

#include "executor/cost.hpp"

#include <nlohmann/json.hpp>

namespace agent_exec {

namespace {

uint64_t read_token_count(const nlohmann::json& usage, const char* key) {
    auto it = usage.find(key);
    if (it == usage.end() || !it->is_number()) return 0;
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    if (it->is_number_integer()) {
        auto value = it->get<int64_t>();
        return value > 0 ? static_cast<uint64_t>(value) : 0;
    }
    auto value = it->get<double>();
    return value > 0 ? static_cast<uint64_t>(value) : 0;
}

}  // namespace

Result<AgentOutput> parse_agent_output(std::string_view json_text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        return Error{ErrorCode::Execution, e.what()};
    }

    if (!doc.is_object()) {
        return Error{ErrorCode::Execution,
                     std::string("expected a JSON object, got ") + doc.type_name()};
    }

    AgentOutput output;
    if (auto it = doc.find("result"); it != doc.end() && it->is_string()) {
        output.completion = it->get<std::string>();
    }
    if (auto it = doc.find("usage"); it != doc.end() && it->is_object()) {
        output.usage.input_tokens = read_token_count(*it, "input_tokens");
        output.usage.output_tokens = read_token_count(*it, "output_tokens");
    }
    return output;
}

std::string tail(std::string_view text, size_t max_chars) {
    if (text.size() <= max_chars) return std::string(text);
    return std::string(text.substr(text.size() - max_chars));
}

TaskResult interpret_agent_exit(const TaskId& task_id,
                                std::string_view model,
                                int exit_code,
                                std::string_view stdout_text,
                                std::string_view stderr_text) {
    if (exit_code != 0) {
        return TaskResult::failure(task_id, TaskStatus::Failed,
                                   "Process exited with code " + std::to_string(exit_code)
                                       + "\nStderr: " + std::string(stderr_text));
    }

    auto parsed = parse_agent_output(stdout_text);
    if (!parsed) {
        return TaskResult::failure(task_id, TaskStatus::Failed,
                                   "Failed to parse JSON output: " + parsed.error().message
                                       + "\nOutput: " + std::string(stdout_text)
                                       + "\nStderr: " + tail(stderr_text));
    }

    auto& output = parsed.value();
    double cost = calculate_cost(model, output.usage);
    return TaskResult::completed(task_id, std::move(output.completion), output.usage, cost);
}

}  // namespace agent_exec
