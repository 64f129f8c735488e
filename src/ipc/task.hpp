#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ipc/envelope.hpp"

namespace agentbus::ipc {

enum class TaskStatus {
    COMPLETED,
    FAILED,
    TIMEOUT,
    CANCELLED
};

const char* task_status_to_string(TaskStatus status);
std::optional<TaskStatus> task_status_from_string(const std::string& name);

struct TaskRequest {
    std::string task_id;
    std::string task_type;
    nlohmann::json parameters = nlohmann::json::object();
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<int> priority;

    nlohmann::json to_json() const;
    // Throws ValidationError naming missing taskId/taskType
    static TaskRequest from_json(const nlohmann::json& j);
};

struct TaskMetrics {
    int64_t processing_time_ms = 0;
    int64_t queue_time_ms = 0;
    int retry_count = 0;
    uint64_t tokens_used = 0;
    double cost_usd = 0.0;
};

struct TaskResponse {
    std::string task_id;
    TaskStatus status = TaskStatus::COMPLETED;
    nlohmann::json result;
    std::string error_code;
    std::string error_message;
    TaskMetrics metrics;
    std::vector<std::string> warnings;

    nlohmann::json to_json() const;
    // Throws ValidationError naming missing taskId/status
    static TaskResponse from_json(const nlohmann::json& j);

    static TaskResponse completed(const std::string& task_id, nlohmann::json result);
    static TaskResponse failed(const std::string& task_id, const std::string& code,
                               const std::string& message);
};

// Reply addressed to the request's sender, correlated to the request's
// correlation id (or its envelope id when the request carried none)
Envelope make_task_response_envelope(const Envelope& request, const std::string& sender,
                                      const TaskResponse& response);

} // namespace agentbus::ipc
