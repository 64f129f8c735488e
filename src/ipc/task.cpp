#include "ipc/task.hpp"
#include "ipc/errors.hpp"

using json = nlohmann::json;

namespace agentbus::ipc {

namespace {

// Optional fields: absent, null and mistyped all read as the fallback
std::string optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_string() ? it->get<std::string>() : std::string();
}

template <typename T>
T optional_number(const json& j, const char* key, T fallback) {
    auto it = j.find(key);
    return it != j.end() && it->is_number() ? it->get<T>() : fallback;
}

} // namespace

const char* task_status_to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::COMPLETED: return "COMPLETED";
        case TaskStatus::FAILED:    return "FAILED";
        case TaskStatus::TIMEOUT:   return "TIMEOUT";
        case TaskStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

std::optional<TaskStatus> task_status_from_string(const std::string& name) {
    if (name == "COMPLETED") return TaskStatus::COMPLETED;
    if (name == "FAILED")    return TaskStatus::FAILED;
    if (name == "TIMEOUT")   return TaskStatus::TIMEOUT;
    if (name == "CANCELLED") return TaskStatus::CANCELLED;
    return std::nullopt;
}

json TaskRequest::to_json() const {
    json j;
    j["taskId"] = task_id;
    j["taskType"] = task_type;
    j["parameters"] = parameters;
    j["metadata"] = metadata;
    if (priority) {
        j["priority"] = *priority;
    }
    return j;
}

TaskRequest TaskRequest::from_json(const json& j) {
    std::vector<std::string> errors;
    if (!j.is_object()) {
        throw ValidationError({"payload"});
    }
    if (!j.contains("taskId") || !j["taskId"].is_string() || j["taskId"].get<std::string>().empty()) {
        errors.push_back("taskId");
    }
    if (!j.contains("taskType") || !j["taskType"].is_string() || j["taskType"].get<std::string>().empty()) {
        errors.push_back("taskType");
    }
    if (j.contains("priority") && !j["priority"].is_null() && !j["priority"].is_number_integer()) {
        errors.push_back("priority");
    }
    if (!errors.empty()) {
        throw ValidationError(std::move(errors));
    }

    TaskRequest request;
    request.task_id = j["taskId"].get<std::string>();
    request.task_type = j["taskType"].get<std::string>();
    if (j.contains("parameters") && !j["parameters"].is_null()) {
        request.parameters = j["parameters"];
    }
    if (j.contains("metadata") && !j["metadata"].is_null()) {
        request.metadata = j["metadata"];
    }
    if (j.contains("priority") && !j["priority"].is_null()) {
        request.priority = j["priority"].get<int>();
    }
    return request;
}

json TaskResponse::to_json() const {
    json j;
    j["taskId"] = task_id;
    j["status"] = task_status_to_string(status);
    if (!result.is_null()) {
        j["result"] = result;
    }
    if (!error_code.empty()) {
        j["errorCode"] = error_code;
    }
    if (!error_message.empty()) {
        j["errorMessage"] = error_message;
    }
    j["metrics"] = {
        {"processingTimeMs", metrics.processing_time_ms},
        {"queueTimeMs", metrics.queue_time_ms},
        {"retryCount", metrics.retry_count},
        {"tokensUsed", metrics.tokens_used},
        {"costUsd", metrics.cost_usd}
    };
    j["warnings"] = warnings;
    return j;
}

TaskResponse TaskResponse::from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError({"payload"});
    }
    std::vector<std::string> errors;
    if (!j.contains("taskId") || !j["taskId"].is_string()) {
        errors.push_back("taskId");
    }
    std::optional<TaskStatus> status;
    if (j.contains("status") && j["status"].is_string()) {
        status = task_status_from_string(j["status"].get<std::string>());
    }
    if (!status) {
        errors.push_back("status");
    }
    if (!errors.empty()) {
        throw ValidationError(std::move(errors));
    }

    TaskResponse response;
    response.task_id = j["taskId"].get<std::string>();
    response.status = *status;
    if (j.contains("result") && !j["result"].is_null()) {
        response.result = j["result"];
    }
    response.error_code = optional_string(j, "errorCode");
    response.error_message = optional_string(j, "errorMessage");

    if (j.contains("metrics") && j["metrics"].is_object()) {
        const auto& m = j["metrics"];
        response.metrics.processing_time_ms = optional_number(m, "processingTimeMs", int64_t{0});
        response.metrics.queue_time_ms = optional_number(m, "queueTimeMs", int64_t{0});
        response.metrics.retry_count = optional_number(m, "retryCount", 0);
        response.metrics.tokens_used = optional_number(m, "tokensUsed", uint64_t{0});
        response.metrics.cost_usd = optional_number(m, "costUsd", 0.0);
    }
    if (j.contains("warnings") && j["warnings"].is_array()) {
        for (const auto& w : j["warnings"]) {
            if (w.is_string()) {
                response.warnings.push_back(w.get<std::string>());
            }
        }
    }
    return response;
}

TaskResponse TaskResponse::completed(const std::string& task_id, json result) {
    TaskResponse response;
    response.task_id = task_id;
    response.status = TaskStatus::COMPLETED;
    response.result = std::move(result);
    return response;
}

TaskResponse TaskResponse::failed(const std::string& task_id, const std::string& code,
                                  const std::string& message) {
    TaskResponse response;
    response.task_id = task_id;
    response.status = TaskStatus::FAILED;
    response.error_code = code;
    response.error_message = message;
    return response;
}

Envelope make_task_response_envelope(const Envelope& request, const std::string& sender,
                                      const TaskResponse& response) {
    Envelope env = make_envelope(MessageType::TASK_RESPONSE, sender, request.sender,
                                 response.to_json());
    env.correlation_id = request.correlation_id.value_or(request.id);
    env.trace_id = request.trace_id;
    env.context = request.context;
    env.context.span_id = env.span_id;
    return env;
}

} // namespace agentbus::ipc
