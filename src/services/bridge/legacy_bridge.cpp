#include "services/bridge/legacy_bridge.hpp"
#include "ipc/errors.hpp"
#include "util/uid.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace agentbus::services::bridge {

namespace {

HttpReply task_reply(const std::string& task_id, ipc::TaskStatus status,
                     const std::string& code, const std::string& message) {
    ipc::TaskResponse response;
    response.task_id = task_id;
    response.status = status;
    response.error_code = code;
    response.error_message = message;
    return format_response(response);
}

} // namespace

int http_status_for(ipc::TaskStatus status) {
    switch (status) {
        case ipc::TaskStatus::COMPLETED: return 200;
        case ipc::TaskStatus::FAILED:    return 500;
        case ipc::TaskStatus::TIMEOUT:   return 408;
        case ipc::TaskStatus::CANCELLED: return 499;
    }
    return 500;
}

ipc::TaskRequest build_request(const json& body) {
    if (!body.is_object()) {
        throw ipc::ValidationError({"body"});
    }

    json normalized = body;
    auto task_id = normalized.find("taskId");
    if (task_id == normalized.end() || task_id->is_null() ||
        (task_id->is_string() && task_id->get_ref<const std::string&>().empty())) {
        normalized["taskId"] = util::generate_uuid();
    }
    return ipc::TaskRequest::from_json(normalized);
}

HttpReply format_response(const ipc::TaskResponse& response) {
    return HttpReply{http_status_for(response.status), response.to_json()};
}

HttpReply format_failure(const std::string& task_id, std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const ipc::TaskTimeoutError& e) {
        return task_reply(task_id, ipc::TaskStatus::TIMEOUT, "TIMEOUT", e.what());
    } catch (const ipc::TaskCancelledError& e) {
        return task_reply(task_id, ipc::TaskStatus::CANCELLED, "CANCELLED", e.what());
    } catch (const ipc::ValidationError& e) {
        return HttpReply{400, {{"error", "invalid_request"},
                               {"fields", e.fields()},
                               {"message", e.what()}}};
    } catch (const std::exception& e) {
        return task_reply(task_id, ipc::TaskStatus::FAILED, "INTERNAL_ERROR", e.what());
    }
}

LegacyBridge::LegacyBridge(kernel::TaskCorrelator& correlator, std::string sender, int timeout_ms)
    : correlator_(correlator), sender_(std::move(sender)), timeout_ms_(timeout_ms) {}

PendingCall LegacyBridge::submit(const json& body, const std::string& recipient) {
    ipc::TaskRequest request = build_request(body);
    spdlog::info("bridge_request task_id={} task_type={} recipient={}",
                 request.task_id, request.task_type, recipient);
    return PendingCall{request.task_id,
                       correlator_.send_task_request(request, recipient, sender_, timeout_ms_)};
}

HttpReply LegacyBridge::collect(PendingCall& call) {
    HttpReply reply;
    try {
        reply = format_response(call.future.get());
    } catch (const std::exception&) {
        reply = format_failure(call.task_id, std::current_exception());
    }
    spdlog::info("bridge_response task_id={} status={}", call.task_id, reply.status);
    return reply;
}

} // namespace agentbus::services::bridge
