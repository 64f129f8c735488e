#pragma once
#include <exception>
#include <future>
#include <string>
#include <nlohmann/json.hpp>
#include "ipc/task.hpp"
#include "kernel/task_correlator.hpp"

namespace agentbus::services::bridge {

// HTTP-style reply handed back to the legacy front door
struct HttpReply {
    int status = 200;
    nlohmann::json body;
};

// COMPLETED 200, FAILED 500, TIMEOUT 408, CANCELLED 499
int http_status_for(ipc::TaskStatus status);

// `taskType` is required; `taskId` is generated when absent, `parameters` and
// `metadata` default to empty objects. Throws ValidationError.
ipc::TaskRequest build_request(const nlohmann::json& body);

HttpReply format_response(const ipc::TaskResponse& response);

// Timeouts become 408, cancellations 499, validation errors 400, anything else 500
HttpReply format_failure(const std::string& task_id, std::exception_ptr error);

struct PendingCall {
    std::string task_id;
    std::future<ipc::TaskResponse> future;
};

// Adapts request/response style callers onto the correlation layer
class LegacyBridge {
public:
    LegacyBridge(kernel::TaskCorrelator& correlator, std::string sender,
                 int timeout_ms = kernel::DEFAULT_TASK_TIMEOUT_MS);

    // Throws ValidationError for a malformed body
    PendingCall submit(const nlohmann::json& body, const std::string& recipient);

    // Format the settled call; blocks if the future is not ready yet. Call it
    // from a thread other than the loop's unless the future is ready, since
    // timeouts and socket replies only arrive while the loop runs.
    HttpReply collect(PendingCall& call);

    const std::string& sender() const { return sender_; }

private:
    kernel::TaskCorrelator& correlator_;
    std::string sender_;
    int timeout_ms_;
};

} // namespace agentbus::services::bridge
