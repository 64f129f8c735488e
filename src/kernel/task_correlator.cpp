#include "kernel/task_correlator.hpp"
#include "ipc/errors.hpp"
#include "kernel/trace_context.hpp"
#include "metrics/metrics.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <vector>

namespace agentbus::kernel {

TaskCorrelator::TaskCorrelator(ipc::Transport& transport, Reactor& reactor,
                               metrics::MetricsCollector& metrics)
    : transport_(transport), reactor_(reactor), metrics_(metrics) {}

TaskCorrelator::~TaskCorrelator() {
    std::unordered_map<std::string, Pending> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(pending_);
    }
    for (auto& [task_id, entry] : pending) {
        reactor_.cancel_timer(entry.timer);
        if (entry.unsubscribe) {
            entry.unsubscribe();
        }
        entry.promise.set_exception(std::make_exception_ptr(ipc::TaskCancelledError(task_id)));
    }
    if (!pending.empty()) {
        spdlog::debug("Correlator cancelled {} pending task(s)", pending.size());
    }
}

std::future<ipc::TaskResponse> TaskCorrelator::send_task_request(const ipc::TaskRequest& request,
                                                                 const std::string& recipient,
                                                                 const std::string& sender,
                                                                 int timeout_ms) {
    const std::string task_id = request.task_id;
    if (task_id.empty() || request.task_type.empty()) {
        std::vector<std::string> fields;
        if (task_id.empty()) fields.push_back("taskId");
        if (request.task_type.empty()) fields.push_back("taskType");
        std::promise<ipc::TaskResponse> rejected;
        rejected.set_exception(std::make_exception_ptr(ipc::ValidationError(std::move(fields))));
        return rejected.get_future();
    }

    std::future<ipc::TaskResponse> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_.count(task_id)) {
            throw std::invalid_argument("task " + task_id + " is already pending");
        }
        Pending entry;
        entry.timeout_ms = timeout_ms;
        future = entry.promise.get_future();
        pending_.emplace(task_id, std::move(entry));
    }

    ipc::Envelope envelope = ipc::make_envelope(ipc::MessageType::TASK_REQUEST, sender, recipient,
                                                request.to_json());
    envelope.correlation_id = task_id;

    TraceContext trace = TraceContext::current().child();
    envelope.trace_id = trace.trace_id;
    envelope.span_id = trace.span_id;
    envelope.context = ipc::PropagationContext{};
    inject(trace, envelope.context);
    envelope.context.request_id = task_id;
    envelope.context.timeout_ms = timeout_ms;

    envelope.delivery = ipc::DeliveryPolicy{};
    envelope.delivery.priority = request.priority.value_or(5);

    // Registered before sending: an in-process reply can arrive inside send()
    ipc::Unsubscribe unsubscribe = transport_.subscribe(sender,
        [this, task_id](const ipc::Envelope& reply) {
            if (reply.message_type == ipc::MessageType::TASK_RESPONSE &&
                reply.correlation_id == task_id) {
                on_response(task_id, reply);
            }
        });
    TimerId timer = reactor_.add_timer(timeout_ms, [this, task_id]() { on_timeout(task_id); });
    bool settled = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(task_id);
        if (it == pending_.end()) {
            settled = true; // the loop thread timed it out already
        } else {
            it->second.unsubscribe = unsubscribe;
            it->second.timer = timer;
        }
    }
    if (settled) {
        reactor_.cancel_timer(timer);
        unsubscribe();
        return future;
    }

    spdlog::debug("task_request task_id={} recipient={} sender={} trace_id={} timeout={}ms",
                  task_id, recipient, sender, envelope.trace_id, timeout_ms);

    try {
        transport_.send(envelope);
    } catch (const std::exception& e) {
        spdlog::warn("task_request task_id={} send failed: {}", task_id, e.what());
        if (auto entry = take(task_id)) {
            entry->promise.set_exception(std::current_exception());
        }
    }
    return future;
}

bool TaskCorrelator::abandon(const std::string& task_id) {
    auto entry = take(task_id);
    if (!entry) {
        return false;
    }
    spdlog::debug("task_request task_id={} abandoned", task_id);
    entry->promise.set_exception(std::make_exception_ptr(ipc::TaskCancelledError(task_id)));
    return true;
}

size_t TaskCorrelator::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::optional<TaskCorrelator::Pending> TaskCorrelator::take(const std::string& task_id) {
    std::optional<Pending> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(task_id);
        if (it == pending_.end()) {
            return std::nullopt;
        }
        entry = std::move(it->second);
        pending_.erase(it);
    }

    reactor_.cancel_timer(entry->timer);
    if (entry->unsubscribe) {
        entry->unsubscribe();
    }
    return entry;
}

void TaskCorrelator::on_response(const std::string& task_id, const ipc::Envelope& envelope) {
    auto entry = take(task_id);
    if (!entry) {
        return; // already timed out or abandoned
    }

    ipc::TaskResponse response;
    try {
        response = ipc::TaskResponse::from_json(envelope.payload);
    } catch (const std::exception& e) {
        spdlog::warn("task_response task_id={} malformed: {}", task_id, e.what());
        entry->promise.set_exception(std::current_exception());
        return;
    }

    metrics_.increment("task_completed", {{"status", ipc::task_status_to_string(response.status)}});
    spdlog::debug("task_response task_id={} status={} from={}", task_id,
                  ipc::task_status_to_string(response.status), envelope.sender);
    entry->promise.set_value(std::move(response));
}

void TaskCorrelator::on_timeout(const std::string& task_id) {
    auto entry = take(task_id);
    if (!entry) {
        return;
    }

    metrics_.increment("task_timeout");
    spdlog::warn("task_timeout task_id={} after {}ms", task_id, entry->timeout_ms);
    entry->promise.set_exception(
        std::make_exception_ptr(ipc::TaskTimeoutError(task_id, entry->timeout_ms)));
}

} // namespace agentbus::kernel
