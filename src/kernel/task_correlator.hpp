#pragma once
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "ipc/task.hpp"
#include "ipc/transport.hpp"
#include "kernel/reactor.hpp"

namespace agentbus::metrics {
class MetricsCollector;
} // namespace agentbus::metrics

namespace agentbus::kernel {

constexpr int DEFAULT_TASK_TIMEOUT_MS = 30000;

// Turns one-way delivery into an awaitable task call. Each request registers a
// one-shot handler on the sender's inbox and a timer on the reactor; whichever
// fires first settles the future.
// Callable from any thread when the transport is; the in-process bus and the
// router's peer routes are.
class TaskCorrelator {
public:
    TaskCorrelator(ipc::Transport& transport, Reactor& reactor, metrics::MetricsCollector& metrics);
    ~TaskCorrelator();

    TaskCorrelator(const TaskCorrelator&) = delete;
    TaskCorrelator& operator=(const TaskCorrelator&) = delete;

    // Send a TASK_REQUEST correlated by task id. The future fails with
    // TaskTimeoutError after timeout_ms, or with whatever the transport threw.
    // Throws std::invalid_argument if the task id is already pending.
    std::future<ipc::TaskResponse> send_task_request(const ipc::TaskRequest& request,
                                                     const std::string& recipient,
                                                     const std::string& sender,
                                                     int timeout_ms = DEFAULT_TASK_TIMEOUT_MS);

    // Give up on a pending task; its future fails with TaskCancelledError
    bool abandon(const std::string& task_id);

    size_t pending_count() const;

private:
    struct Pending {
        std::promise<ipc::TaskResponse> promise;
        ipc::Unsubscribe unsubscribe;
        TimerId timer = 0;
        int timeout_ms = 0;
    };

    ipc::Transport& transport_;
    Reactor& reactor_;
    metrics::MetricsCollector& metrics_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Pending> pending_;

    // Remove the entry, cancel its timer and handler; nullopt if already settled
    std::optional<Pending> take(const std::string& task_id);

    void on_response(const std::string& task_id, const ipc::Envelope& envelope);
    void on_timeout(const std::string& task_id);
};

} // namespace agentbus::kernel
