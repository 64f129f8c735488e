#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "ipc/transport.hpp"
#include "kernel/reactor.hpp"
#include "kernel/trace_context.hpp"

namespace agentbus::metrics {
class MetricsCollector;
} // namespace agentbus::metrics

namespace agentbus::ipc {

struct InProcessOptions {
    size_t max_queue_size = 1000;
    int dedup_window_ms = 60000;
    size_t dedup_max_entries = 100000;
};

// Event bus keyed by recipient name. Delivery is synchronous on the thread that
// drains a recipient's queue; per-recipient order is enqueue order.
class InProcessTransport final : public Transport {
public:
    InProcessTransport(metrics::MetricsCollector& metrics, const InProcessOptions& options = {});
    ~InProcessTransport() override;

    InProcessTransport(const InProcessTransport&) = delete;
    InProcessTransport& operator=(const InProcessTransport&) = delete;

    // Fire-and-forget: malformed input, duplicates, missing subscribers and a
    // full queue are counted and logged, never thrown
    void publish(const nlohmann::json& raw);

    // Throws ValidationError / QueueFullError
    void send(const Envelope& envelope) override;

    Unsubscribe subscribe(const std::string& recipient, EnvelopeHandler handler) override;

    // Drop every subscription, queued envelope and dedup entry
    void dispose();

    // Evict dedup entries older than the window; returns how many went
    size_t evict_expired();

    // Run evict_expired on the event loop every interval_ms
    void start_sweeper(kernel::Reactor& reactor, int interval_ms);
    void stop_sweeper();

    size_t queue_depth(const std::string& recipient) const;
    size_t subscriber_count(const std::string& recipient) const;
    size_t dedup_size() const;

    const char* name() const override { return "in_process"; }

private:
    using Clock = std::chrono::steady_clock;

    // Shared with in-flight deliveries so unsubscribing mid-delivery is safe
    struct Registration {
        explicit Registration(EnvelopeHandler h) : handler(std::move(h)) {}
        EnvelopeHandler handler;
        std::atomic<bool> active{true};
    };

    struct Subscriber {
        uint64_t id;
        std::shared_ptr<Registration> registration;
    };

    struct Pending {
        uint64_t seq;
        Envelope envelope;
        kernel::TraceContext context;
    };

    struct Channel {
        std::vector<Subscriber> subscribers;
        std::deque<Pending> queue;
        bool draining = false;
    };

    metrics::MetricsCollector& metrics_;
    InProcessOptions options_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Channel> channels_;
    uint64_t next_subscriber_id_ = 1;
    uint64_t next_seq_ = 1;

    mutable std::mutex dedup_mutex_;
    std::unordered_map<std::string, Clock::time_point> seen_;
    std::deque<std::pair<std::string, Clock::time_point>> seen_order_;

    kernel::Reactor* sweeper_reactor_ = nullptr;
    kernel::TimerId sweeper_timer_ = 0;

    // Expires with the bus so late unsubscribe calls become no-ops
    std::shared_ptr<int> alive_ = std::make_shared<int>(0);

    // Records the id; false if it was already seen inside the window
    bool remember(const std::string& id);

    void drain(const std::string& recipient);
    void deliver(const std::string& recipient, const Pending& pending,
                 const std::vector<Subscriber>& subscribers);
    void unsubscribe(const std::string& recipient, uint64_t id);
};

} // namespace agentbus::ipc
