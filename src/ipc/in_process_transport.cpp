#include "ipc/in_process_transport.hpp"
#include "ipc/errors.hpp"
#include "metrics/metrics.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

using json = nlohmann::json;

namespace agentbus::ipc {

InProcessTransport::InProcessTransport(metrics::MetricsCollector& metrics,
                                       const InProcessOptions& options)
    : metrics_(metrics), options_(options) {
    spdlog::debug("In-process transport created (max_queue={}, dedup_window={}ms)",
                  options_.max_queue_size, options_.dedup_window_ms);
}

InProcessTransport::~InProcessTransport() {
    stop_sweeper();
}

void InProcessTransport::publish(const json& raw) {
    Envelope envelope;
    try {
        envelope = validate(raw);
    } catch (const ValidationError& e) {
        spdlog::warn("message_dropped reason=invalid transport=in_process error=\"{}\"", e.what());
        metrics_.increment("message_dropped", {{"reason", "invalid"}, {"transport", name()}});
        return;
    }

    try {
        send(envelope);
    } catch (const QueueFullError& e) {
        spdlog::warn("message_dropped reason=queue_full transport=in_process id={} error=\"{}\"",
                     envelope.id, e.what());
    }
}

void InProcessTransport::send(const Envelope& envelope) {
    check(envelope);

    // Context active at send time, falling back to what the envelope carries
    kernel::TraceContext context = kernel::TraceContext::current();
    kernel::TraceContext carried = kernel::extract(envelope);
    if (context.empty()) {
        context = carried;
    } else {
        context.baggage.insert(carried.baggage.begin(), carried.baggage.end());
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = channels_.find(envelope.recipient);
        if (it == channels_.end() || it->second.subscribers.empty()) {
            lock.unlock();
            spdlog::debug("message_dropped reason=no_handler recipient={} id={}",
                          envelope.recipient, envelope.id);
            metrics_.increment("message_dropped", {{"reason", "no_handler"}, {"transport", name()}});
            return;
        }

        Channel& channel = it->second;
        if (channel.queue.size() >= options_.max_queue_size) {
            lock.unlock();
            metrics_.increment("message_dropped", {{"reason", "queue_full"}, {"transport", name()}});
            throw QueueFullError(envelope.recipient, options_.max_queue_size);
        }

        if (!remember(envelope.id)) {
            lock.unlock();
            spdlog::debug("message_dropped reason=duplicate recipient={} id={}",
                          envelope.recipient, envelope.id);
            metrics_.increment("message_dropped", {{"reason", "duplicate"}, {"transport", name()}});
            return;
        }

        channel.queue.push_back(Pending{next_seq_++, envelope, std::move(context)});
        metrics_.increment("message_sent", {{"transport", name()}});

        // An active drain (possibly further up this very stack) delivers it in order
        if (channel.draining) {
            return;
        }
        channel.draining = true;
    }

    drain(envelope.recipient);
}

void InProcessTransport::drain(const std::string& recipient) {
    while (true) {
        Pending pending;
        std::vector<Subscriber> subscribers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = channels_.find(recipient);
            if (it == channels_.end()) {
                return; // disposed mid-drain
            }
            Channel& channel = it->second;
            if (channel.queue.empty()) {
                channel.draining = false;
                if (channel.subscribers.empty()) {
                    channels_.erase(it);
                }
                return;
            }
            pending = channel.queue.front();
            subscribers = channel.subscribers;
        }

        try {
            deliver(recipient, pending, subscribers);
        } catch (...) {
            // Release the channel so later sends start a fresh drain
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = channels_.find(recipient);
            if (it != channels_.end()) {
                it->second.draining = false;
            }
            throw;
        }

        // Leaves the queue only once every handler ran
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(recipient);
        if (it != channels_.end() && !it->second.queue.empty() &&
            it->second.queue.front().seq == pending.seq) {
            it->second.queue.pop_front();
        }
    }
}

void InProcessTransport::deliver(const std::string& recipient, const Pending& pending,
                                 const std::vector<Subscriber>& subscribers) {
    kernel::ScopedTraceContext scope(pending.context);

    for (const auto& subscriber : subscribers) {
        if (!subscriber.registration->active.load()) {
            continue;
        }
        try {
            subscriber.registration->handler(pending.envelope);
        } catch (const std::exception& e) {
            DeliveryError error(recipient, e.what());
            spdlog::error("message_error transport=in_process id={} subscriber={} error=\"{}\"",
                          pending.envelope.id, subscriber.id, error.what());
            metrics_.increment("message_error", {{"reason", "handler"}, {"transport", name()}});
        } catch (...) {
            spdlog::error("message_error transport=in_process id={} subscriber={} "
                          "error=\"non-standard exception\"",
                          pending.envelope.id, subscriber.id);
            metrics_.increment("message_error", {{"reason", "handler"}, {"transport", name()}});
        }
    }
    metrics_.increment("message_received", {{"transport", name()}});
}

Unsubscribe InProcessTransport::subscribe(const std::string& recipient, EnvelopeHandler handler) {
    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_subscriber_id_++;
        channels_[recipient].subscribers.push_back(
            Subscriber{id, std::make_shared<Registration>(std::move(handler))});
    }
    spdlog::debug("Subscribed {} to '{}'", id, recipient);

    std::weak_ptr<int> alive = alive_;
    return [this, alive, recipient, id]() {
        if (alive.lock()) {
            unsubscribe(recipient, id);
        }
    };
}

void InProcessTransport::unsubscribe(const std::string& recipient, uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(recipient);
    if (it == channels_.end()) {
        return;
    }

    auto& subscribers = it->second.subscribers;
    auto sub = std::find_if(subscribers.begin(), subscribers.end(),
        [id](const Subscriber& s) { return s.id == id; });
    if (sub == subscribers.end()) {
        return;
    }
    sub->registration->active = false;
    subscribers.erase(sub);

    if (subscribers.empty() && it->second.queue.empty() && !it->second.draining) {
        channels_.erase(it);
    }
}

void InProcessTransport::dispose() {
    stop_sweeper();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [recipient, channel] : channels_) {
            for (auto& subscriber : channel.subscribers) {
                subscriber.registration->active = false;
            }
        }
        channels_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(dedup_mutex_);
        seen_.clear();
        seen_order_.clear();
    }
    spdlog::debug("In-process transport disposed");
}

bool InProcessTransport::remember(const std::string& id) {
    std::lock_guard<std::mutex> lock(dedup_mutex_);
    auto now = Clock::now();
    auto window = std::chrono::milliseconds(options_.dedup_window_ms);

    auto it = seen_.find(id);
    if (it != seen_.end() && now - it->second < window) {
        return false;
    }

    seen_[id] = now;
    seen_order_.emplace_back(id, now);

    // Hard cap: oldest entries go first
    while (seen_.size() > options_.dedup_max_entries && !seen_order_.empty()) {
        auto& [old_id, ts] = seen_order_.front();
        auto entry = seen_.find(old_id);
        if (entry != seen_.end() && entry->second == ts) {
            seen_.erase(entry);
        }
        seen_order_.pop_front();
    }
    return true;
}

size_t InProcessTransport::evict_expired() {
    std::lock_guard<std::mutex> lock(dedup_mutex_);
    auto cutoff = Clock::now() - std::chrono::milliseconds(options_.dedup_window_ms);

    size_t evicted = 0;
    while (!seen_order_.empty() && seen_order_.front().second <= cutoff) {
        auto& [id, ts] = seen_order_.front();
        auto entry = seen_.find(id);
        // A newer sighting left a later order entry behind
        if (entry != seen_.end() && entry->second == ts) {
            seen_.erase(entry);
            evicted++;
        }
        seen_order_.pop_front();
    }
    return evicted;
}

void InProcessTransport::start_sweeper(kernel::Reactor& reactor, int interval_ms) {
    stop_sweeper();
    sweeper_reactor_ = &reactor;
    sweeper_timer_ = reactor.add_timer(interval_ms, [this]() {
        size_t evicted = evict_expired();
        if (evicted > 0) {
            spdlog::debug("Dedup sweep evicted {} entries", evicted);
        }
    }, true);
}

void InProcessTransport::stop_sweeper() {
    if (sweeper_reactor_ && sweeper_timer_ != 0) {
        sweeper_reactor_->cancel_timer(sweeper_timer_);
    }
    sweeper_reactor_ = nullptr;
    sweeper_timer_ = 0;
}

size_t InProcessTransport::queue_depth(const std::string& recipient) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(recipient);
    return it == channels_.end() ? 0 : it->second.queue.size();
}

size_t InProcessTransport::subscriber_count(const std::string& recipient) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(recipient);
    return it == channels_.end() ? 0 : it->second.subscribers.size();
}

size_t InProcessTransport::dedup_size() const {
    std::lock_guard<std::mutex> lock(dedup_mutex_);
    return seen_.size();
}

} // namespace agentbus::ipc
