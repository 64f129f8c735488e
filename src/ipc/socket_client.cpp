#include "ipc/socket_client.hpp"
#include "ipc/errors.hpp"
#include "kernel/trace_context.hpp"
#include "metrics/metrics.hpp"
#include "util/uid.hpp"
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

using json = nlohmann::json;

namespace agentbus::ipc {

SocketClient::SocketClient(kernel::Reactor& reactor, metrics::MetricsCollector& metrics,
                           const SocketClientOptions& options)
    : reactor_(reactor), metrics_(metrics), options_(options),
      decoder_(options.max_frame_size) {
    if (options_.client_name.empty()) {
        options_.client_name = "client-" + util::generate_uuid().substr(0, 8);
    }
}

SocketClient::~SocketClient() {
    close();
}

std::future<void> SocketClient::connect() {
    if (fd_ >= 0) {
        throw TransportError("client '" + options_.client_name + "' is already connected");
    }

    std::promise<void> promise;
    std::future<void> future = promise.get_future();

    auto fail = [&](const std::string& what) {
        spdlog::error("{}", what);
        promise.set_exception(std::make_exception_ptr(TransportError(what)));
        return std::move(future);
    };

    if (!fits_unix_path(options_.socket_path)) {
        return fail("Invalid socket path '" + options_.socket_path + "'");
    }
    if (!reactor_.init()) {
        return fail("Failed to initialize reactor");
    }

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return fail(std::string("Failed to create socket: ") + strerror(errno));
    }

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, options_.socket_path.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string what = "Failed to connect to " + options_.socket_path + ": " + strerror(errno);
        ::close(fd);
        return fail(what);
    }
    if (!set_nonblocking(fd) ||
        !reactor_.add(fd, EPOLLIN | EPOLLHUP | EPOLLERR,
                      [this](int cfd, uint32_t ev) { on_event(cfd, ev); })) {
        ::close(fd);
        return fail("Failed to register socket with the reactor");
    }

    fd_ = fd;
    generation_++;
    decoder_.reset();
    outbox_.clear();
    connect_promise_ = std::move(promise);
    handshake_timer_ = reactor_.add_timer(options_.handshake_timeout_ms,
                                          [this]() { on_handshake_timeout(); });

    spdlog::debug("Connecting to {} as '{}'", options_.socket_path, options_.client_name);
    write_record(make_hello(options_.client_name));
    return future;
}

void SocketClient::send(const Envelope& envelope) {
    check(envelope);
    if (!connected_) {
        throw TransportError("client '" + options_.client_name + "' is not connected");
    }

    if (!write_record(to_json(envelope))) {
        throw TransportError("connection to " + options_.socket_path + " lost");
    }
    metrics_.increment("message_sent", {{"transport", name()}});
}

Unsubscribe SocketClient::subscribe(const std::string& recipient, EnvelopeHandler handler) {
    uint64_t id = next_subscription_id_++;
    subscriptions_[recipient].push_back(Subscription{id, std::move(handler)});

    std::weak_ptr<int> alive = alive_;
    return [this, alive, recipient, id]() {
        if (!alive.lock()) {
            return;
        }
        auto it = subscriptions_.find(recipient);
        if (it == subscriptions_.end()) {
            return;
        }
        auto& subs = it->second;
        subs.erase(std::remove_if(subs.begin(), subs.end(),
            [id](const Subscription& s) { return s.id == id; }), subs.end());
        if (subs.empty()) {
            subscriptions_.erase(it);
        }
    };
}

void SocketClient::on_message(EnvelopeHandler handler) {
    message_handler_ = std::move(handler);
}

void SocketClient::on_error(ErrorHandler handler) {
    error_handler_ = std::move(handler);
}

void SocketClient::close() {
    teardown(std::make_exception_ptr(TransportError("client closed before handshake completed")),
             "closed");
}

void SocketClient::on_event(int /*fd*/, uint32_t events) {
    uint64_t generation = generation_;

    if (events & EPOLLIN) {
        handle_readable();
        if (fd_ < 0 || generation != generation_) {
            return;
        }
    }

    if (events & (EPOLLHUP | EPOLLERR)) {
        teardown(std::make_exception_ptr(TransportError("connection closed by server")), "hangup");
        return;
    }

    if (events & EPOLLOUT) {
        flush();
    }
}

void SocketClient::handle_readable() {
    uint64_t generation = generation_;

    uint64_t bytes = 0;
    IoStatus status = read_available(fd_, decoder_, bytes);
    if (bytes > 0) {
        metrics_.increment("bytes_received", {{"transport", name()}}, bytes);
    }

    while (fd_ >= 0 && generation == generation_) {
        json record;
        try {
            auto body = decoder_.next();
            if (!body) {
                break;
            }
            record = decode_record(*body);
        } catch (const FrameError& e) {
            spdlog::error("Malformed frame from server: {}", e.what());
            metrics_.increment("message_error", {{"reason", "frame"}, {"transport", name()}});
            teardown(std::current_exception(), "malformed frame");
            return;
        }
        process_record(record);
    }

    if (fd_ < 0 || generation != generation_) {
        return;
    }
    if (status != IoStatus::OK) {
        teardown(std::make_exception_ptr(TransportError("connection closed by server")),
                 status == IoStatus::CLOSED ? "peer closed" : "read error");
    }
}

void SocketClient::process_record(const json& record) {
    if (classify_record(record) == RecordKind::CONTROL) {
        if (auto control = parse_control(record)) {
            process_control(*control);
        }
        return;
    }

    if (!connected_) {
        spdlog::debug("Discarding record received before ACK");
        return;
    }
    process_envelope(record);
}

void SocketClient::process_control(const ControlRecord& control) {
    switch (control.type) {
        case ControlType::ACK:
            if (connected_ || !connect_promise_) {
                break;
            }
            reactor_.cancel_timer(handshake_timer_);
            handshake_timer_ = 0;
            connected_ = true;
            heartbeat_timer_ = reactor_.add_timer(options_.heartbeat_interval_ms, [this]() {
                try {
                    write_record(make_pong());
                } catch (const TransportError& e) {
                    spdlog::warn("Skipping heartbeat PONG: {}", e.what());
                }
            }, true);
            spdlog::info("Connected to {} as '{}' (protocol v{})",
                         options_.socket_path, options_.client_name, control.version);
            {
                std::promise<void> promise = std::move(*connect_promise_);
                connect_promise_.reset();
                promise.set_value();
            }
            break;

        case ControlType::PING:
            last_ping_ms_ = util::now_ms();
            try {
                write_record(make_pong());
            } catch (const TransportError& e) {
                spdlog::warn("Dropping PONG: {}", e.what());
            }
            break;

        case ControlType::ERROR:
            if (control.error == "handshake_timeout" && !connected_) {
                teardown(std::make_exception_ptr(HandshakeTimeoutError(
                             "server closed the connection: handshake timeout")),
                         "handshake timeout reported by server");
                break;
            }
            spdlog::warn("Server reported error '{}': {}", control.error, control.details.dump());
            metrics_.increment("message_error", {{"reason", "rejected"}, {"transport", name()}});
            if (error_handler_) {
                ErrorHandler handler = error_handler_;
                handler(control.error, control.details);
            }
            break;

        case ControlType::PONG:
        case ControlType::HELLO:
            break;
    }
}

void SocketClient::process_envelope(const json& record) {
    Envelope envelope;
    try {
        envelope = validate(record);
    } catch (const ValidationError& e) {
        spdlog::warn("message_dropped reason=invalid transport=unix_socket_client error=\"{}\"",
                     e.what());
        metrics_.increment("message_dropped", {{"reason", "invalid"}, {"transport", name()}});
        return;
    }

    metrics_.increment("message_received", {{"transport", name()}});
    kernel::ScopedTraceContext scope(kernel::extract(envelope));

    if (message_handler_) {
        EnvelopeHandler handler = message_handler_;
        try {
            handler(envelope);
        } catch (const std::exception& e) {
            DeliveryError error(envelope.recipient, e.what());
            spdlog::error("message_error transport=unix_socket_client id={} error=\"{}\"",
                          envelope.id, error.what());
            metrics_.increment("message_error", {{"reason", "handler"}, {"transport", name()}});
        } catch (...) {
            spdlog::error("message_error transport=unix_socket_client id={} "
                          "error=\"non-standard exception\"", envelope.id);
            metrics_.increment("message_error", {{"reason", "handler"}, {"transport", name()}});
        }
    }

    auto it = subscriptions_.find(envelope.recipient);
    if (it == subscriptions_.end()) {
        return;
    }
    std::vector<Subscription> subscribers = it->second;
    for (const auto& subscriber : subscribers) {
        try {
            subscriber.handler(envelope);
        } catch (const std::exception& e) {
            DeliveryError error(envelope.recipient, e.what());
            spdlog::error("message_error transport=unix_socket_client id={} subscriber={} error=\"{}\"",
                          envelope.id, subscriber.id, error.what());
            metrics_.increment("message_error", {{"reason", "handler"}, {"transport", name()}});
        } catch (...) {
            spdlog::error("message_error transport=unix_socket_client id={} subscriber={} "
                          "error=\"non-standard exception\"", envelope.id, subscriber.id);
            metrics_.increment("message_error", {{"reason", "handler"}, {"transport", name()}});
        }
    }
}

void SocketClient::on_handshake_timeout() {
    handshake_timer_ = 0;
    if (connected_) {
        return;
    }
    spdlog::warn("No ACK from {} within {}ms", options_.socket_path, options_.handshake_timeout_ms);
    teardown(std::make_exception_ptr(NoAckError(
                 "no ACK within " + std::to_string(options_.handshake_timeout_ms) + "ms")),
             "no ACK");
}

bool SocketClient::write_record(const json& record) {
    if (fd_ < 0) {
        throw TransportError("client '" + options_.client_name + "' is not connected");
    }
    if (outbox_.size() >= options_.max_queue) {
        metrics_.increment("message_dropped", {{"reason", "queue_full"}, {"transport", name()}});
        throw QueueFullError(options_.socket_path, options_.max_queue);
    }
    outbox_.frames.push_back(encode_frame(record, options_.max_frame_size));
    return flush();
}

bool SocketClient::flush() {
    uint64_t bytes = 0;
    IoStatus status = flush_outbox(fd_, outbox_, bytes);
    if (bytes > 0) {
        metrics_.increment("bytes_sent", {{"transport", name()}}, bytes);
    }
    if (status != IoStatus::OK) {
        teardown(std::make_exception_ptr(TransportError("connection lost while writing")),
                 "write failed");
        return false;
    }

    uint32_t events = EPOLLIN | EPOLLHUP | EPOLLERR;
    if (!outbox_.empty()) {
        events |= EPOLLOUT;
    }
    reactor_.modify(fd_, events);
    return true;
}

void SocketClient::teardown(std::exception_ptr error, const char* reason) {
    if (heartbeat_timer_ != 0) {
        reactor_.cancel_timer(heartbeat_timer_);
        heartbeat_timer_ = 0;
    }
    if (handshake_timer_ != 0) {
        reactor_.cancel_timer(handshake_timer_);
        handshake_timer_ = 0;
    }

    if (fd_ >= 0) {
        reactor_.remove(fd_);
        ::close(fd_);
        fd_ = -1;
        spdlog::info("Client '{}' disconnected ({})", options_.client_name, reason);
    }
    connected_ = false;
    decoder_.reset();
    outbox_.clear();

    if (connect_promise_) {
        std::promise<void> promise = std::move(*connect_promise_);
        connect_promise_.reset();
        promise.set_exception(error);
    }
}

} // namespace agentbus::ipc
