#include "ipc/socket_server.hpp"
#include "ipc/errors.hpp"
#include "ipc/task.hpp"
#include "kernel/trace_context.hpp"
#include "metrics/metrics.hpp"
#include "util/uid.hpp"
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <optional>

using json = nlohmann::json;

namespace agentbus::ipc {

SocketServer::SocketServer(kernel::Reactor& reactor, metrics::MetricsCollector& metrics,
                           const SocketServerOptions& options)
    : reactor_(reactor), metrics_(metrics), options_(options) {}

SocketServer::~SocketServer() {
    stop();
}

bool SocketServer::start() {
    if (server_fd_ >= 0) {
        return true;
    }
    if (!fits_unix_path(options_.socket_path)) {
        spdlog::error("Invalid socket path '{}'", options_.socket_path);
        return false;
    }
    if (!reactor_.init()) {
        return false;
    }

    std::filesystem::path parent = std::filesystem::path(options_.socket_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            spdlog::error("Failed to create socket directory {}: {}", parent.string(), ec.message());
            return false;
        }
    }

    // Remove a socket file left behind by a previous run
    unlink(options_.socket_path.c_str());

    server_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        spdlog::error("Failed to create socket: {}", strerror(errno));
        return false;
    }

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, options_.socket_path.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::error("Failed to bind socket {}: {}", options_.socket_path, strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    // Owner only
    if (chmod(options_.socket_path.c_str(), 0600) < 0) {
        spdlog::error("Failed to restrict permissions on {}: {}", options_.socket_path,
                      strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        unlink(options_.socket_path.c_str());
        return false;
    }

    if (listen(server_fd_, SOMAXCONN) < 0) {
        spdlog::error("Failed to listen on socket: {}", strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        unlink(options_.socket_path.c_str());
        return false;
    }

    if (!reactor_.add(server_fd_, EPOLLIN, [this](int fd, uint32_t events) {
            on_server_event(fd, events);
        })) {
        ::close(server_fd_);
        server_fd_ = -1;
        unlink(options_.socket_path.c_str());
        return false;
    }

    heartbeat_timer_ = reactor_.add_timer(options_.heartbeat_interval_ms,
                                          [this]() { send_heartbeat(); }, true);

    spdlog::info("Socket server listening on {}", options_.socket_path);
    return true;
}

void SocketServer::stop() {
    if (heartbeat_timer_ != 0) {
        reactor_.cancel_timer(heartbeat_timer_);
        heartbeat_timer_ = 0;
    }

    std::vector<int> fds;
    fds.reserve(clients_.size());
    for (const auto& [fd, client] : clients_) {
        fds.push_back(fd);
    }
    for (int fd : fds) {
        close_connection(fd, "server stopping");
    }

    if (server_fd_ >= 0) {
        reactor_.remove(server_fd_);
        ::close(server_fd_);
        server_fd_ = -1;
        unlink(options_.socket_path.c_str());
        spdlog::info("Socket server stopped");
    }
}

void SocketServer::on_message(MessageHandler handler) {
    message_handler_ = std::move(handler);
}

void SocketServer::on_handshake(PeerHandler handler) {
    handshake_handler_ = std::move(handler);
}

void SocketServer::on_disconnect(PeerHandler handler) {
    disconnect_handler_ = std::move(handler);
}

void SocketServer::on_server_event(int /*fd*/, uint32_t events) {
    if (events & EPOLLIN) {
        accept_connections();
    }
}

void SocketServer::accept_connections() {
    while (true) {
        int client_fd = accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                spdlog::error("accept failed: {}", strerror(errno));
            }
            return;
        }

        ConnectionId id = next_connection_id_++;
        auto client = std::make_unique<ClientConnection>(client_fd, id, options_.max_frame_size);
        client->connected_at_ms = util::now_ms();
        client->handshake_timer = reactor_.add_timer(options_.handshake_timeout_ms,
            [this, client_fd, id]() { on_handshake_timeout(client_fd, id); });

        if (!reactor_.add(client_fd, EPOLLIN | EPOLLHUP | EPOLLERR,
                [this](int cfd, uint32_t ev) { on_client_event(cfd, ev); })) {
            reactor_.cancel_timer(client->handshake_timer);
            ::close(client_fd);
            continue;
        }

        clients_[client_fd] = std::move(client);
        spdlog::debug("Accepted connection {} (fd={})", id, client_fd);
    }
}

void SocketServer::on_client_event(int fd, uint32_t events) {
    auto it = clients_.find(fd);
    if (it == clients_.end()) {
        return;
    }
    ClientConnection& client = *it->second;
    ConnectionId id = client.id;

    // Drain readable data before acting on a hangup
    if (events & EPOLLIN) {
        handle_readable(client);
        if (!find_client(fd, id)) {
            return;
        }
    }

    if (events & (EPOLLHUP | EPOLLERR)) {
        close_connection(fd, "hangup");
        return;
    }

    if (events & EPOLLOUT) {
        flush(client);
    }
}

void SocketServer::handle_readable(ClientConnection& client) {
    int fd = client.fd;
    ConnectionId id = client.id;

    uint64_t bytes = 0;
    IoStatus status = read_available(fd, client.decoder, bytes);
    if (bytes > 0) {
        client.bytes_received += bytes;
        metrics_.increment("bytes_received", {{"transport", name()}}, bytes);
    }

    // Process whatever complete frames arrived before acting on EOF
    while (true) {
        ClientConnection* current = find_client(fd, id);
        if (!current) {
            return; // closed by a handler
        }

        std::optional<std::vector<uint8_t>> body;
        json record;
        try {
            body = current->decoder.next();
            if (!body) {
                break;
            }
            record = decode_record(*body);
        } catch (const FrameError& e) {
            metrics_.increment("message_error", {{"reason", "frame"}, {"transport", name()}});
            // Stream framing is lost on an oversize header; a bad body before the
            // handshake is just as fatal
            if (!body || !current->handshaken) {
                spdlog::warn("Closing connection {}: {}", id, e.what());
                close_connection(fd, "malformed frame");
                return;
            }
            spdlog::warn("Malformed record from {}: {}", current->peer_name, e.what());
            try {
                enqueue(*current, make_invalid_message({{"message", e.what()}}));
                flush(*current);
            } catch (const QueueFullError& qe) {
                spdlog::warn("Dropping invalid_message reply: {}", qe.what());
            }
            continue;
        }

        process_record(*current, record);
    }

    if (status != IoStatus::OK) {
        close_connection(fd, status == IoStatus::CLOSED ? "peer closed" : "read error");
    }
}

void SocketServer::process_record(ClientConnection& client, const json& record) {
    if (classify_record(record) == RecordKind::CONTROL) {
        auto control = parse_control(record);
        if (!control) {
            if (!client.handshaken) {
                spdlog::debug("Discarding unrecognised control record from connection {} "
                              "before HELLO", client.id);
                return;
            }
            spdlog::warn("Unrecognised control record from {}", client.peer_name);
            reply_invalid(client, "unrecognised control record");
            return;
        }
        process_control(client, *control);
        return;
    }

    if (!client.handshaken) {
        spdlog::debug("Discarding record from connection {} before HELLO", client.id);
        metrics_.increment("message_dropped", {{"reason", "pre_handshake"}, {"transport", name()}});
        return;
    }
    process_envelope(client, record);
}

void SocketServer::process_control(ClientConnection& client, const ControlRecord& control) {
    if (!client.handshaken) {
        if (control.type != ControlType::HELLO) {
            spdlog::debug("Discarding {} from connection {} before HELLO",
                          control_type_to_string(control.type), client.id);
            return;
        }

        client.handshaken = true;
        client.peer_name = control.client.empty()
            ? "connection-" + std::to_string(client.id) : control.client;
        reactor_.cancel_timer(client.handshake_timer);
        client.handshake_timer = 0;
        peers_[client.peer_name] = client.id;

        ConnectionId id = client.id;
        try {
            enqueue(client, make_ack());
        } catch (const QueueFullError& e) {
            spdlog::error("Cannot acknowledge {}: {}", client.peer_name, e.what());
        }
        if (!flush(client)) {
            return;
        }
        spdlog::info("Handshake complete with '{}' (connection {})", client.peer_name, id);

        if (handshake_handler_) {
            PeerHandler handler = handshake_handler_;
            std::string peer = client.peer_name;
            handler(id, peer);
        }
        return;
    }

    switch (control.type) {
        case ControlType::PONG:
            client.last_pong_ms = util::now_ms();
            break;
        case ControlType::PING:
            try {
                enqueue(client, make_pong());
                flush(client);
            } catch (const QueueFullError& e) {
                spdlog::warn("Dropping PONG to {}: {}", client.peer_name, e.what());
            }
            break;
        case ControlType::HELLO:
            spdlog::debug("Ignoring repeated HELLO from {}", client.peer_name);
            break;
        case ControlType::ERROR:
            spdlog::warn("Peer {} reported error '{}'", client.peer_name, control.error);
            reply_invalid(client, "unexpected error record");
            break;
        case ControlType::ACK:
            break;
    }
}

void SocketServer::process_envelope(ClientConnection& client, const json& record) {
    Envelope envelope;
    try {
        envelope = validate(record);
    } catch (const ValidationError& e) {
        spdlog::warn("message_dropped reason=invalid transport=unix_socket peer={} error=\"{}\"",
                     client.peer_name, e.what());
        metrics_.increment("message_dropped", {{"reason", "invalid"}, {"transport", name()}});
        try {
            enqueue(client, make_invalid_message({{"fields", e.fields()}, {"message", e.what()}}));
            flush(client);
        } catch (const QueueFullError& qe) {
            spdlog::warn("Dropping invalid_message reply: {}", qe.what());
        }
        return;
    }

    metrics_.increment("message_received", {{"transport", name()}});
    dispatch(envelope, client.id);
}

void SocketServer::reply_invalid(ClientConnection& client, const std::string& message) {
    try {
        enqueue(client, make_invalid_message({{"message", message}}));
        flush(client);
    } catch (const QueueFullError& e) {
        spdlog::warn("Dropping invalid_message reply: {}", e.what());
    }
}

void SocketServer::dispatch(const Envelope& envelope, ConnectionId connection) {
    kernel::ScopedTraceContext scope(kernel::extract(envelope));

    if (message_handler_) {
        // Copy: the handler may replace itself
        MessageHandler handler = message_handler_;
        std::optional<std::string> failure;
        try {
            handler(envelope, connection);
        } catch (const std::exception& e) {
            failure = e.what();
        } catch (...) {
            failure = "non-standard exception";
        }
        if (failure) {
            DeliveryError error(envelope.recipient, *failure);
            spdlog::error("message_error transport=unix_socket id={} error=\"{}\"",
                          envelope.id, error.what());
            metrics_.increment("message_error", {{"reason", "handler"}, {"transport", name()}});
            if (envelope.message_type == MessageType::TASK_REQUEST) {
                reply_handler_error(envelope, connection, *failure);
            }
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
            spdlog::error("message_error transport=unix_socket id={} subscriber={} error=\"{}\"",
                          envelope.id, subscriber.id, error.what());
            metrics_.increment("message_error", {{"reason", "handler"}, {"transport", name()}});
        } catch (...) {
            spdlog::error("message_error transport=unix_socket id={} subscriber={} "
                          "error=\"non-standard exception\"", envelope.id, subscriber.id);
            metrics_.increment("message_error", {{"reason", "handler"}, {"transport", name()}});
        }
    }
}

void SocketServer::reply_handler_error(const Envelope& request, ConnectionId connection,
                                       const std::string& message) {
    std::string task_id = request.correlation_id.value_or(request.id);
    if (request.payload.is_object()) {
        auto it = request.payload.find("taskId");
        if (it != request.payload.end() && it->is_string()) {
            task_id = it->get<std::string>();
        }
    }

    try {
        send_to(connection, make_task_response_envelope(request, request.recipient,
            TaskResponse::failed(task_id, "HANDLER_ERROR", message)));
    } catch (const TransportError& e) {
        spdlog::warn("Cannot report handler failure for {}: {}", request.id, e.what());
    }
}

void SocketServer::send_to(ConnectionId connection, const Envelope& envelope) {
    check(envelope);

    ClientConnection* client = find_by_id(connection);
    if (!client || !client->handshaken) {
        throw TransportError("unknown connection " + std::to_string(connection));
    }

    enqueue(*client, to_json(envelope));
    metrics_.increment("message_sent", {{"transport", name()}});
    flush(*client);
}

void SocketServer::send(const Envelope& envelope) {
    check(envelope);

    ConnectionId connection = find_peer(envelope.recipient);
    if (connection == 0) {
        spdlog::debug("message_dropped reason=no_handler transport=unix_socket recipient={} id={}",
                      envelope.recipient, envelope.id);
        metrics_.increment("message_dropped", {{"reason", "no_handler"}, {"transport", name()}});
        return;
    }
    send_to(connection, envelope);
}

size_t SocketServer::broadcast(const json& record) {
    std::vector<int> fds;
    for (const auto& [fd, client] : clients_) {
        fds.push_back(fd);
    }

    size_t sent = 0;
    for (int fd : fds) {
        auto it = clients_.find(fd);
        if (it == clients_.end()) {
            continue;
        }
        try {
            enqueue(*it->second, record);
        } catch (const QueueFullError& e) {
            spdlog::warn("Broadcast skipped connection {}: {}", it->second->id, e.what());
            continue;
        }
        sent++;
        flush(*it->second);
    }
    return sent;
}

Unsubscribe SocketServer::subscribe(const std::string& recipient, EnvelopeHandler handler) {
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

void SocketServer::send_heartbeat() {
    std::vector<int> fds;
    for (const auto& [fd, client] : clients_) {
        if (client->handshaken) {
            fds.push_back(fd);
        }
    }

    for (int fd : fds) {
        auto it = clients_.find(fd);
        if (it == clients_.end()) {
            continue;
        }
        ClientConnection& client = *it->second;
        try {
            enqueue(client, make_ping());
        } catch (const QueueFullError& e) {
            spdlog::warn("Skipping PING to {}: {}", client.peer_name, e.what());
            continue;
        }
        client.last_ping_ms = util::now_ms();
        flush(client);
    }
}

void SocketServer::on_handshake_timeout(int fd, ConnectionId id) {
    ClientConnection* client = find_client(fd, id);
    if (!client || client->handshaken) {
        return;
    }
    client->handshake_timer = 0;

    spdlog::warn("Connection {} sent no HELLO within {}ms, closing", id,
                 options_.handshake_timeout_ms);
    try {
        enqueue(*client, make_handshake_timeout());
        if (!flush(*client)) {
            return;
        }
    } catch (const QueueFullError& e) {
        spdlog::warn("Dropping handshake_timeout record: {}", e.what());
    }
    close_connection(fd, "handshake timeout");
}

void SocketServer::enqueue(ClientConnection& client, const json& record) {
    if (client.outbox.size() >= options_.max_queue) {
        metrics_.increment("message_dropped", {{"reason", "queue_full"}, {"transport", name()}});
        throw QueueFullError(client.peer_name.empty()
            ? "connection-" + std::to_string(client.id) : client.peer_name, options_.max_queue);
    }
    client.outbox.frames.push_back(encode_frame(record, options_.max_frame_size));
}

bool SocketServer::flush(ClientConnection& client) {
    uint64_t bytes = 0;
    IoStatus status = flush_outbox(client.fd, client.outbox, bytes);
    if (bytes > 0) {
        client.bytes_sent += bytes;
        metrics_.increment("bytes_sent", {{"transport", name()}}, bytes);
    }
    if (status != IoStatus::OK) {
        close_connection(client.fd, "write failed");
        return false;
    }

    // Update events based on write buffer
    uint32_t events = EPOLLIN | EPOLLHUP | EPOLLERR;
    if (!client.outbox.empty()) {
        events |= EPOLLOUT;
    }
    reactor_.modify(client.fd, events);
    return true;
}

std::vector<ConnectionStats> SocketServer::connection_stats() const {
    std::vector<ConnectionStats> stats;
    stats.reserve(clients_.size());
    for (const auto& [fd, client] : clients_) {
        stats.push_back(ConnectionStats{
            client->id,
            client->peer_name,
            client->handshaken,
            client->connected_at_ms,
            client->last_ping_ms,
            client->last_pong_ms,
            client->bytes_received,
            client->bytes_sent,
            client->outbox.size()
        });
    }
    std::sort(stats.begin(), stats.end(),
        [](const ConnectionStats& a, const ConnectionStats& b) { return a.id < b.id; });
    return stats;
}

ConnectionId SocketServer::find_peer(const std::string& peer_name) const {
    auto it = peers_.find(peer_name);
    return it == peers_.end() ? 0 : it->second;
}

ClientConnection* SocketServer::find_client(int fd, ConnectionId id) {
    auto it = clients_.find(fd);
    if (it == clients_.end() || it->second->id != id) {
        return nullptr;
    }
    return it->second.get();
}

ClientConnection* SocketServer::find_by_id(ConnectionId id) {
    for (auto& [fd, client] : clients_) {
        if (client->id == id) {
            return client.get();
        }
    }
    return nullptr;
}

void SocketServer::close_connection(int fd, const char* reason) {
    auto it = clients_.find(fd);
    if (it == clients_.end()) {
        return;
    }

    std::unique_ptr<ClientConnection> client = std::move(it->second);
    clients_.erase(it);

    if (client->handshake_timer != 0) {
        reactor_.cancel_timer(client->handshake_timer);
    }
    reactor_.remove(fd);
    ::close(fd);

    bool was_peer = client->handshaken;
    if (was_peer) {
        auto peer = peers_.find(client->peer_name);
        if (peer != peers_.end() && peer->second == client->id) {
            peers_.erase(peer);
        }
    }
    spdlog::info("Connection {} closed ({})", client->id, reason);

    if (was_peer && disconnect_handler_) {
        disconnect_handler_(client->id, client->peer_name);
    }
}

} // namespace agentbus::ipc
