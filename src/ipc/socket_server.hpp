#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "ipc/protocol.hpp"
#include "ipc/socket_io.hpp"
#include "ipc/transport.hpp"
#include "kernel/reactor.hpp"

namespace agentbus::metrics {
class MetricsCollector;
} // namespace agentbus::metrics

namespace agentbus::ipc {

struct SocketServerOptions {
    std::string socket_path = "/tmp/agentbus.sock";
    int heartbeat_interval_ms = 10000;
    int handshake_timeout_ms = 3000;
    size_t max_queue = 1000;               // outbound frames per connection
    size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE;
};

using ConnectionId = uint64_t;

// Client connection state
struct ClientConnection {
    int fd;
    ConnectionId id;
    std::string peer_name;   // HELLO `client`
    bool handshaken = false;
    kernel::TimerId handshake_timer = 0;
    FrameDecoder decoder;
    Outbox outbox;
    int64_t connected_at_ms = 0;
    int64_t last_ping_ms = 0;
    int64_t last_pong_ms = 0;
    uint64_t bytes_received = 0;
    uint64_t bytes_sent = 0;

    ClientConnection(int fd, ConnectionId id, size_t max_frame_size)
        : fd(fd), id(id), decoder(max_frame_size) {}
};

struct ConnectionStats {
    ConnectionId id;
    std::string peer_name;
    bool handshaken;
    int64_t connected_at_ms;
    int64_t last_ping_ms;
    int64_t last_pong_ms;
    uint64_t bytes_received;
    uint64_t bytes_sent;
    size_t queued_frames;
};

// Envelope handler callback type: (envelope, originating connection)
using MessageHandler = std::function<void(const Envelope&, ConnectionId)>;

// Peer lifecycle callback: (connection, HELLO client name)
using PeerHandler = std::function<void(ConnectionId, const std::string&)>;

// Listening side of the Unix-socket transport. Owns its reactor registrations
// and timers; every call is expected on the reactor thread.
class SocketServer final : public Transport {
public:
    SocketServer(kernel::Reactor& reactor, metrics::MetricsCollector& metrics,
                 const SocketServerOptions& options = {});
    ~SocketServer() override;

    // Non-copyable
    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;

    // Unlink a stale socket file, bind, listen and register with the reactor
    bool start();

    // Close the listener and every connection, unlink the socket file
    void stop();

    bool is_listening() const { return server_fd_ >= 0; }

    // Every valid application envelope from a handshaken client
    void on_message(MessageHandler handler);

    void on_handshake(PeerHandler handler);
    void on_disconnect(PeerHandler handler);

    // Queue an envelope for one connection. Throws TransportError for an unknown
    // connection, QueueFullError when its outbound queue is at max_queue.
    void send_to(ConnectionId connection, const Envelope& envelope);

    // Write one record to every tracked client; returns how many accepted it
    size_t broadcast(const nlohmann::json& record);

    // Routes to the connection whose HELLO named the recipient
    void send(const Envelope& envelope) override;

    // Inbound envelopes addressed to `recipient`
    Unsubscribe subscribe(const std::string& recipient, EnvelopeHandler handler) override;

    std::vector<ConnectionStats> connection_stats() const;
    size_t connection_count() const { return clients_.size(); }

    // Connection of a handshaken peer, 0 when unknown
    ConnectionId find_peer(const std::string& peer_name) const;

    const std::string& socket_path() const { return options_.socket_path; }

    const char* name() const override { return "unix_socket"; }

private:
    struct Subscription {
        uint64_t id;
        EnvelopeHandler handler;
    };

    kernel::Reactor& reactor_;
    metrics::MetricsCollector& metrics_;
    SocketServerOptions options_;

    int server_fd_ = -1;
    ConnectionId next_connection_id_ = 1;
    kernel::TimerId heartbeat_timer_ = 0;
    std::unordered_map<int, std::unique_ptr<ClientConnection>> clients_;
    std::unordered_map<std::string, ConnectionId> peers_;

    MessageHandler message_handler_;
    PeerHandler handshake_handler_;
    PeerHandler disconnect_handler_;

    std::unordered_map<std::string, std::vector<Subscription>> subscriptions_;
    uint64_t next_subscription_id_ = 1;
    std::shared_ptr<int> alive_ = std::make_shared<int>(0);

    // Event handlers
    void on_server_event(int fd, uint32_t events);
    void on_client_event(int fd, uint32_t events);

    void accept_connections();
    void handle_readable(ClientConnection& client);
    void process_record(ClientConnection& client, const nlohmann::json& record);
    void process_control(ClientConnection& client, const ControlRecord& control);
    void process_envelope(ClientConnection& client, const nlohmann::json& record);
    void dispatch(const Envelope& envelope, ConnectionId connection);
    void reply_invalid(ClientConnection& client, const std::string& message);
    // FAILED TaskResponse back to the requester when the message handler throws
    void reply_handler_error(const Envelope& request, ConnectionId connection,
                             const std::string& message);
    void send_heartbeat();
    void on_handshake_timeout(int fd, ConnectionId id);

    // Frame and queue a record; QueueFullError when the outbox is at max_queue
    void enqueue(ClientConnection& client, const nlohmann::json& record);

    // Flush and update EPOLLOUT interest; false when the connection was closed
    bool flush(ClientConnection& client);

    // Still the same connection? (fds get reused)
    ClientConnection* find_client(int fd, ConnectionId id);
    ClientConnection* find_by_id(ConnectionId id);

    void close_connection(int fd, const char* reason);
};

} // namespace agentbus::ipc
