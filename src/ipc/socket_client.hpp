#pragma once
#include <cstdint>
#include <functional>
#include <exception>
#include <future>
#include <memory>
#include <optional>
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

struct SocketClientOptions {
    std::string socket_path = "/tmp/agentbus.sock";
    std::string client_name;                // sent in HELLO
    int heartbeat_interval_ms = 10000;
    int handshake_timeout_ms = 3000;
    size_t max_queue = 1000;                // frames waiting on a partial write
    size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE;
};

// Error records the server sends back ({error, details})
using ErrorHandler = std::function<void(const std::string& error, const nlohmann::json& details)>;

// Connecting side of the Unix-socket transport
class SocketClient final : public Transport {
public:
    SocketClient(kernel::Reactor& reactor, metrics::MetricsCollector& metrics,
                 const SocketClientOptions& options);
    ~SocketClient() override;

    // Non-copyable
    SocketClient(const SocketClient&) = delete;
    SocketClient& operator=(const SocketClient&) = delete;

    // Connect and send HELLO. The future becomes ready once ACK arrives; it fails
    // with NoAckError on our own timeout, HandshakeTimeoutError when the server
    // gave up first, TransportError when the socket could not be opened.
    std::future<void> connect();

    // Validate and write; throws TransportError when not connected
    void send(const Envelope& envelope) override;

    Unsubscribe subscribe(const std::string& recipient, EnvelopeHandler handler) override;

    // Every validated inbound envelope regardless of recipient
    void on_message(EnvelopeHandler handler);

    void on_error(ErrorHandler handler);

    // Stop the heartbeat and end the socket
    void close();

    bool is_connected() const { return connected_; }
    int64_t last_ping_ms() const { return last_ping_ms_; }
    const std::string& client_name() const { return options_.client_name; }

    const char* name() const override { return "unix_socket_client"; }

private:
    struct Subscription {
        uint64_t id;
        EnvelopeHandler handler;
    };

    kernel::Reactor& reactor_;
    metrics::MetricsCollector& metrics_;
    SocketClientOptions options_;

    int fd_ = -1;
    uint64_t generation_ = 0; // bumped per connect so stale callbacks can tell
    bool connected_ = false;
    std::optional<std::promise<void>> connect_promise_;
    kernel::TimerId handshake_timer_ = 0;
    kernel::TimerId heartbeat_timer_ = 0;
    int64_t last_ping_ms_ = 0;

    FrameDecoder decoder_;
    Outbox outbox_;

    EnvelopeHandler message_handler_;
    ErrorHandler error_handler_;
    std::unordered_map<std::string, std::vector<Subscription>> subscriptions_;
    uint64_t next_subscription_id_ = 1;
    std::shared_ptr<int> alive_ = std::make_shared<int>(0);

    void on_event(int fd, uint32_t events);
    void handle_readable();
    void process_record(const nlohmann::json& record);
    void process_control(const ControlRecord& control);
    void process_envelope(const nlohmann::json& record);

    void on_handshake_timeout();

    // Frame, queue and flush; false when the write tore the connection down
    bool write_record(const nlohmann::json& record);
    bool flush();

    // Close the socket and fail a pending connect() with `error`
    void teardown(std::exception_ptr error, const char* reason);
};

} // namespace agentbus::ipc
