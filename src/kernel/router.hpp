/**
 * agentbus Router
 *
 * Composition root that wires the transport subsystems together:
 * - Reactor (epoll event loop + timers)
 * - InProcessTransport (bus for agents living in this process)
 * - SocketServer (Unix domain socket for agents in other processes)
 * - TaskCorrelator (task calls issued by this node)
 *
 * Envelopes arriving on the socket are published on the in-process bus; every
 * handshaken peer is subscribed on the bus under its HELLO name, so replies and
 * peer-to-peer traffic flow back out over the right connection.
 */
#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "kernel/config.hpp"
#include "ipc/task.hpp"
#include "ipc/transport.hpp"

namespace agentbus::ipc {
class InProcessTransport;
class SocketServer;
using ConnectionId = uint64_t;
} // namespace agentbus::ipc

namespace agentbus::metrics {
class MetricsCollector;
} // namespace agentbus::metrics

namespace agentbus::kernel {

class Reactor;
class TaskCorrelator;

// Executes one task for an in-process agent. Exceptions become FAILED responses.
using TaskHandler = std::function<ipc::TaskResponse(const ipc::TaskRequest&, const ipc::Envelope&)>;

class Router {
public:
    using Config = BusConfig;

    struct Dependencies {
        std::unique_ptr<Reactor> reactor;
        std::unique_ptr<metrics::MetricsCollector> metrics_collector;
        std::unique_ptr<ipc::InProcessTransport> bus;
        std::unique_ptr<ipc::SocketServer> socket_server;
    };

    Router();
    explicit Router(const Config& config);
    Router(const Config& config, Dependencies deps);
    ~Router();

    // Non-copyable
    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // Initialize all subsystems
    bool init();

    // Run the router (blocks until shutdown)
    void run();

    // One event-loop iteration; returns events + timers handled, -1 on error
    int poll_once(int timeout_ms);

    // Request shutdown
    void shutdown();

    // Check if running
    bool is_running() const { return running_; }

    // Serve TASK_REQUESTs addressed to `name` on the in-process bus
    ipc::Unsubscribe register_agent(const std::string& name, TaskHandler handler);

    Reactor& reactor() { return *reactor_; }
    metrics::MetricsCollector& metrics() { return *metrics_collector_; }
    ipc::InProcessTransport& bus() { return *bus_; }
    ipc::SocketServer& socket_server() { return *socket_server_; }
    TaskCorrelator& correlator() { return *correlator_; }

    // Get config
    const Config& get_config() const { return config_; }

private:
    Config config_;
    std::atomic<bool> running_{false};
    bool stopped_ = false;

    std::unique_ptr<Reactor> reactor_;
    std::unique_ptr<metrics::MetricsCollector> metrics_collector_;
    std::unique_ptr<ipc::InProcessTransport> bus_;
    std::unique_ptr<ipc::SocketServer> socket_server_;
    std::unique_ptr<TaskCorrelator> correlator_;

    // Bus subscriptions that forward to remote peers, by connection
    std::unordered_map<ipc::ConnectionId, ipc::Unsubscribe> peer_routes_;

    // Event handlers
    void on_remote_message(const ipc::Envelope& envelope, ipc::ConnectionId connection);
    void on_peer_connected(ipc::ConnectionId connection, const std::string& peer);
    void forward_to_peer(ipc::ConnectionId connection, const std::string& peer,
                         const ipc::Envelope& envelope);
    void on_peer_disconnected(ipc::ConnectionId connection, const std::string& peer);

    void stop_subsystems();
};

} // namespace agentbus::kernel
