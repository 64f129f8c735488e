#include "kernel/router.hpp"
#include "ipc/errors.hpp"
#include "ipc/in_process_transport.hpp"
#include "ipc/socket_server.hpp"
#include "kernel/reactor.hpp"
#include "kernel/task_correlator.hpp"
#include "metrics/metrics.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>

namespace agentbus::kernel {

// Global router pointer for signal handling
static Router* g_router = nullptr;

static void signal_handler(int signum) {
    spdlog::info("Received signal {}, shutting down...", signum);
    if (g_router) {
        g_router->shutdown();
    }
}

Router::Router()
    : Router(Config{}) {}

Router::Router(const Config& config)
    : Router(config, Dependencies{}) {}

// An injected socket server must be built on the injected reactor and metrics
Router::Router(const Config& config, Dependencies deps)
    : config_(config)
{
    reactor_ = std::move(deps.reactor);
    metrics_collector_ = std::move(deps.metrics_collector);
    bus_ = std::move(deps.bus);
    socket_server_ = std::move(deps.socket_server);

    if (!reactor_) {
        reactor_ = std::make_unique<Reactor>();
    }
    if (!metrics_collector_) {
        metrics_collector_ = std::make_unique<metrics::MetricsCollector>();
    }
    if (!bus_) {
        bus_ = std::make_unique<ipc::InProcessTransport>(*metrics_collector_,
                                                         config_.in_process_options());
    }
    if (!socket_server_) {
        socket_server_ = std::make_unique<ipc::SocketServer>(*reactor_, *metrics_collector_,
                                                             config_.server_options());
    }
    correlator_ = std::make_unique<TaskCorrelator>(*bus_, *reactor_, *metrics_collector_);
}

Router::~Router() {
    stop_subsystems();
    if (g_router == this) {
        g_router = nullptr;
    }
}

bool Router::init() {
    spdlog::info("Initializing agentbus router '{}'...", config_.node_id);

    // Initialize reactor
    if (!reactor_->init()) {
        spdlog::error("Failed to initialize reactor");
        return false;
    }

    socket_server_->on_message([this](const ipc::Envelope& envelope, ipc::ConnectionId connection) {
        on_remote_message(envelope, connection);
    });
    socket_server_->on_handshake([this](ipc::ConnectionId connection, const std::string& peer) {
        on_peer_connected(connection, peer);
    });
    socket_server_->on_disconnect([this](ipc::ConnectionId connection, const std::string& peer) {
        on_peer_disconnected(connection, peer);
    });

    // Initialize socket server
    if (!socket_server_->start()) {
        spdlog::error("Failed to initialize socket server");
        return false;
    }

    bus_->start_sweeper(*reactor_, config_.dedup_sweep_interval_ms);
    stopped_ = false;

    // Set up signal handlers
    g_router = this;
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    spdlog::info("Router initialized successfully");
    spdlog::info("Heartbeat: {}ms, handshake timeout: {}ms, max queue: {}",
                 config_.heartbeat_interval_ms, config_.handshake_timeout_ms, config_.max_queue);
    return true;
}

void Router::run() {
    running_ = true;
    spdlog::info("agentbus router running");
    spdlog::info("Listening on: {}", config_.socket_path);
    spdlog::info("Press Ctrl+C to exit");

    while (running_) {
        int n = reactor_->poll(100);
        if (n < 0) {
            spdlog::error("Reactor error, exiting");
            break;
        }
    }

    spdlog::info("Router shutting down...");
    stop_subsystems();
    spdlog::info("Router stopped");
}

int Router::poll_once(int timeout_ms) {
    return reactor_->poll(timeout_ms);
}

void Router::shutdown() {
    running_ = false;
}

ipc::Unsubscribe Router::register_agent(const std::string& name, TaskHandler handler) {
    spdlog::info("Registered in-process agent '{}'", name);

    return bus_->subscribe(name, [this, name, handler](const ipc::Envelope& envelope) {
        if (envelope.message_type != ipc::MessageType::TASK_REQUEST) {
            return;
        }

        auto started = std::chrono::steady_clock::now();
        std::string task_id = envelope.correlation_id.value_or(envelope.id);
        ipc::TaskResponse response;
        try {
            ipc::TaskRequest request = ipc::TaskRequest::from_json(envelope.payload);
            task_id = request.task_id;
            response = handler(request, envelope);
            if (response.task_id.empty()) {
                response.task_id = task_id;
            }
        } catch (const ipc::ValidationError& e) {
            response = ipc::TaskResponse::failed(task_id, "INVALID_REQUEST", e.what());
        } catch (const std::exception& e) {
            spdlog::warn("Agent '{}' failed task {}: {}", name, task_id, e.what());
            response = ipc::TaskResponse::failed(task_id, "TASK_FAILED", e.what());
        }
        response.metrics.processing_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();

        try {
            bus_->send(ipc::make_task_response_envelope(envelope, name, response));
        } catch (const ipc::TransportError& e) {
            spdlog::error("Agent '{}' could not reply to {}: {}", name, envelope.sender, e.what());
        }
    });
}

void Router::on_remote_message(const ipc::Envelope& envelope, ipc::ConnectionId connection) {
    try {
        bus_->send(envelope);
    } catch (const ipc::QueueFullError& e) {
        spdlog::warn("Rejecting {} from connection {}: {}",
                     ipc::message_type_to_string(envelope.message_type), connection, e.what());
        if (envelope.message_type != ipc::MessageType::TASK_REQUEST) {
            return;
        }

        // Tell the caller now instead of letting it wait for its timeout
        auto failed = ipc::TaskResponse::failed(envelope.correlation_id.value_or(envelope.id),
                                                "QUEUE_FULL", e.what());
        try {
            socket_server_->send_to(connection,
                ipc::make_task_response_envelope(envelope, config_.node_id, failed));
        } catch (const ipc::TransportError& reply_error) {
            spdlog::warn("Could not report queue-full to connection {}: {}",
                         connection, reply_error.what());
        }
    }
}

void Router::on_peer_connected(ipc::ConnectionId connection, const std::string& peer) {
    if (peer_routes_.count(connection)) {
        return;
    }

    peer_routes_[connection] = bus_->subscribe(peer,
        [this, connection, peer](const ipc::Envelope& envelope) {
            // The socket server is owned by the loop thread
            if (reactor_->in_loop_thread()) {
                forward_to_peer(connection, peer, envelope);
            } else {
                reactor_->post([this, connection, peer, envelope]() {
                    forward_to_peer(connection, peer, envelope);
                });
            }
        });
    spdlog::info("Routing '{}' to connection {}", peer, connection);
}

void Router::forward_to_peer(ipc::ConnectionId connection, const std::string& peer,
                             const ipc::Envelope& envelope) {
    try {
        socket_server_->send_to(connection, envelope);
    } catch (const ipc::TransportError& e) {
        spdlog::warn("Dropping envelope {} for peer '{}': {}", envelope.id, peer, e.what());
        metrics_collector_->increment("message_dropped",
            {{"reason", "peer_unavailable"}, {"transport", socket_server_->name()}});
    }
}

void Router::on_peer_disconnected(ipc::ConnectionId connection, const std::string& peer) {
    auto it = peer_routes_.find(connection);
    if (it == peer_routes_.end()) {
        return;
    }
    ipc::Unsubscribe unsubscribe = std::move(it->second);
    peer_routes_.erase(it);
    unsubscribe();
    spdlog::info("Stopped routing '{}' (connection {})", peer, connection);
}

void Router::stop_subsystems() {
    if (stopped_) {
        return;
    }
    stopped_ = true;

    socket_server_->stop();
    for (auto& [connection, unsubscribe] : peer_routes_) {
        unsubscribe();
    }
    peer_routes_.clear();
    bus_->stop_sweeper();
}

} // namespace agentbus::kernel
