#pragma once
#include <string>
#include "ipc/in_process_transport.hpp"
#include "ipc/socket_client.hpp"
#include "ipc/socket_server.hpp"

namespace agentbus::kernel {

// Bus configuration
struct BusConfig {
    std::string socket_path = "/tmp/agentbus.sock";
    std::string node_id = "router";          // name this process answers to
    std::string log_level = "info";

    int heartbeat_interval_ms = 10000;
    int handshake_timeout_ms = 3000;
    size_t max_queue = 1000;                 // per recipient and per connection
    size_t max_frame_size = ipc::DEFAULT_MAX_FRAME_SIZE;

    int dedup_window_ms = 60000;
    int dedup_sweep_interval_ms = 10000;
    size_t dedup_max_entries = 100000;

    int task_timeout_ms = 30000;

    ipc::InProcessOptions in_process_options() const;
    ipc::SocketServerOptions server_options() const;
    ipc::SocketClientOptions client_options(const std::string& client_name) const;
};

// Read a JSON config file (camelCase keys, all optional) on top of the defaults.
// Throws std::runtime_error if the file cannot be read or parsed.
BusConfig load_config(const std::string& path);

// Overlay a parsed JSON object; unknown keys are ignored
void apply_json(BusConfig& config, const nlohmann::json& j);

// AGENTBUS_SOCKET, AGENTBUS_LOG_LEVEL, AGENTBUS_NODE_ID
void apply_env_overrides(BusConfig& config);

} // namespace agentbus::kernel
