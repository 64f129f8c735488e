#include "kernel/config.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <type_traits>

using json = nlohmann::json;

namespace agentbus::kernel {

namespace {

template <typename T>
void read_key(const json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    if constexpr (std::is_unsigned_v<T>) {
        if ((it->is_number_integer() && !it->is_number_unsigned() && it->get<int64_t>() < 0) ||
            (it->is_number_float() && it->get<double>() < 0)) {
            throw std::runtime_error(std::string("config key '") + key + "' must not be negative");
        }
    }
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("config key '") + key + "': " + e.what());
    }
}

void read_env(const char* name, std::string& target) {
    const char* value = std::getenv(name);
    if (value && *value) {
        target = value;
        spdlog::debug("Config override from {}", name);
    }
}

} // namespace

ipc::InProcessOptions BusConfig::in_process_options() const {
    ipc::InProcessOptions options;
    options.max_queue_size = max_queue;
    options.dedup_window_ms = dedup_window_ms;
    options.dedup_max_entries = dedup_max_entries;
    return options;
}

ipc::SocketServerOptions BusConfig::server_options() const {
    ipc::SocketServerOptions options;
    options.socket_path = socket_path;
    options.heartbeat_interval_ms = heartbeat_interval_ms;
    options.handshake_timeout_ms = handshake_timeout_ms;
    options.max_queue = max_queue;
    options.max_frame_size = max_frame_size;
    return options;
}

ipc::SocketClientOptions BusConfig::client_options(const std::string& client_name) const {
    ipc::SocketClientOptions options;
    options.socket_path = socket_path;
    options.client_name = client_name;
    options.heartbeat_interval_ms = heartbeat_interval_ms;
    options.handshake_timeout_ms = handshake_timeout_ms;
    options.max_queue = max_queue;
    options.max_frame_size = max_frame_size;
    return options;
}

void apply_json(BusConfig& config, const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("config must be a JSON object");
    }
    read_key(j, "socketPath", config.socket_path);
    read_key(j, "nodeId", config.node_id);
    read_key(j, "logLevel", config.log_level);
    read_key(j, "heartbeatIntervalMs", config.heartbeat_interval_ms);
    read_key(j, "handshakeTimeoutMs", config.handshake_timeout_ms);
    read_key(j, "maxQueue", config.max_queue);
    read_key(j, "maxFrameSize", config.max_frame_size);
    read_key(j, "dedupWindowMs", config.dedup_window_ms);
    read_key(j, "dedupSweepIntervalMs", config.dedup_sweep_interval_ms);
    read_key(j, "dedupMaxEntries", config.dedup_max_entries);
    read_key(j, "taskTimeoutMs", config.task_timeout_ms);
}

BusConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open config file " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("cannot parse config file " + path + ": " + e.what());
    }

    BusConfig config;
    apply_json(config, j);
    spdlog::info("Loaded config from {}", path);
    return config;
}

void apply_env_overrides(BusConfig& config) {
    read_env("AGENTBUS_SOCKET", config.socket_path);
    read_env("AGENTBUS_LOG_LEVEL", config.log_level);
    read_env("AGENTBUS_NODE_ID", config.node_id);
}

} // namespace agentbus::kernel
