#include <spdlog/spdlog.h>
#include <cstdlib>
#include <exception>
#include "kernel/router.hpp"
#include "util/logger.hpp"

using agentbus::kernel::Router;

int main(int argc, char** argv) {
    agentbus::util::init_logger();

    spdlog::info("=================================");
    spdlog::info("  agentbus router v0.1.0");
    spdlog::info("=================================");

    // Config file, then environment, then command line args
    Router::Config config;
    if (const char* path = std::getenv("AGENTBUS_CONFIG")) {
        try {
            config = agentbus::kernel::load_config(path);
        } catch (const std::exception& e) {
            spdlog::error("Failed to load config: {}", e.what());
            return 1;
        }
    }
    agentbus::kernel::apply_env_overrides(config);
    if (argc > 1) {
        config.socket_path = argv[1];
    }
    agentbus::util::set_log_level(agentbus::util::level_from_string(config.log_level));

    // Create and initialize router
    Router router(config);

    if (!router.init()) {
        spdlog::error("Failed to initialize router");
        return 1;
    }

    // Built-in agent: answers every task with its own parameters
    router.register_agent("echo",
        [](const agentbus::ipc::TaskRequest& request, const agentbus::ipc::Envelope&) {
            return agentbus::ipc::TaskResponse::completed(request.task_id, request.parameters);
        });

    // Run (blocks until Ctrl+C)
    router.run();

    return 0;
}
