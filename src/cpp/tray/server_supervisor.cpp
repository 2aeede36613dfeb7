#include "slate_tray/server_supervisor.h"
#include <slate/error_types.h>
#include <filesystem>
#include <iostream>
#include <thread>

// Helper macro for debug logging
#define DEBUG_LOG(sup, msg) \
    if ((sup)->config_.log_level == "debug") { \
        std::cout << "DEBUG: " << msg << std::endl; \
    }

namespace fs = std::filesystem;

namespace slate_tray {

bool ServerState::adopt(slate::utils::ProcessHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (child_) {
        return false;
    }
    child_ = handle;
    return true;
}

std::optional<slate::utils::ProcessHandle> ServerState::take() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<slate::utils::ProcessHandle> child;
    child.swap(child_);
    return child;
}

bool ServerState::has_child() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return child_.has_value();
}

int ServerState::child_pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return child_ ? child_->pid : 0;
}

ServerSupervisor::ServerSupervisor(const SupervisorConfig& config,
                                   HealthProbe& probe,
                                   ProcessController& processes,
                                   ServerState& state)
    : config_(config)
    , probe_(probe)
    , processes_(processes)
    , state_(state)
{
}

slate::utils::ProcessHandle ServerSupervisor::spawn() {
    if (state_.has_child()) {
        throw slate::ProcessException(
            "Sidecar already running (PID " + std::to_string(state_.child_pid()) + ")");
    }
    
    SpawnRequest request;
    request.executable = config_.server_binary;
    request.args = config_.server_args;
    request.env_vars = {
        {OWNER_ENV_VAR, config_.owner},
        {ENV_ENV_VAR, config_.env}
    };
    // Bundled resources are resolved relative to the binary
    request.working_dir = fs::path(config_.server_binary).parent_path().string();
    
    DEBUG_LOG(this, "Starting server: " << request.executable
              << " (" << OWNER_ENV_VAR << "=" << config_.owner
              << ", " << ENV_ENV_VAR << "=" << config_.env << ")");
    
    slate::utils::ProcessHandle handle{nullptr, 0};
    try {
        handle = processes_.spawn(request);
    } catch (const slate::SlateException&) {
        throw;
    } catch (const std::exception& e) {
        throw slate::ProcessException(std::string("Failed to spawn sidecar: ") + e.what());
    }
    
    if (!state_.adopt(handle)) {
        // Someone else stored a child in the meantime; do not leak this one
        processes_.kill_child_tree(handle);
        throw slate::ProcessException("Sidecar spawned twice; the second instance was killed");
    }
    
    std::cout << "[Lifecycle] Sidecar started (PID " << handle.pid << ")" << std::endl;
    return handle;
}

bool ServerSupervisor::await_ready(std::chrono::milliseconds timeout) {
    DEBUG_LOG(this, "Waiting up to " << timeout.count() << "ms for the server to report healthy...");
    
    auto start = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() - start < timeout) {
        if (probe_.probe()) {
            std::cout << "[Lifecycle] Server ready" << std::endl;
            return true;
        }
        std::this_thread::sleep_for(config_.poll_interval);
    }
    
    std::cerr << "[Lifecycle] Server failed to start within timeout" << std::endl;
    return false;
}

} // namespace slate_tray
