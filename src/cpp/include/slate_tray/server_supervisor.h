#pragma once

#include "health_probe.h"
#include "process_controller.h"
#include "supervisor_config.h"
#include <slate/utils/process_manager.h>
#include <mutex>
#include <optional>
#include <chrono>

namespace slate_tray {

// Ownership of the spawned sidecar. At most one handle is held; holding
// one means we are responsible for terminating it. take() is the only way
// to get a handle back out, so exactly one caller can ever claim it.
class ServerState {
public:
    ServerState() = default;
    ServerState(const ServerState&) = delete;
    ServerState& operator=(const ServerState&) = delete;
    
    // Returns false (and stores nothing) if a child is already held
    bool adopt(slate::utils::ProcessHandle handle);
    
    // Claim the handle, leaving the state empty
    std::optional<slate::utils::ProcessHandle> take();
    
    bool has_child() const;
    int child_pid() const;  // 0 when empty
    
private:
    mutable std::mutex mutex_;
    std::optional<slate::utils::ProcessHandle> child_;
};

class ServerSupervisor {
public:
    ServerSupervisor(const SupervisorConfig& config,
                     HealthProbe& probe,
                     ProcessController& processes,
                     ServerState& state);
    
    // Launch the sidecar with our identity tags in its environment and hand
    // the handle to ServerState. Throws slate::ProcessException on failure.
    slate::utils::ProcessHandle spawn();
    
    // Best effort: poll until the probe answers or the timeout elapses.
    // A timeout is reported as false, never as an error.
    bool await_ready(std::chrono::milliseconds timeout);
    bool await_ready() { return await_ready(config_.ready_timeout); }
    
private:
    SupervisorConfig config_;
    HealthProbe& probe_;
    ProcessController& processes_;
    ServerState& state_;
};

} // namespace slate_tray
