#pragma once

#include "health_probe.h"
#include "process_controller.h"
#include "process_reconciler.h"
#include "server_supervisor.h"
#include "shutdown_coordinator.h"
#include "supervisor_config.h"

namespace slate_tray {

struct StartupReport {
    ReconciliationDecision decision;
    int pid = 0;         // Sidecar we spawned
    bool ready = false;  // Whether /health answered within the ready timeout
};

// Entry points the desktop shell calls into. Everything here is synchronous
// and runs on whatever thread the host uses for the call.
class SidecarLifecycle {
public:
    SidecarLifecycle(const SupervisorConfig& config,
                     HealthProbe& probe,
                     ProcessController& processes);
    
    // Reconcile the port, spawn the sidecar, wait for readiness.
    // Throws slate::SlateException when start-up has to be aborted.
    StartupReport on_startup();
    
    // Quit menu and application exit: whichever runs first kills the sidecar
    bool on_quit();
    bool on_exit();
    
    CloseAction on_window_close(WindowInterface& window);
    
    const ServerState& state() const { return state_; }
    
private:
    SupervisorConfig config_;
    ServerState state_;
    ProcessReconciler reconciler_;
    ServerSupervisor supervisor_;
    ShutdownCoordinator coordinator_;
};

} // namespace slate_tray
