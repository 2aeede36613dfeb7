#include "slate_tray/sidecar_lifecycle.h"
#include <iostream>

namespace slate_tray {

SidecarLifecycle::SidecarLifecycle(const SupervisorConfig& config,
                                   HealthProbe& probe,
                                   ProcessController& processes)
    : config_(config)
    , reconciler_(config, probe, processes)
    , supervisor_(config, probe, processes, state_)
    , coordinator_(state_, processes, config.log_level)
{
}

StartupReport SidecarLifecycle::on_startup() {
    StartupReport report;
    
    report.decision = reconciler_.reconcile();
    reconciler_.resolve(report.decision);
    
    report.pid = supervisor_.spawn().pid;
    report.ready = supervisor_.await_ready();
    
    return report;
}

bool SidecarLifecycle::on_quit() {
    std::cout << "[App] Quit requested from tray" << std::endl;
    return coordinator_.terminate("quit");
}

bool SidecarLifecycle::on_exit() {
    std::cout << "[App] App exiting, killing sidecar..." << std::endl;
    return coordinator_.terminate("exit");
}

CloseAction SidecarLifecycle::on_window_close(WindowInterface& window) {
    return coordinator_.on_window_close(window);
}

} // namespace slate_tray
