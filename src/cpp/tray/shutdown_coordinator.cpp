#include "slate_tray/shutdown_coordinator.h"
#include <iostream>

// Helper macro for debug logging
#define DEBUG_LOG(coord, msg) \
    if ((coord)->log_level_ == "debug") { \
        std::cout << "DEBUG: " << msg << std::endl; \
    }

namespace slate_tray {

ShutdownCoordinator::ShutdownCoordinator(ServerState& state, ProcessController& processes,
                                         const std::string& log_level)
    : state_(state)
    , processes_(processes)
    , log_level_(log_level)
{
}

CloseAction ShutdownCoordinator::on_window_close(WindowInterface& window) {
    DEBUG_LOG(this, "Close requested for window '" << window.label() << "', hiding instead");
    window.hide();
    return CloseAction::PreventClose;
}

bool ShutdownCoordinator::terminate(const std::string& reason) {
    auto child = state_.take();
    if (!child) {
        DEBUG_LOG(this, "Terminate (" << reason << "): no sidecar held, nothing to do");
        return false;
    }
    
    std::cout << "[Lifecycle] Force killing sidecar tree for PID " << child->pid
              << " (" << reason << ")" << std::endl;
    
    if (!processes_.kill_child_tree(*child)) {
        std::cerr << "[Lifecycle] Failed to kill sidecar tree for PID " << child->pid << std::endl;
    }
    return true;
}

} // namespace slate_tray
