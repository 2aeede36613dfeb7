#pragma once

#include "platform/window_interface.h"
#include "process_controller.h"
#include "server_supervisor.h"
#include <string>

namespace slate_tray {

class ShutdownCoordinator {
public:
    ShutdownCoordinator(ServerState& state, ProcessController& processes,
                        const std::string& log_level = "info");
    
    // Minimize-to-tray: hide the window and veto the close. The sidecar keeps running.
    CloseAction on_window_close(WindowInterface& window);
    
    // Claim the child handle and force kill its whole tree, synchronously.
    // Returns false (no-op) when another trigger already did it.
    bool terminate(const std::string& reason);
    
private:
    ServerState& state_;
    ProcessController& processes_;
    std::string log_level_;
};

} // namespace slate_tray
