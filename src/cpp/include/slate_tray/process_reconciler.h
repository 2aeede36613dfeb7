#pragma once

#include "health_probe.h"
#include "process_controller.h"
#include "supervisor_config.h"
#include <string>
#include <optional>
#include <chrono>

namespace slate_tray {

// Who currently occupies the server port, as seen from this instance
enum class PortOccupant {
    PortFree,            // Nothing listening: spawn
    ForeignApplication,  // Unknown process or not a slate-server: abort
    ForeignOwnerOrEnv,   // A slate-server with another identity: abort, leave it alone
    OwnedZombie          // Our own identity survived a previous run: kill, then spawn
};

const char* to_string(PortOccupant occupant);

struct ReconciliationDecision {
    PortOccupant occupant = PortOccupant::PortFree;
    
    // Filled from the health response when there was one
    int pid = 0;
    std::string app_name;
    std::string owner;
    std::string env;
    
    bool is_fatal() const {
        return occupant == PortOccupant::ForeignApplication ||
               occupant == PortOccupant::ForeignOwnerOrEnv;
    }
};

class ProcessReconciler {
public:
    ProcessReconciler(const SupervisorConfig& config,
                      HealthProbe& probe,
                      ProcessController& processes);
    
    // Pure classification of a probe result against our identity tags.
    // raw_port_connectable is only consulted when probe_result is empty.
    ReconciliationDecision classify(const std::optional<HealthResponse>& probe_result,
                                    bool raw_port_connectable) const;
    
    // Probe the port (raw connect only if the structured probe fails) and classify.
    ReconciliationDecision reconcile();
    
    // Act on a decision so that the port is free for a spawn.
    // Throws slate::ConflictException for every fatal outcome.
    void resolve(const ReconciliationDecision& decision);
    
    // Poll the health probe until nothing answers or the timeout elapses
    bool wait_for_port_free(std::chrono::milliseconds timeout);
    
private:
    SupervisorConfig config_;
    HealthProbe& probe_;
    ProcessController& processes_;
};

} // namespace slate_tray
