#include "slate_tray/process_reconciler.h"
#include <slate/error_types.h>
#include <iostream>
#include <thread>

// Helper macro for debug logging
#define DEBUG_LOG(rec, msg) \
    if ((rec)->config_.log_level == "debug") { \
        std::cout << "DEBUG: " << msg << std::endl; \
    }

namespace slate_tray {

const char* to_string(PortOccupant occupant) {
    switch (occupant) {
        case PortOccupant::PortFree: return "port-free";
        case PortOccupant::ForeignApplication: return "foreign-application";
        case PortOccupant::ForeignOwnerOrEnv: return "foreign-owner-or-env";
        case PortOccupant::OwnedZombie: return "owned-zombie";
    }
    return "unknown";
}

ProcessReconciler::ProcessReconciler(const SupervisorConfig& config,
                                     HealthProbe& probe,
                                     ProcessController& processes)
    : config_(config)
    , probe_(probe)
    , processes_(processes)
{
}

ReconciliationDecision ProcessReconciler::classify(
    const std::optional<HealthResponse>& probe_result,
    bool raw_port_connectable) const
{
    ReconciliationDecision decision;

    if (!probe_result) {
        // A listener that won't answer /health properly is not ours to touch
        decision.occupant = raw_port_connectable ? PortOccupant::ForeignApplication
                                                 : PortOccupant::PortFree;
        return decision;
    }

    const HealthResponse& health = *probe_result;
    decision.pid = health.pid;
    decision.app_name = health.app_name;
    decision.owner = health.owner;
    decision.env = health.env;

    if (health.app_name != SERVER_APP_NAME) {
        decision.occupant = PortOccupant::ForeignApplication;
    } else if (health.owner != config_.owner || health.env != config_.env) {
        decision.occupant = PortOccupant::ForeignOwnerOrEnv;
    } else {
        decision.occupant = PortOccupant::OwnedZombie;
    }
    return decision;
}

ReconciliationDecision ProcessReconciler::reconcile() {
    auto health = probe_.probe();

    bool raw_port_connectable = false;
    if (!health) {
        std::cout << "[Lifecycle] Port " << config_.port
                  << " unresponsive or invalid fingerprint. Checking for legacy processes..." << std::endl;
        raw_port_connectable = probe_.is_port_connectable();
    }

    ReconciliationDecision decision = classify(health, raw_port_connectable);
    DEBUG_LOG(this, "Reconciliation decision: " << to_string(decision.occupant));
    return decision;
}

void ProcessReconciler::resolve(const ReconciliationDecision& decision) {
    const std::string port = std::to_string(config_.port);

    switch (decision.occupant) {
        case PortOccupant::PortFree:
            std::cout << "[Lifecycle] Port " << port << " free, spawning sidecar..." << std::endl;
            return;

        case PortOccupant::ForeignApplication:
            if (decision.app_name.empty()) {
                std::cout << "[Lifecycle] Port " << port
                          << " occupied by unknown/legacy process. Please close any old "
                          << SERVER_APP_NAME << " instances." << std::endl;
                throw slate::ConflictException(
                    "Port " + port + " is occupied. Close old server instances first.");
            }
            throw slate::ConflictException(
                "Port " + port + " is in use by another application (" + decision.app_name + ").");

        case PortOccupant::ForeignOwnerOrEnv:
            throw slate::ConflictException(
                "A " + decision.owner + "/" + decision.env +
                " Slate server is running. Close it before opening the editor.");

        case PortOccupant::OwnedZombie:
            std::cout << "[Lifecycle] Detected zombie " << config_.owner << "/" << config_.env
                      << " server (PID " << decision.pid << ")" << std::endl;
            std::cout << "[Lifecycle] Killing zombie server PID " << decision.pid << std::endl;

            if (!processes_.kill_pid_tree(decision.pid)) {
                throw slate::ConflictException("Failed to terminate zombie server.");
            }
            if (!wait_for_port_free(config_.zombie_kill_timeout)) {
                throw slate::ConflictException(
                    "Could not free port " + port + " after killing zombie.");
            }
            std::cout << "[Lifecycle] Port freed, spawning new sidecar..." << std::endl;
            return;
    }
}

bool ProcessReconciler::wait_for_port_free(std::chrono::milliseconds timeout) {
    auto start = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() - start < timeout) {
        if (!probe_.probe()) {
            return true;
        }
        std::this_thread::sleep_for(config_.poll_interval);
    }
    return false;
}

} // namespace slate_tray
