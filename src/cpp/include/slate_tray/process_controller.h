#pragma once

#include <slate/utils/process_manager.h>
#include <string>
#include <vector>
#include <utility>

namespace slate_tray {

struct SpawnRequest {
    std::string executable;
    std::vector<std::string> args;
    std::vector<std::pair<std::string, std::string>> env_vars;
    std::string working_dir;
};

// OS process control used by the lifecycle. Abstract so the
// reconciliation and shutdown paths can run against fakes.
class ProcessController {
public:
    virtual ~ProcessController() = default;
    
    // Throws slate::ProcessException if the process cannot be launched
    virtual slate::utils::ProcessHandle spawn(const SpawnRequest& request) = 0;
    
    // Force kill a process we do not hold a handle for, plus its descendants
    virtual bool kill_pid_tree(int pid) = 0;
    
    // Force kill our own child plus its descendants and release the handle
    virtual bool kill_child_tree(slate::utils::ProcessHandle handle) = 0;
};

class SystemProcessController : public ProcessController {
public:
    explicit SystemProcessController(int kill_wait_ms = 2000) : kill_wait_ms_(kill_wait_ms) {}
    
    slate::utils::ProcessHandle spawn(const SpawnRequest& request) override {
        return slate::utils::ProcessManager::start_process(
            request.executable, request.args, request.working_dir, request.env_vars);
    }
    
    bool kill_pid_tree(int pid) override {
        return slate::utils::ProcessManager::kill_process_tree(pid, kill_wait_ms_);
    }
    
    bool kill_child_tree(slate::utils::ProcessHandle handle) override {
        return slate::utils::ProcessManager::kill_process_tree(handle);
    }
    
private:
    int kill_wait_ms_;
};

} // namespace slate_tray
