#pragma once

#include <string>
#include <vector>
#include <utility>

namespace slate {
namespace utils {

// Platform-independent process handle
struct ProcessHandle {
    void* handle;  // Windows process HANDLE, nullptr on POSIX
    int pid;
};

class ProcessManager {
public:
    // Start a process with arguments and extra environment variables.
    // The child leads its own process group so the whole tree can be signalled.
    // Throws ProcessException if the executable cannot be launched.
    static ProcessHandle start_process(
        const std::string& executable,
        const std::vector<std::string>& args,
        const std::string& working_dir = "",
        const std::vector<std::pair<std::string, std::string>>& env_vars = {});
    
    // Wait for an owned child to exit. Returns exit code, or -1 on timeout.
    static int wait_for_exit(ProcessHandle handle, int timeout_ms = -1);
    
    // Force kill an owned child and all of its descendants, then reap it.
    // False if the child is still alive afterwards.
    static bool kill_process_tree(ProcessHandle handle);
    
    // Force kill a process we did not spawn (or no longer hold a handle to)
    // together with its descendants. Waits up to wait_timeout_ms for the root to vanish.
    // A pid that no longer exists counts as already terminated.
    static bool kill_process_tree(int pid, int wait_timeout_ms = 2000);
    
    // Alive and not a defunct entry
    static bool is_process_alive(int pid);
    
    // All descendants of pid, breadth first
    static std::vector<int> get_descendants(int pid);
};

} // namespace utils
} // namespace slate
