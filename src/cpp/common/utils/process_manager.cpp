#include <slate/utils/process_manager.h>
#include <slate/error_types.h>
#include <iostream>
#include <fstream>
#include <thread>
#include <chrono>
#include <string>
#include <deque>
#include <set>
#include <map>
#include <cstring>

#ifdef _WIN32
#include <winsock2.h>
#include <windows.h>
#include <tlhelp32.h>
#else
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <dirent.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>

extern char** environ;
#endif

namespace slate {
namespace utils {

#ifdef _WIN32

// Parent pid of every process currently in the system
static std::map<DWORD, DWORD> snapshot_parent_map() {
    std::map<DWORD, DWORD> parents;
    HANDLE snapshot = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
    if (snapshot == INVALID_HANDLE_VALUE) {
        return parents;
    }

    PROCESSENTRY32W pe32;
    pe32.dwSize = sizeof(pe32);
    if (Process32FirstW(snapshot, &pe32)) {
        do {
            parents[pe32.th32ProcessID] = pe32.th32ParentProcessID;
        } while (Process32NextW(snapshot, &pe32));
    }
    CloseHandle(snapshot);
    return parents;
}

// Current environment with overrides applied, as a double-NUL-terminated block
static std::vector<char> build_environment_block(
    const std::vector<std::pair<std::string, std::string>>& env_vars) {

    std::vector<std::string> entries;
    LPCH current = GetEnvironmentStringsA();
    if (current) {
        for (LPCH p = current; *p; p += strlen(p) + 1) {
            std::string entry(p);
            bool overridden = false;
            for (const auto& env_pair : env_vars) {
                std::string prefix = env_pair.first + "=";
                if (entry.size() >= prefix.size() &&
                    _strnicmp(entry.c_str(), prefix.c_str(), prefix.size()) == 0) {
                    overridden = true;
                    break;
                }
            }
            if (!overridden) {
                entries.push_back(entry);
            }
        }
        FreeEnvironmentStringsA(current);
    }
    for (const auto& env_pair : env_vars) {
        entries.push_back(env_pair.first + "=" + env_pair.second);
    }

    std::vector<char> block;
    for (const auto& entry : entries) {
        block.insert(block.end(), entry.begin(), entry.end());
        block.push_back('\0');
    }
    block.push_back('\0');
    return block;
}

#else

#ifdef __linux__
// Read the parent pid field of /proc/<pid>/stat. Returns -1 if unreadable.
static int read_parent_pid(int pid) {
    std::ifstream stat_file("/proc/" + std::to_string(pid) + "/stat");
    if (!stat_file) {
        return -1;
    }

    std::string line;
    std::getline(stat_file, line);

    // Format: PID (name) STATE PPID ...; name may contain spaces and parens
    size_t paren_pos = line.rfind(')');
    if (paren_pos == std::string::npos || paren_pos + 4 >= line.length()) {
        return -1;
    }

    try {
        return std::stoi(line.substr(paren_pos + 4));
    } catch (const std::exception&) {
        return -1;
    }
}
#endif

// Direct children of pid
static std::vector<int> get_children(int pid) {
    std::vector<int> children;
#ifdef __linux__
    DIR* proc_dir = opendir("/proc");
    if (!proc_dir) {
        return children;
    }

    while (struct dirent* entry = readdir(proc_dir)) {
        const char* name = entry->d_name;
        if (name[0] < '0' || name[0] > '9') {
            continue;
        }
        int candidate = std::atoi(name);
        if (candidate > 0 && read_parent_pid(candidate) == pid) {
            children.push_back(candidate);
        }
    }
    closedir(proc_dir);
#else
    FILE* pipe = popen(("pgrep -P " + std::to_string(pid)).c_str(), "r");
    if (pipe) {
        char buffer[128];
        while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
            int child_pid = std::atoi(buffer);
            if (child_pid > 0) {
                children.push_back(child_pid);
            }
        }
        pclose(pipe);
    }
#endif
    return children;
}

static void signal_tree(int pid, const std::vector<int>& descendants) {
    // The sidecar is spawned as the leader of its own process group
    if (getpgid(pid) == pid) {
        killpg(pid, SIGKILL);
    }
    kill(pid, SIGKILL);

    // Descendants that moved to another group are signalled individually
    for (int child_pid : descendants) {
        kill(child_pid, SIGKILL);
    }
}

#endif

ProcessHandle ProcessManager::start_process(
    const std::string& executable,
    const std::vector<std::string>& args,
    const std::string& working_dir,
    const std::vector<std::pair<std::string, std::string>>& env_vars) {

    ProcessHandle handle;
    handle.handle = nullptr;
    handle.pid = 0;

#ifdef _WIN32
    std::string cmdline = "\"" + executable + "\"";
    for (const auto& arg : args) {
        cmdline += " \"" + arg + "\"";
    }
    std::vector<char> cmdline_buf(cmdline.begin(), cmdline.end());
    cmdline_buf.push_back('\0');

    std::vector<char> env_block = build_environment_block(env_vars);

    STARTUPINFOA si;
    PROCESS_INFORMATION pi;
    ZeroMemory(&si, sizeof(si));
    si.cb = sizeof(si);
    ZeroMemory(&pi, sizeof(pi));

    std::cout << "[ProcessManager] Starting process: " << cmdline << std::endl;

    BOOL success = CreateProcessA(
        nullptr,
        cmdline_buf.data(),
        nullptr,
        nullptr,
        FALSE,
        CREATE_NO_WINDOW | CREATE_NEW_PROCESS_GROUP,
        env_block.data(),
        working_dir.empty() ? nullptr : working_dir.c_str(),
        &si,
        &pi
    );

    if (!success) {
        DWORD error = GetLastError();
        char error_msg[256];
        FormatMessageA(
            FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
            nullptr,
            error,
            0,
            error_msg,
            sizeof(error_msg),
            nullptr
        );

        std::string full_error = "Failed to start process '" + executable +
                                "': " + error_msg + " (Error code: " + std::to_string(error) + ")";
        std::cerr << "[ProcessManager ERROR] " << full_error << std::endl;
        throw ProcessException(full_error);
    }

    handle.handle = pi.hProcess;
    handle.pid = static_cast<int>(pi.dwProcessId);
    CloseHandle(pi.hThread);

#else
    // Everything the child needs is built before fork()
    std::vector<std::string> env_storage;
    for (char** env = environ; env && *env; ++env) {
        std::string entry(*env);
        bool overridden = false;
        for (const auto& env_pair : env_vars) {
            if (entry.compare(0, env_pair.first.size() + 1, env_pair.first + "=") == 0) {
                overridden = true;
                break;
            }
        }
        if (!overridden) {
            env_storage.push_back(entry);
        }
    }
    for (const auto& env_pair : env_vars) {
        env_storage.push_back(env_pair.first + "=" + env_pair.second);
    }
    std::vector<char*> envp;
    for (auto& entry : env_storage) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    std::vector<char*> argv_ptrs;
    argv_ptrs.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args) {
        argv_ptrs.push_back(const_cast<char*>(arg.c_str()));
    }
    argv_ptrs.push_back(nullptr);

    // exec failure is reported through this pipe; a successful exec closes it
    int status_pipe[2];
    if (pipe(status_pipe) == -1) {
        throw ProcessException(std::string("Failed to create status pipe: ") + strerror(errno));
    }
    fcntl(status_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(status_pipe[1], F_SETFD, FD_CLOEXEC);

    std::cout << "[ProcessManager] Starting process: " << executable << std::endl;

    pid_t pid = fork();

    if (pid < 0) {
        int err = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);
        throw ProcessException("Failed to fork process: " + std::string(strerror(err)));
    }

    if (pid == 0) {
        // Child process
        close(status_pipe[0]);
        setpgid(0, 0);

        if (!working_dir.empty() && chdir(working_dir.c_str()) == -1) {
            int err = errno;
            ssize_t written = write(status_pipe[1], &err, sizeof(err));
            (void)written;
            _exit(127);
        }

        environ = envp.data();
        execvp(executable.c_str(), argv_ptrs.data());

        // If execvp returns, it failed
        int err = errno;
        ssize_t written = write(status_pipe[1], &err, sizeof(err));
        (void)written;
        _exit(127);
    }

    // Parent process. Also set the group here so there is no window where
    // a kill could race the child's own setpgid.
    setpgid(pid, pid);
    close(status_pipe[1]);

    int child_errno = 0;
    ssize_t bytes_read;
    do {
        bytes_read = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (bytes_read == -1 && errno == EINTR);
    close(status_pipe[0]);

    if (bytes_read > 0) {
        int status;
        waitpid(pid, &status, 0);
        std::string full_error = "Failed to start process '" + executable + "': " + strerror(child_errno);
        std::cerr << "[ProcessManager ERROR] " << full_error << std::endl;
        throw ProcessException(full_error);
    }

    handle.pid = pid;

#endif

    std::cout << "[ProcessManager] Process started successfully, PID: " << handle.pid << std::endl;
    return handle;
}

int ProcessManager::wait_for_exit(ProcessHandle handle, int timeout_ms) {
#ifdef _WIN32
    if (!handle.handle) {
        return -1;
    }

    DWORD wait_time = timeout_ms < 0 ? INFINITE : static_cast<DWORD>(timeout_ms);
    DWORD result = WaitForSingleObject(handle.handle, wait_time);

    if (result != WAIT_OBJECT_0) {
        return -1;
    }

    DWORD exit_code;
    if (!GetExitCodeProcess(handle.handle, &exit_code)) {
        return -1;
    }
    return static_cast<int>(exit_code);
#else
    if (handle.pid <= 0) {
        return -1;
    }

    int status;
    if (timeout_ms < 0) {
        if (waitpid(handle.pid, &status, 0) != handle.pid) {
            return -1;
        }
        return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }

    for (int waited = 0; waited <= timeout_ms; waited += 10) {
        pid_t result = waitpid(handle.pid, &status, WNOHANG);
        if (result > 0) {
            return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        }
        if (result < 0) {
            return -1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    return -1;  // Timeout
#endif
}

bool ProcessManager::kill_process_tree(ProcessHandle handle) {
    if (handle.pid <= 0) {
        return false;
    }

    // Collect descendants first: they get reparented once the root is gone
    std::vector<int> descendants = get_descendants(handle.pid);

#ifdef _WIN32
    if (handle.handle) {
        TerminateProcess(handle.handle, 1);
    }
    for (int child_pid : descendants) {
        HANDLE child = OpenProcess(PROCESS_TERMINATE, FALSE, static_cast<DWORD>(child_pid));
        if (child) {
            TerminateProcess(child, 1);
            CloseHandle(child);
        }
    }
#else
    signal_tree(handle.pid, descendants);
#endif

    // The exit code of a killed child carries nothing; waiting reaps it
    wait_for_exit(handle, 5000);
    bool terminated = !is_process_alive(handle.pid);
    if (!terminated) {
        std::cerr << "[ProcessManager] PID " << handle.pid << " survived kill" << std::endl;
    }

#ifdef _WIN32
    if (handle.handle) {
        CloseHandle(handle.handle);
    }
#endif

    return terminated;
}

bool ProcessManager::kill_process_tree(int pid, int wait_timeout_ms) {
    if (pid <= 0) {
        return false;
    }

    std::vector<int> descendants = get_descendants(pid);

#ifdef _WIN32
    HANDLE root = OpenProcess(PROCESS_TERMINATE | SYNCHRONIZE, FALSE, static_cast<DWORD>(pid));
    if (!root) {
        DWORD error = GetLastError();
        if (error == ERROR_INVALID_PARAMETER) {
            // No such process
            return true;
        }
        std::cerr << "[ProcessManager] Cannot open PID " << pid << " (Error code: " << error << ")" << std::endl;
        return false;
    }

    if (!TerminateProcess(root, 1)) {
        std::cerr << "[ProcessManager] TerminateProcess failed for PID " << pid
                  << " (Error code: " << GetLastError() << ")" << std::endl;
        CloseHandle(root);
        return false;
    }
    for (int child_pid : descendants) {
        HANDLE child = OpenProcess(PROCESS_TERMINATE, FALSE, static_cast<DWORD>(child_pid));
        if (child) {
            TerminateProcess(child, 1);
            CloseHandle(child);
        }
    }

    DWORD result = WaitForSingleObject(root, wait_timeout_ms < 0 ? INFINITE : static_cast<DWORD>(wait_timeout_ms));
    CloseHandle(root);
    return result == WAIT_OBJECT_0;
#else
    if (kill(pid, 0) != 0) {
        if (errno == ESRCH) {
            return true;  // Already gone
        }
        std::cerr << "[ProcessManager] Cannot signal PID " << pid << ": " << strerror(errno) << std::endl;
        return false;
    }

    signal_tree(pid, descendants);

    for (int waited = 0; wait_timeout_ms < 0 || waited < wait_timeout_ms; waited += 50) {
        if (!is_process_alive(pid)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return !is_process_alive(pid);
#endif
}

bool ProcessManager::is_process_alive(int pid) {
    if (pid <= 0) return false;

#ifdef _WIN32
    HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (!process) {
        return false;
    }
    DWORD exit_code = 0;
    bool alive = GetExitCodeProcess(process, &exit_code) && exit_code == STILL_ACTIVE;
    CloseHandle(process);
    return alive;
#else
    // First check if process exists at all
    if (kill(pid, 0) != 0 && errno != EPERM) {
        return false;
    }

#ifdef __linux__
    // Check if it's a zombie by reading /proc/PID/stat
    std::ifstream stat_file("/proc/" + std::to_string(pid) + "/stat");
    if (!stat_file) {
        return false;
    }

    std::string line;
    std::getline(stat_file, line);

    size_t paren_pos = line.rfind(')');
    if (paren_pos != std::string::npos && paren_pos + 2 < line.length()) {
        char state = line[paren_pos + 2];
        return (state != 'Z' && state != 'X');
    }
#endif

    // If we can't parse the state, assume alive to be safe
    return true;
#endif
}

std::vector<int> ProcessManager::get_descendants(int pid) {
    std::vector<int> descendants;
    if (pid <= 0) {
        return descendants;
    }

    std::set<int> visited = {pid};
    std::deque<int> pending = {pid};

#ifdef _WIN32
    std::map<DWORD, DWORD> parents = snapshot_parent_map();
#endif

    while (!pending.empty()) {
        int current = pending.front();
        pending.pop_front();

        std::vector<int> children;
#ifdef _WIN32
        for (const auto& entry : parents) {
            if (entry.second == static_cast<DWORD>(current)) {
                children.push_back(static_cast<int>(entry.first));
            }
        }
#else
        children = get_children(current);
#endif

        for (int child_pid : children) {
            // Guard against pid reuse producing a cycle
            if (visited.insert(child_pid).second) {
                descendants.push_back(child_pid);
                pending.push_back(child_pid);
            }
        }
    }

    return descendants;
}

} // namespace utils
} // namespace slate
