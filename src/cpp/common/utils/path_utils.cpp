#include <slate/utils/path_utils.h>
#include <filesystem>
#include <vector>
#include <string>
#include <cstdint>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#include <limits.h>
#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif
#endif

namespace fs = std::filesystem;

namespace slate {
namespace utils {

std::string get_executable_dir() {
#ifdef _WIN32
    char buffer[MAX_PATH];
    GetModuleFileNameA(NULL, buffer, MAX_PATH);
    fs::path exe_path(buffer);
    return exe_path.parent_path().string();
#elif defined(__linux__)
    char buffer[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (len != -1) {
        buffer[len] = '\0';
        fs::path exe_path(buffer);
        return exe_path.parent_path().string();
    }
    // Fallback: return current directory
    return ".";
#elif defined(__APPLE__)
    char buffer[PATH_MAX];
    uint32_t size = sizeof(buffer);
    if (_NSGetExecutablePath(buffer, &size) == 0) {
        fs::path exe_path(buffer);
        return exe_path.parent_path().string();
    }
    return ".";
#else
    return ".";
#endif
}

std::string find_server_executable() {
#ifdef _WIN32
    std::string binary_name = "slate-server.exe";
#else
    std::string binary_name = "slate-server";
#endif

    std::vector<fs::path> search_paths = {
        fs::path(get_executable_dir()) / binary_name,
        fs::path(binary_name),
        fs::path("..") / binary_name,
    };

#ifdef _WIN32
    search_paths.push_back(fs::path("C:/Program Files/Slate") / binary_name);
#else
    search_paths.push_back(fs::path("/usr/local/bin") / binary_name);
    search_paths.push_back(fs::path("/usr/bin") / binary_name);
#endif

    for (const auto& path : search_paths) {
        std::error_code ec;
        if (fs::is_regular_file(path, ec)) {
            return fs::absolute(path, ec).string();
        }
    }

    return "";
}

} // namespace utils
} // namespace slate
