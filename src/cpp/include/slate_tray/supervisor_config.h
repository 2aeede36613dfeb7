#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace slate_tray {

// Name the sidecar reports in the "app" field of /health
inline constexpr char SERVER_APP_NAME[] = "slate-server";

// Environment variables that carry our identity into the sidecar
inline constexpr char OWNER_ENV_VAR[] = "SLATE_OWNER";
inline constexpr char ENV_ENV_VAR[] = "SLATE_ENV";

struct SupervisorConfig {
    std::string host = "127.0.0.1";
    int port = 8000;
    
    std::string owner = "tauri";
    std::string env = "prod";
    
    std::string server_binary;
    std::vector<std::string> server_args;
    
    std::chrono::milliseconds probe_timeout{500};
    std::chrono::milliseconds connect_timeout{100};
    std::chrono::milliseconds zombie_kill_timeout{2000};
    std::chrono::milliseconds ready_timeout{10000};
    std::chrono::milliseconds poll_interval{200};
    
    std::string log_level = "info";
};

} // namespace slate_tray
