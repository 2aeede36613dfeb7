#pragma once

#include <CLI/CLI.hpp>
#include <string>

namespace slate {

struct EditorConfig {
    std::string host = "127.0.0.1";
    int port = 8000;
    
    // Identity tags handed to the sidecar and expected back from /health
    std::string owner = "tauri";
    std::string env = "prod";
    
    std::string server_binary;  // Empty: discover next to the executable
    std::string log_level = "info";
    int ready_timeout_seconds = 10;
};

class CLIParser {
public:
    CLIParser();
    
    // Parse command line arguments
    // Returns: 0 if should continue, exit code (may be 0) if should exit
    int parse(int argc, char** argv);
    
    EditorConfig get_config() const { return config_; }
    
    // Check if we should continue (false means exit cleanly, e.g., after --help)
    bool should_continue() const { return should_continue_; }
    
    // Get exit code (only valid if should_continue() is false)
    int get_exit_code() const { return exit_code_; }
    
    bool should_show_version() const { return show_version_; }
    
private:
    // SLATE_EDITOR_* variables; command-line flags override them
    void load_env_defaults();
    
    CLI::App app_;
    EditorConfig config_;
    bool show_version_ = false;
    bool should_continue_ = true;
    int exit_code_ = 0;
};

} // namespace slate
