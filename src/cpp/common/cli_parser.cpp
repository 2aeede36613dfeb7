#include <slate/cli_parser.h>
#include <cstdlib>
#include <iostream>

namespace slate {

CLIParser::CLIParser()
    : app_("slate-editor - Slate desktop shell and server supervisor") {
    
    // Environment first so that capture_default_str() shows the effective default
    load_env_defaults();
    
    // Add version flag (help is automatically added by CLI11)
    app_.add_flag("-v,--version", show_version_, "Show version number");
    
    app_.add_option("--port", config_.port, "Port the Slate server listens on")
        ->check(CLI::Range(1, 65535))
        ->capture_default_str();
    
    app_.add_option("--host", config_.host, "Address used to reach the Slate server")
        ->capture_default_str();
    
    app_.add_option("--owner", config_.owner, "Owner tag injected into the server (SLATE_OWNER)")
        ->capture_default_str();
    
    app_.add_option("--env", config_.env, "Environment tag injected into the server (SLATE_ENV)")
        ->capture_default_str();
    
    app_.add_option("--server-binary", config_.server_binary, "Path to the slate-server executable")
        ->check(CLI::ExistingFile);
    
    app_.add_option("--log-level", config_.log_level, "Log level for the editor shell")
        ->check(CLI::IsMember({"error", "warning", "info", "debug"}))
        ->capture_default_str();
    
    app_.add_option("--ready-timeout", config_.ready_timeout_seconds,
                   "Seconds to wait for the server to report healthy")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();
}

void CLIParser::load_env_defaults() {
    auto getenv_or_default = [](const char* name, const std::string& default_val) -> std::string {
        const char* val = std::getenv(name);
        return (val && *val) ? std::string(val) : default_val;
    };
    
    auto getenv_int_or_default = [](const char* name, int default_val) -> int {
        const char* val = std::getenv(name);
        if (val) {
            try {
                return std::stoi(val);
            } catch (const std::exception&) {
                // Invalid integer, use default
                return default_val;
            }
        }
        return default_val;
    };
    
    // CLI11 checks only apply to parsed flags, so the env port is checked here
    int env_port = getenv_int_or_default("SLATE_EDITOR_PORT", config_.port);
    if (env_port >= 1 && env_port <= 65535) {
        config_.port = env_port;
    } else {
        std::cerr << "Ignoring SLATE_EDITOR_PORT=" << env_port
                  << ": port must be between 1 and 65535" << std::endl;
    }
    config_.host = getenv_or_default("SLATE_EDITOR_HOST", config_.host);
    config_.log_level = getenv_or_default("SLATE_EDITOR_LOG_LEVEL", config_.log_level);
    config_.server_binary = getenv_or_default("SLATE_SERVER_BINARY", config_.server_binary);
}

int CLIParser::parse(int argc, char** argv) {
    try {
        app_.parse(argc, argv);
        should_continue_ = true;
        exit_code_ = 0;
        return 0;
    } catch (const CLI::ParseError& e) {
        // Help requested or parse error occurred; CLI11 prints and picks the exit code
        exit_code_ = app_.exit(e);
        should_continue_ = false;
        return exit_code_;
    }
}

} // namespace slate
