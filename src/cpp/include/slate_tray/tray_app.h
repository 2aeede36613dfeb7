#pragma once

#include "platform/tray_interface.h"
#include "platform/headless_tray.h"
#include "health_probe.h"
#include "process_controller.h"
#include "sidecar_lifecycle.h"
#include "supervisor_config.h"
#include <slate/cli_parser.h>
#include <memory>
#include <string>
#include <thread>
#include <atomic>

namespace slate_tray {

class TrayApp {
public:
    // Parses the command line and installs the exit signal handlers
    TrayApp(int argc, char* argv[]);
    // Already parsed configuration; no signal handlers are installed
    explicit TrayApp(const slate::EditorConfig& config);
    ~TrayApp();
    
    int run();
    int run(std::unique_ptr<HealthProbe> probe,
            std::unique_ptr<ProcessController> processes,
            std::unique_ptr<TrayInterface> tray);
    void shutdown();  // Application exit; public for signal handlers
    
#ifndef _WIN32
    // Self-pipe: signal handlers write, the monitor thread reads
    static int signal_pipe_[2];
#endif
    
private:
    // Initialization
    void install_signal_handlers();
    void print_version();
    void resolve_server_binary();  // Throws slate::ConfigurationException
    SupervisorConfig make_supervisor_config() const;
    
    // Menu building
    void build_menu();
    Menu create_menu();
    
    // Menu and window actions
    void on_show_window();
    void on_quit();
    
    // Readiness is shown on the tray; it never blocks the editor
    void show_server_status(const StartupReport& report);
    
    // Member variables
    slate::EditorConfig config_;
    std::unique_ptr<HealthProbe> probe_;
    std::unique_ptr<ProcessController> processes_;
    std::unique_ptr<SidecarLifecycle> lifecycle_;
    std::unique_ptr<TrayInterface> tray_;
    std::unique_ptr<HeadlessWindow> window_;
    
    bool signals_installed_ = false;
    std::atomic<bool> should_exit_{false};
    
#ifndef _WIN32
    std::atomic<bool> stop_signal_monitor_{false};
    std::thread signal_monitor_thread_;
#endif
};

} // namespace slate_tray
