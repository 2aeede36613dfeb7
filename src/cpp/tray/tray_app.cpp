#include "slate_tray/tray_app.h"
#include <slate/error_types.h>
#include <slate/utils/path_utils.h>
#include <slate/version.h>
#include <iostream>
#include <filesystem>
#include <chrono>
#include <csignal>
#include <cstdlib>

#ifdef _WIN32
#include <winsock2.h>  // Must come before windows.h
#include <windows.h>
#else
#include <cstring>     // for strerror
#include <unistd.h>
#include <fcntl.h>
#include <sys/select.h>
#include <cerrno>
#endif

namespace fs = std::filesystem;

namespace slate_tray {

// Helper macro for debug logging
#define DEBUG_LOG(app, msg) \
    if ((app)->config_.log_level == "debug") { \
        std::cout << "DEBUG: " << msg << std::endl; \
    }

#ifndef _WIN32
int TrayApp::signal_pipe_[2] = {-1, -1};
#endif

// Global pointer to the current TrayApp instance for signal handling
static TrayApp* g_tray_app_instance = nullptr;

#ifdef _WIN32
// Console close / Ctrl+C is the application-exit event
BOOL WINAPI console_ctrl_handler(DWORD ctrl_type) {
    if (ctrl_type == CTRL_C_EVENT || ctrl_type == CTRL_CLOSE_EVENT || ctrl_type == CTRL_BREAK_EVENT) {
        std::cout << "\nReceived interrupt signal, shutting down..." << std::endl;
        std::cout.flush();

        if (g_tray_app_instance) {
            g_tray_app_instance->shutdown();
        }

        // Windows waits for this handler to return before terminating
        std::exit(0);
    }
    return FALSE;
}
#else
// SIGINT and SIGTERM both mean "exit": the sidecar tree must go with us.
// write() is async-signal-safe; the monitor thread does the actual work.
void signal_handler(int signal) {
    char sig = static_cast<char>(signal);
    ssize_t written = write(TrayApp::signal_pipe_[1], &sig, 1);
    (void)written;
}
#endif

TrayApp::TrayApp(int argc, char* argv[]) {
    slate::CLIParser parser;
    parser.parse(argc, argv);

    // --help or a parse error: CLI11 already printed what is needed
    if (!parser.should_continue()) {
        exit(parser.get_exit_code());
    }

    if (parser.should_show_version()) {
        print_version();
        exit(0);
    }

    config_ = parser.get_config();
    install_signal_handlers();
}

TrayApp::TrayApp(const slate::EditorConfig& config)
    : config_(config)
{
}

void TrayApp::install_signal_handlers() {
    g_tray_app_instance = this;

#ifdef _WIN32
    SetConsoleCtrlHandler(console_ctrl_handler, TRUE);
#else
    if (pipe(signal_pipe_) == -1) {
        std::cerr << "Failed to create signal pipe: " << strerror(errno) << std::endl;
        exit(1);
    }

    // The sidecar must not inherit either end
    fcntl(signal_pipe_[0], F_SETFD, FD_CLOEXEC);
    fcntl(signal_pipe_[1], F_SETFD, FD_CLOEXEC);

    // Non-blocking write end so the signal handler can never stall
    int flags = fcntl(signal_pipe_[1], F_GETFL);
    if (flags != -1) {
        fcntl(signal_pipe_[1], F_SETFL, flags | O_NONBLOCK);
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
#endif

    signals_installed_ = true;
    DEBUG_LOG(this, "Signal handlers installed");
}

TrayApp::~TrayApp() {
#ifndef _WIN32
    if (signal_monitor_thread_.joinable()) {
        stop_signal_monitor_ = true;
        signal_monitor_thread_.join();
    }
#endif

    shutdown();

    if (signals_installed_) {
#ifdef _WIN32
        SetConsoleCtrlHandler(console_ctrl_handler, FALSE);
#else
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        if (signal_pipe_[0] != -1) {
            close(signal_pipe_[0]);
            close(signal_pipe_[1]);
            signal_pipe_[0] = signal_pipe_[1] = -1;
        }
#endif
        g_tray_app_instance = nullptr;
    }
}

int TrayApp::run() {
    DEBUG_LOG(this, "TrayApp::run() starting...");

    try {
        resolve_server_binary();
    } catch (const slate::ConfigurationException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
#ifdef _WIN32
        std::cerr << "Please ensure slate-server.exe is in the same directory" << std::endl;
#else
        std::cerr << "Please ensure slate-server is in the same directory or in /usr/local/bin" << std::endl;
#endif
        return 1;
    }

    DEBUG_LOG(this, "Using server binary: " << config_.server_binary);

    SupervisorConfig supervisor_config = make_supervisor_config();
    return run(
        std::make_unique<HttpHealthProbe>(
            supervisor_config.host,
            supervisor_config.port,
            supervisor_config.probe_timeout,
            supervisor_config.connect_timeout,
            supervisor_config.log_level),
        std::make_unique<SystemProcessController>(
            static_cast<int>(supervisor_config.zombie_kill_timeout.count())),
        create_tray());
}

int TrayApp::run(std::unique_ptr<HealthProbe> probe,
                 std::unique_ptr<ProcessController> processes,
                 std::unique_ptr<TrayInterface> tray) {
    probe_ = std::move(probe);
    processes_ = std::move(processes);
    lifecycle_ = std::make_unique<SidecarLifecycle>(make_supervisor_config(), *probe_, *processes_);

    // Any failure here aborts start-up; the editor never opens
    StartupReport report;
    try {
        report = lifecycle_->on_startup();
    } catch (const slate::SlateException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    tray_ = std::move(tray);
    if (!tray_) {
        std::cerr << "Error: Failed to create tray for this platform" << std::endl;
        return 1;
    }
    tray_->set_log_level(config_.log_level);
    tray_->set_activate_callback([this]() { on_show_window(); });

    window_ = std::make_unique<HeadlessWindow>("main");
    window_->set_close_request_handler([this]() {
        return lifecycle_->on_window_close(*window_);
    });

    if (!tray_->initialize("Slate Editor", "")) {
        std::cerr << "Error: Failed to initialize tray" << std::endl;
        return 1;
    }

    build_menu();
    show_server_status(report);

#ifndef _WIN32
    // Handle Ctrl+C / SIGTERM while the tray loop owns the main thread
    if (signals_installed_) {
        DEBUG_LOG(this, "Starting signal monitor thread...");
        signal_monitor_thread_ = std::thread([this]() {
            while (!stop_signal_monitor_ && !should_exit_) {
                fd_set readfds;
                FD_ZERO(&readfds);
                FD_SET(signal_pipe_[0], &readfds);

                struct timeval tv = {0, 100000};  // 100ms timeout
                int result = select(signal_pipe_[0] + 1, &readfds, nullptr, nullptr, &tv);

                if (result > 0 && FD_ISSET(signal_pipe_[0], &readfds)) {
                    char sig;
                    ssize_t bytes_read = read(signal_pipe_[0], &sig, 1);
                    (void)bytes_read;

                    std::cout << "\nReceived termination signal, shutting down..." << std::endl;
                    shutdown();
                    break;
                }
            }
            DEBUG_LOG(this, "Signal monitor thread exiting");
        });
    }
#endif

    DEBUG_LOG(this, "Entering event loop...");
    tray_->run();
    DEBUG_LOG(this, "Event loop exited");

    shutdown();
    return 0;
}

void TrayApp::print_version() {
    std::cout << "slate-editor version " << SLATE_VERSION_STRING << std::endl;
}

void TrayApp::resolve_server_binary() {
    if (!config_.server_binary.empty()) {
        if (!fs::exists(config_.server_binary)) {
            throw slate::ConfigurationException("Server binary not found: " + config_.server_binary);
        }
        return;
    }

    DEBUG_LOG(this, "Searching for server binary...");
    std::string path = slate::utils::find_server_executable();
    if (path.empty()) {
        throw slate::ConfigurationException(std::string("Could not find ") + SERVER_APP_NAME + " binary");
    }
    config_.server_binary = path;
    DEBUG_LOG(this, "Found server binary: " << config_.server_binary);
}

SupervisorConfig TrayApp::make_supervisor_config() const {
    SupervisorConfig supervisor_config;
    supervisor_config.host = config_.host;
    supervisor_config.port = config_.port;
    supervisor_config.owner = config_.owner;
    supervisor_config.env = config_.env;
    supervisor_config.server_binary = config_.server_binary;
    supervisor_config.ready_timeout = std::chrono::seconds(config_.ready_timeout_seconds);
    supervisor_config.log_level = config_.log_level;
    return supervisor_config;
}

void TrayApp::build_menu() {
    if (!tray_) return;

    Menu menu = create_menu();
    tray_->set_menu(menu);
}

Menu TrayApp::create_menu() {
    Menu menu;
    menu.add_item(MenuItem::Action("show", "Open Slate Editor", [this]() { on_show_window(); }));
    menu.add_separator();
    menu.add_item(MenuItem::Action("quit", "Quit", [this]() { on_quit(); }));
    return menu;
}

void TrayApp::on_show_window() {
    if (window_) {
        window_->show();
        window_->focus();
    }
}

void TrayApp::on_quit() {
    if (lifecycle_) {
        lifecycle_->on_quit();
    }
    shutdown();
}

void TrayApp::show_server_status(const StartupReport& report) {
    if (!tray_) return;

    if (report.ready) {
        tray_->set_tooltip("Slate Server: running on port " + std::to_string(config_.port));
    } else {
        tray_->set_tooltip("Slate Server: not responding yet");
        tray_->show_notification(
            "Slate Server",
            "The server has not answered its health check yet. The editor may be unavailable for a moment.",
            NotificationType::WARNING);
    }
}

void TrayApp::shutdown() {
    if (should_exit_.exchange(true)) {
        return;  // Already shutting down
    }

    DEBUG_LOG(this, "Shutting down...");

    // Application exit: no-op if Quit already killed the sidecar
    if (lifecycle_) {
        lifecycle_->on_exit();
    }

    if (tray_) {
        tray_->stop();
    }
}

} // namespace slate_tray
