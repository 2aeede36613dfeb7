#pragma once

#include "tray_interface.h"
#include "window_interface.h"
#include <mutex>
#include <condition_variable>
#include <atomic>

namespace slate_tray {

// Console-only tray: menu and notifications are logged, run() blocks until stop().
// Used where no system tray toolkit is linked.
class HeadlessTray : public TrayInterface {
public:
    HeadlessTray();
    ~HeadlessTray() override;
    
    // TrayInterface implementation
    bool initialize(const std::string& app_name, const std::string& icon_path) override;
    void run() override;
    void stop() override;
    void set_menu(const Menu& menu) override;
    void show_notification(
        const std::string& title,
        const std::string& message,
        NotificationType type = NotificationType::INFO
    ) override;
    void set_tooltip(const std::string& tooltip) override;
    void set_activate_callback(std::function<void()> callback) override;
    void set_log_level(const std::string& log_level) override;
    
    // Simulated user input
    bool click_menu_item(const std::string& id);
    void click_icon();
    
    std::string get_tooltip() const;
    
private:
    std::string app_name_;
    std::string icon_path_;
    std::string log_level_;
    std::string tooltip_;
    Menu menu_;
    std::function<void()> activate_callback_;
    
    mutable std::mutex mutex_;
    std::condition_variable stop_cv_;
    bool should_exit_;
};

// Console-only stand-in for the editor's main window
class HeadlessWindow : public WindowInterface {
public:
    explicit HeadlessWindow(const std::string& label);
    
    const std::string& label() const override { return label_; }
    void show() override;
    void hide() override;
    void focus() override;
    bool is_visible() const override;
    void set_close_request_handler(CloseRequestHandler handler) override;
    
    // User asked to close the window. Returns true if it actually closed.
    bool request_close();
    
private:
    std::string label_;
    std::atomic<bool> visible_;
    CloseRequestHandler close_handler_;
};

} // namespace slate_tray
