#include "slate_tray/platform/headless_tray.h"
#include <iostream>

namespace slate_tray {

HeadlessTray::HeadlessTray()
    : log_level_("info")
    , should_exit_(false)
{
}

HeadlessTray::~HeadlessTray() {
    stop();
}

bool HeadlessTray::initialize(const std::string& app_name, const std::string& icon_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    app_name_ = app_name;
    icon_path_ = icon_path;
    
    std::cout << "[Tray] " << app_name << " running without a system tray" << std::endl;
    if (log_level_ == "debug") {
        std::cout << "DEBUG: Icon path: " << (icon_path.empty() ? "(default)" : icon_path) << std::endl;
    }
    return true;
}

void HeadlessTray::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    stop_cv_.wait(lock, [this]() { return should_exit_; });
}

void HeadlessTray::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        should_exit_ = true;
    }
    stop_cv_.notify_all();
}

void HeadlessTray::set_menu(const Menu& menu) {
    std::lock_guard<std::mutex> lock(mutex_);
    menu_ = menu;
    
    if (log_level_ == "debug") {
        std::cout << "DEBUG: Tray menu set with " << menu.items.size() << " items" << std::endl;
        for (const auto& item : menu.items) {
            if (!item.is_separator) {
                std::cout << "DEBUG:   [" << item.id << "] " << item.text << std::endl;
            }
        }
    }
}

void HeadlessTray::show_notification(
    const std::string& title,
    const std::string& message,
    NotificationType type)
{
    if (type == NotificationType::WARNING || type == NotificationType::ERROR) {
        std::cerr << "[Tray] " << title << ": " << message << std::endl;
    } else {
        std::cout << "[Tray] " << title << ": " << message << std::endl;
    }
}

void HeadlessTray::set_tooltip(const std::string& tooltip) {
    std::lock_guard<std::mutex> lock(mutex_);
    tooltip_ = tooltip;
}

void HeadlessTray::set_activate_callback(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    activate_callback_ = callback;
}

void HeadlessTray::set_log_level(const std::string& log_level) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_level_ = log_level;
}

bool HeadlessTray::click_menu_item(const std::string& id) {
    Menu menu;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        menu = menu_;
    }
    // Callbacks may call stop(), so they run without the lock
    return menu.activate(id);
}

void HeadlessTray::click_icon() {
    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = activate_callback_;
    }
    if (callback) {
        callback();
    }
}

std::string HeadlessTray::get_tooltip() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tooltip_;
}

HeadlessWindow::HeadlessWindow(const std::string& label)
    : label_(label)
    , visible_(true)
{
}

void HeadlessWindow::show() {
    visible_ = true;
    std::cout << "[Window] " << label_ << " shown" << std::endl;
}

void HeadlessWindow::hide() {
    visible_ = false;
    std::cout << "[Window] " << label_ << " hidden" << std::endl;
}

void HeadlessWindow::focus() {
    std::cout << "[Window] " << label_ << " focused" << std::endl;
}

bool HeadlessWindow::is_visible() const {
    return visible_;
}

void HeadlessWindow::set_close_request_handler(CloseRequestHandler handler) {
    close_handler_ = handler;
}

bool HeadlessWindow::request_close() {
    if (close_handler_ && close_handler_() == CloseAction::PreventClose) {
        return false;
    }
    visible_ = false;
    std::cout << "[Window] " << label_ << " closed" << std::endl;
    return true;
}

} // namespace slate_tray
