#pragma once

#include <string>
#include <functional>

namespace slate_tray {

// What the host should do with a close request on a window
enum class CloseAction {
    Close,
    PreventClose
};

using CloseRequestHandler = std::function<CloseAction()>;

// The editor's main window, as far as the supervisor is concerned.
// Widget construction belongs to the UI toolkit, not to this interface.
class WindowInterface {
public:
    virtual ~WindowInterface() = default;
    
    virtual const std::string& label() const = 0;
    
    virtual void show() = 0;
    virtual void hide() = 0;
    virtual void focus() = 0;
    virtual bool is_visible() const = 0;
    
    // Consulted when the user asks to close the window
    virtual void set_close_request_handler(CloseRequestHandler handler) = 0;
};

} // namespace slate_tray
