#include "slate_tray/platform/tray_interface.h"
#include "slate_tray/platform/headless_tray.h"

namespace slate_tray {

std::unique_ptr<TrayInterface> create_tray() {
    // Widgets belong to the host UI toolkit; this build ships the console tray
    return std::make_unique<HeadlessTray>();
}

} // namespace slate_tray
