#include "slate_tray/tray_app.h"
#include <iostream>
#include <exception>

// Desktop shell entry point: supervises slate-server for the editor's lifetime
int main(int argc, char* argv[]) {
    try {
        slate_tray::TrayApp app(argc, argv);
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
