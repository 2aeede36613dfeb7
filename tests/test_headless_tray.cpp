#include "slate_tray/platform/headless_tray.h"
#include "slate_tray/shutdown_coordinator.h"
#include "test_fakes.h"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

namespace slate_tray {

TEST(MenuTest, ActivateRunsMatchingCallback) {
    int shows = 0;
    int quits = 0;
    Menu menu;
    menu.add_item(MenuItem::Action("show", "Open Slate Editor", [&]() { ++shows; }));
    menu.add_separator();
    menu.add_item(MenuItem::Action("quit", "Quit", [&]() { ++quits; }));
    
    EXPECT_TRUE(menu.activate("quit"));
    EXPECT_FALSE(menu.activate("missing"));
    EXPECT_EQ(shows, 0);
    EXPECT_EQ(quits, 1);
}

TEST(MenuTest, DisabledItemDoesNotFire) {
    int calls = 0;
    Menu menu;
    menu.add_item(MenuItem::Action("show", "Open Slate Editor", [&]() { ++calls; }, false));
    
    EXPECT_FALSE(menu.activate("show"));
    EXPECT_EQ(calls, 0);
}

TEST(HeadlessTrayTest, RunReturnsAfterStopFromCallback) {
    HeadlessTray tray;
    ASSERT_TRUE(tray.initialize("Slate Editor", ""));
    
    Menu menu;
    menu.add_item(MenuItem::Action("quit", "Quit", [&tray]() { tray.stop(); }));
    tray.set_menu(menu);
    
    std::atomic<bool> returned{false};
    std::thread loop([&]() {
        tray.run();
        returned = true;
    });
    
    EXPECT_TRUE(tray.click_menu_item("quit"));
    loop.join();
    EXPECT_TRUE(returned);
}

TEST(HeadlessTrayTest, ClickIconFiresActivateCallback) {
    HeadlessTray tray;
    HeadlessWindow window("main");
    window.hide();
    
    tray.set_activate_callback([&window]() { window.show(); });
    tray.click_icon();
    
    EXPECT_TRUE(window.is_visible());
}

TEST(HeadlessTrayTest, TooltipIsStored) {
    HeadlessTray tray;
    tray.set_tooltip("Slate Server: running on port 8000");
    EXPECT_EQ(tray.get_tooltip(), "Slate Server: running on port 8000");
}

TEST(HeadlessWindowTest, CloseWithoutHandlerCloses) {
    HeadlessWindow window("main");
    EXPECT_TRUE(window.request_close());
    EXPECT_FALSE(window.is_visible());
}

TEST(HeadlessWindowTest, CloseIsVetoedIntoHide) {
    ServerState state;
    state.adopt({nullptr, 5000});
    FakeProcessController processes;
    ShutdownCoordinator coordinator(state, processes);
    
    HeadlessWindow window("main");
    window.set_close_request_handler([&]() { return coordinator.on_window_close(window); });
    
    EXPECT_FALSE(window.request_close());
    EXPECT_FALSE(window.is_visible());
    EXPECT_TRUE(state.has_child());
    
    window.show();
    EXPECT_TRUE(window.is_visible());
}

} // namespace slate_tray
