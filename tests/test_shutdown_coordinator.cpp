#include "slate_tray/shutdown_coordinator.h"
#include "test_fakes.h"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

namespace slate_tray {

class ShutdownCoordinatorTest : public ::testing::Test {
protected:
    ServerState state_;
    FakeProcessController processes_;
    FakeWindow window_;
};

TEST_F(ShutdownCoordinatorTest, TerminateWithoutChildIsNoOp) {
    ShutdownCoordinator coordinator(state_, processes_);
    EXPECT_FALSE(coordinator.terminate("exit"));
    EXPECT_EQ(processes_.child_kill_count(), 0u);
}

TEST_F(ShutdownCoordinatorTest, TerminateKillsChildOnce) {
    state_.adopt({nullptr, 5000});
    ShutdownCoordinator coordinator(state_, processes_);
    
    EXPECT_TRUE(coordinator.terminate("quit"));
    EXPECT_FALSE(coordinator.terminate("exit"));
    
    ASSERT_EQ(processes_.child_kill_count(), 1u);
    EXPECT_EQ(processes_.child_kills[0], 5000);
    EXPECT_FALSE(state_.has_child());
}

TEST_F(ShutdownCoordinatorTest, RacingTerminatesKillOnce) {
    state_.adopt({nullptr, 5000});
    ShutdownCoordinator coordinator(state_, processes_);
    
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&coordinator]() { coordinator.terminate("exit"); });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(processes_.child_kill_count(), 1u);
}

TEST_F(ShutdownCoordinatorTest, WindowCloseHidesAndKeepsServer) {
    state_.adopt({nullptr, 5000});
    ShutdownCoordinator coordinator(state_, processes_);
    
    EXPECT_EQ(coordinator.on_window_close(window_), CloseAction::PreventClose);
    EXPECT_FALSE(window_.is_visible());
    EXPECT_EQ(window_.hide_calls, 1);
    
    EXPECT_TRUE(state_.has_child());
    EXPECT_EQ(processes_.child_kill_count(), 0u);
}

} // namespace slate_tray
