#include "slate_tray/sidecar_lifecycle.h"
#include "test_fakes.h"

#include <gtest/gtest.h>

namespace slate_tray {

class SidecarLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.server_binary = "/opt/slate/bin/slate-server";
        config_.owner = "tauri";
        config_.env = "prod";
        config_.poll_interval = std::chrono::milliseconds(5);
        config_.zombie_kill_timeout = std::chrono::milliseconds(200);
        config_.ready_timeout = std::chrono::milliseconds(200);
        
        processes_.next_pid = 7000;
    }
    
    SupervisorConfig config_;
    FakeHealthProbe probe_;
    FakeProcessController processes_;
};

TEST_F(SidecarLifecycleTest, FreePortSpawnsAndWaitsForReady) {
    processes_.on_spawn = [this]() {
        probe_.set_fallback(make_health("slate-server", "tauri", "prod", 7000));
    };
    
    SidecarLifecycle lifecycle(config_, probe_, processes_);
    StartupReport report = lifecycle.on_startup();
    
    EXPECT_EQ(report.decision.occupant, PortOccupant::PortFree);
    EXPECT_EQ(report.pid, 7000);
    EXPECT_TRUE(report.ready);
    EXPECT_TRUE(processes_.pid_kills.empty());
    EXPECT_EQ(lifecycle.state().child_pid(), 7000);
}

TEST_F(SidecarLifecycleTest, ZombieIsKilledBeforeSpawn) {
    probe_.set_fallback(make_health("slate-server", "tauri", "prod", 4321));
    processes_.on_kill_pid = [this]() { probe_.set_fallback(std::nullopt); };
    processes_.on_spawn = [this]() {
        probe_.set_fallback(make_health("slate-server", "tauri", "prod", 7000));
    };
    
    SidecarLifecycle lifecycle(config_, probe_, processes_);
    StartupReport report = lifecycle.on_startup();
    
    EXPECT_EQ(report.decision.occupant, PortOccupant::OwnedZombie);
    ASSERT_EQ(processes_.pid_kills.size(), 1u);
    EXPECT_EQ(processes_.pid_kills[0], 4321);
    EXPECT_EQ(processes_.spawns.size(), 1u);
    EXPECT_TRUE(report.ready);
}

TEST_F(SidecarLifecycleTest, ForeignApplicationAbortsWithoutSpawning) {
    probe_.set_fallback(make_health("other", "tauri", "prod", 99));
    
    SidecarLifecycle lifecycle(config_, probe_, processes_);
    EXPECT_THROW(lifecycle.on_startup(), slate::ConflictException);
    
    EXPECT_TRUE(processes_.pid_kills.empty());
    EXPECT_TRUE(processes_.spawns.empty());
    EXPECT_FALSE(lifecycle.state().has_child());
}

TEST_F(SidecarLifecycleTest, ForeignOwnerAbortsWithoutSpawning) {
    probe_.set_fallback(make_health("slate-server", "standalone", "prod", 55));
    
    SidecarLifecycle lifecycle(config_, probe_, processes_);
    EXPECT_THROW(lifecycle.on_startup(), slate::ConflictException);
    
    EXPECT_TRUE(processes_.pid_kills.empty());
    EXPECT_TRUE(processes_.spawns.empty());
}

TEST_F(SidecarLifecycleTest, ServerThatNeverAnswersStillStarts) {
    SidecarLifecycle lifecycle(config_, probe_, processes_);
    StartupReport report = lifecycle.on_startup();
    
    EXPECT_EQ(report.pid, 7000);
    EXPECT_FALSE(report.ready);
    EXPECT_TRUE(lifecycle.state().has_child());
}

TEST_F(SidecarLifecycleTest, SpawnFailureAbortsStartup) {
    processes_.fail_spawn = true;
    
    SidecarLifecycle lifecycle(config_, probe_, processes_);
    EXPECT_THROW(lifecycle.on_startup(), slate::ProcessException);
    EXPECT_FALSE(lifecycle.state().has_child());
}

TEST_F(SidecarLifecycleTest, QuitThenExitKillsOnce) {
    SidecarLifecycle lifecycle(config_, probe_, processes_);
    lifecycle.on_startup();
    
    EXPECT_TRUE(lifecycle.on_quit());
    EXPECT_FALSE(lifecycle.on_exit());
    
    ASSERT_EQ(processes_.child_kill_count(), 1u);
    EXPECT_EQ(processes_.child_kills[0], 7000);
}

TEST_F(SidecarLifecycleTest, ExitBeforeStartupIsNoOp) {
    SidecarLifecycle lifecycle(config_, probe_, processes_);
    EXPECT_FALSE(lifecycle.on_exit());
    EXPECT_EQ(processes_.child_kill_count(), 0u);
}

TEST_F(SidecarLifecycleTest, WindowCloseKeepsServerRunning) {
    FakeWindow window;
    SidecarLifecycle lifecycle(config_, probe_, processes_);
    lifecycle.on_startup();
    
    EXPECT_EQ(lifecycle.on_window_close(window), CloseAction::PreventClose);
    EXPECT_FALSE(window.is_visible());
    EXPECT_TRUE(lifecycle.state().has_child());
    EXPECT_EQ(processes_.child_kill_count(), 0u);
}

} // namespace slate_tray
