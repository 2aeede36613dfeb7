#include "slate_tray/server_supervisor.h"
#include "test_fakes.h"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

namespace slate_tray {

class ServerSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.server_binary = "/opt/slate/bin/slate-server";
        config_.owner = "tauri";
        config_.env = "prod";
        config_.poll_interval = std::chrono::milliseconds(5);
    }
    
    SupervisorConfig config_;
    FakeHealthProbe probe_;
    FakeProcessController processes_;
    ServerState state_;
};

TEST_F(ServerSupervisorTest, SpawnInjectsIdentityAndStoresChild) {
    ServerSupervisor supervisor(config_, probe_, processes_, state_);
    auto handle = supervisor.spawn();
    
    ASSERT_EQ(processes_.spawns.size(), 1u);
    const SpawnRequest& request = processes_.spawns[0];
    EXPECT_EQ(request.executable, "/opt/slate/bin/slate-server");
    EXPECT_EQ(request.working_dir, "/opt/slate/bin");
    
    bool saw_owner = false;
    bool saw_env = false;
    for (const auto& var : request.env_vars) {
        if (var.first == "SLATE_OWNER") {
            EXPECT_EQ(var.second, "tauri");
            saw_owner = true;
        } else if (var.first == "SLATE_ENV") {
            EXPECT_EQ(var.second, "prod");
            saw_env = true;
        }
    }
    EXPECT_TRUE(saw_owner);
    EXPECT_TRUE(saw_env);
    
    EXPECT_TRUE(state_.has_child());
    EXPECT_EQ(state_.child_pid(), handle.pid);
}

TEST_F(ServerSupervisorTest, SpawnFailureLeavesStateEmpty) {
    processes_.fail_spawn = true;
    ServerSupervisor supervisor(config_, probe_, processes_, state_);
    
    EXPECT_THROW(supervisor.spawn(), slate::ProcessException);
    EXPECT_FALSE(state_.has_child());
}

TEST_F(ServerSupervisorTest, SecondSpawnIsRejected) {
    ServerSupervisor supervisor(config_, probe_, processes_, state_);
    supervisor.spawn();
    
    EXPECT_THROW(supervisor.spawn(), slate::ProcessException);
    EXPECT_EQ(processes_.spawns.size(), 1u);
}

TEST_F(ServerSupervisorTest, AwaitReadyReturnsOnceHealthAnswers) {
    probe_.scripted = {std::nullopt, std::nullopt};
    probe_.set_fallback(make_health("slate-server", "tauri", "prod", 5000));
    
    ServerSupervisor supervisor(config_, probe_, processes_, state_);
    EXPECT_TRUE(supervisor.await_ready(std::chrono::milliseconds(2000)));
    EXPECT_EQ(probe_.probe_calls, 3);
}

TEST_F(ServerSupervisorTest, AwaitReadyTimesOutWithoutKilling) {
    ServerSupervisor supervisor(config_, probe_, processes_, state_);
    supervisor.spawn();
    
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(supervisor.await_ready(std::chrono::milliseconds(50)));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
    
    EXPECT_TRUE(state_.has_child());
    EXPECT_TRUE(processes_.child_kills.empty());
}

TEST(ServerStateTest, AdoptRefusesSecondChild) {
    ServerState state;
    EXPECT_TRUE(state.adopt({nullptr, 10}));
    EXPECT_FALSE(state.adopt({nullptr, 11}));
    EXPECT_EQ(state.child_pid(), 10);
}

TEST(ServerStateTest, TakeEmptiesState) {
    ServerState state;
    EXPECT_FALSE(state.take().has_value());
    
    state.adopt({nullptr, 10});
    auto child = state.take();
    ASSERT_TRUE(child.has_value());
    EXPECT_EQ(child->pid, 10);
    EXPECT_FALSE(state.has_child());
    EXPECT_EQ(state.child_pid(), 0);
}

TEST(ServerStateTest, ConcurrentTakeHandsChildToExactlyOneCaller) {
    for (int round = 0; round < 50; ++round) {
        ServerState state;
        state.adopt({nullptr, 42});
        
        std::atomic<int> winners{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 4; ++i) {
            threads.emplace_back([&]() {
                if (state.take()) {
                    ++winners;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        EXPECT_EQ(winners.load(), 1);
    }
}

} // namespace slate_tray
