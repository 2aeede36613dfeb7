#include <slate/utils/process_manager.h>
#include <slate/error_types.h>

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <thread>
#include <vector>

#ifndef _WIN32

namespace slate {
namespace utils {

namespace {

bool wait_until(std::function<bool()> condition, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return condition();
}

} // namespace

TEST(ProcessManagerTest, ChildSeesInjectedEnvironment) {
    auto handle = ProcessManager::start_process(
        "/bin/sh",
        {"-c", "test \"$SLATE_OWNER\" = tauri && test \"$SLATE_ENV\" = prod"},
        "",
        {{"SLATE_OWNER", "tauri"}, {"SLATE_ENV", "prod"}});
    
    EXPECT_GT(handle.pid, 0);
    EXPECT_EQ(ProcessManager::wait_for_exit(handle, 5000), 0);
}

TEST(ProcessManagerTest, ChildRunsInWorkingDirectory) {
    auto handle = ProcessManager::start_process("/bin/sh", {"-c", "test \"$(pwd -P)\" = /"}, "/");
    EXPECT_EQ(ProcessManager::wait_for_exit(handle, 5000), 0);
}

TEST(ProcessManagerTest, MissingExecutableThrows) {
    EXPECT_THROW(
        ProcessManager::start_process("/nonexistent/slate-server", {}),
        slate::ProcessException);
}

TEST(ProcessManagerTest, KillTreeTakesDescendantsDown) {
    auto handle = ProcessManager::start_process(
        "/bin/sh", {"-c", "sleep 30 & sleep 30 & wait"});
    
    std::vector<int> descendants;
    ASSERT_TRUE(wait_until([&]() {
        descendants = ProcessManager::get_descendants(handle.pid);
        return descendants.size() >= 2;
    }, std::chrono::milliseconds(3000)));
    
    EXPECT_TRUE(ProcessManager::kill_process_tree(handle));
    EXPECT_FALSE(ProcessManager::is_process_alive(handle.pid));
    
    for (int pid : descendants) {
        EXPECT_TRUE(wait_until([pid]() { return !ProcessManager::is_process_alive(pid); },
                               std::chrono::milliseconds(3000)))
            << "descendant " << pid << " survived";
    }
}

TEST(ProcessManagerTest, KillByPidStopsUnrelatedHandle) {
    auto handle = ProcessManager::start_process("/bin/sh", {"-c", "sleep 30"});
    ASSERT_TRUE(ProcessManager::is_process_alive(handle.pid));
    
    // Unreaped children count as dead, so this does not need a waitpid
    EXPECT_TRUE(ProcessManager::kill_process_tree(handle.pid, 3000));
    EXPECT_FALSE(ProcessManager::is_process_alive(handle.pid));
    EXPECT_EQ(ProcessManager::wait_for_exit(handle, 2000), -1);
}

TEST(ProcessManagerTest, KillingVanishedPidSucceeds) {
    auto handle = ProcessManager::start_process("/bin/sh", {"-c", "exit 0"});
    ASSERT_EQ(ProcessManager::wait_for_exit(handle, 5000), 0);
    
    EXPECT_FALSE(ProcessManager::is_process_alive(handle.pid));
    EXPECT_TRUE(ProcessManager::kill_process_tree(handle.pid, 100));
}

} // namespace utils
} // namespace slate

#endif
