#include <gtest/gtest.h>
#include <wc/metadata_store.hpp>
#include <wc/wc_init.hpp>
#include <wc/wc_lock.hpp>
#include <core/wc_error.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <fmt/format.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class WCLockTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path root;
    MetadataStore store;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
            fmt::format("wcstore_lock_test_{}_{}", ::getpid(),
                        ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        root = test_dir / "wc";
        wc_init(store, root);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void expect_kind(WCErrorKind kind, const std::function<void()>& fn) {
        try {
            fn();
            ADD_FAILURE() << "expected WCError " << wc_error_kind_name(kind);
        } catch (const WCError& e) {
            EXPECT_EQ(e.kind(), kind) << e.what();
        }
    }
};

TEST_F(WCLockTest, LockCreatesAndUnlockRemovesLockFile) {
    WCLock lock(store, root);
    EXPECT_FALSE(lock.has_lock());

    lock.lock();
    EXPECT_TRUE(lock.has_lock());
    EXPECT_TRUE(fs::exists(store.lock_path(root)));

    lock.unlock();
    EXPECT_FALSE(lock.has_lock());
    EXPECT_FALSE(fs::exists(store.lock_path(root)));
}

TEST_F(WCLockTest, DoubleLockFailsImmediately) {
    WCLock lock(store, root);
    lock.lock();
    expect_kind(WCErrorKind::DoubleLock, [&] { lock.lock(); });
    EXPECT_TRUE(lock.has_lock());
}

TEST_F(WCLockTest, UnlockWithoutLockFails) {
    WCLock lock(store, root);
    expect_kind(WCErrorKind::UnacquiredLockRelease, [&] { lock.unlock(); });
}

TEST_F(WCLockTest, DoubleUnlockFails) {
    WCLock lock(store, root);
    lock.lock();
    lock.unlock();
    expect_kind(WCErrorKind::UnacquiredLockRelease, [&] { lock.unlock(); });
}

TEST_F(WCLockTest, HandleCanBeReused) {
    WCLock lock(store, root);
    lock.lock();
    lock.unlock();
    lock.lock();
    EXPECT_TRUE(lock.has_lock());
    lock.unlock();
}

TEST_F(WCLockTest, LockWithoutStoreIsNotAWorkingCopy) {
    fs::path plain = test_dir / "plain";
    fs::create_directories(plain);
    WCLock lock(store, plain);
    expect_kind(WCErrorKind::NotAWorkingCopy, [&] { lock.lock(); });
    EXPECT_FALSE(lock.has_lock());
}

TEST_F(WCLockTest, GuardReleasesOnException) {
    WCLock lock(store, root);
    try {
        WCLockGuard guard(lock);
        EXPECT_TRUE(lock.has_lock());
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(lock.has_lock());
    EXPECT_FALSE(fs::exists(store.lock_path(root)));
}

TEST_F(WCLockTest, GuardToleratesManualUnlock) {
    WCLock lock(store, root);
    {
        WCLockGuard guard(lock);
        lock.unlock();
    }
    EXPECT_FALSE(lock.has_lock());
}

TEST_F(WCLockTest, DestroyedHandleReleases) {
    {
        WCLock lock(store, root);
        lock.lock();
    }
    WCLock again(store, root);
    again.lock();
    EXPECT_TRUE(again.has_lock());
}

TEST_F(WCLockTest, SecondHandleWaits) {
    WCLock first(store, root);
    WCLock second(store, root);
    first.lock();

    std::atomic<bool> got{false};
    std::thread waiter([&] {
        WCLockGuard guard(second);
        got = true;
    });

    std::this_thread::sleep_for(200ms);
    EXPECT_FALSE(got);
    first.unlock();
    waiter.join();
    EXPECT_TRUE(got);
}

TEST_F(WCLockTest, OtherProcessWaitsForRelease) {
    store.write_project(root, "initial");

    WCLock lock(store, root);
    lock.lock();

    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        int code = 0;
        try {
            WCLock child(store, root);
            WCLockGuard guard(child);
            store.write_project(root, "child");
        } catch (const std::exception&) {
            code = 1;
        }
        _exit(code);
    }

    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(store.read_project(root), "initial");
    store.write_project(root, "parent");
    lock.unlock();

    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
    EXPECT_EQ(store.read_project(root), "child");
}

TEST_F(WCLockTest, ReadModifyWriteUnderLockLosesNoUpdates) {
    store.write_project(root, "0");

    constexpr int kProcs = 4;
    constexpr int kRounds = 25;
    std::vector<pid_t> pids;
    for (int p = 0; p < kProcs; ++p) {
        pid_t pid = fork();
        ASSERT_GE(pid, 0);
        if (pid == 0) {
            int code = 0;
            try {
                WCLock lock(store, root);
                for (int i = 0; i < kRounds; ++i) {
                    WCLockGuard guard(lock);
                    int n = std::stoi(store.read_project(root));
                    store.write_project(root, std::to_string(n + 1));
                }
            } catch (const std::exception&) {
                code = 1;
            }
            _exit(code);
        }
        pids.push_back(pid);
    }

    for (pid_t pid : pids) {
        int status = 0;
        ASSERT_EQ(waitpid(pid, &status, 0), pid);
        ASSERT_TRUE(WIFEXITED(status));
        EXPECT_EQ(WEXITSTATUS(status), 0);
    }
    EXPECT_EQ(store.read_project(root), std::to_string(kProcs * kRounds));
}

TEST_F(WCLockTest, RootsSharingExternalStoreShareTheLock) {
    fs::path ext = test_dir / "shared";
    fs::create_directories(ext);
    fs::path a = test_dir / "a";
    fs::path b = test_dir / "b";
    wc_init(store, a, ext);
    wc_init(store, b, ext);

    WCLock la(store, a);
    WCLock lb(store, b);
    la.lock();

    std::atomic<bool> got{false};
    std::thread waiter([&] {
        WCLockGuard guard(lb);
        got = true;
    });
    std::this_thread::sleep_for(200ms);
    EXPECT_FALSE(got);
    la.unlock();
    waiter.join();
    EXPECT_TRUE(got);
}
