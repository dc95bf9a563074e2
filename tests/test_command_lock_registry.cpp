// =============================================================================
// Unit tests for CommandLockRegistry (src/command_lock_registry.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "command_lock_registry.hpp"

#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <vector>

using namespace tapdeck;

TEST(CommandLockRegistryTest, SameIdentitySameLock) {
    CommandLockRegistry reg;
    std::timed_mutex& a = reg.getLock("R5CT123");
    std::timed_mutex& b = reg.getLock("R5CT123");
    EXPECT_EQ(&a, &b);
    EXPECT_EQ(reg.size(), 1u);
}

TEST(CommandLockRegistryTest, DistinctIdentitiesDistinctLocks) {
    CommandLockRegistry reg;
    EXPECT_NE(&reg.getLock("A"), &reg.getLock("B"));
    EXPECT_EQ(reg.size(), 2u);
}

TEST(CommandLockRegistryTest, ConcurrentFirstUseCreatesOneLock) {
    CommandLockRegistry reg;
    std::vector<std::thread> threads;
    std::vector<std::timed_mutex*> seen(16, nullptr);
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&, i] { seen[i] = &reg.getLock("shared"); });
    }
    for (auto& t : threads) t.join();

    std::set<std::timed_mutex*> unique(seen.begin(), seen.end());
    EXPECT_EQ(unique.size(), 1u);
    EXPECT_EQ(reg.size(), 1u);
}

TEST(CommandLockRegistryTest, LockIsExclusivePerIdentity) {
    CommandLockRegistry reg;
    std::timed_mutex& lock = reg.getLock("dev");
    lock.lock();

    std::atomic<bool> acquired{true};
    std::thread other([&] {
        acquired = reg.getLock("dev").try_lock_for(std::chrono::milliseconds(50));
    });
    other.join();
    EXPECT_FALSE(acquired.load());

    // Another identity is unaffected
    std::timed_mutex& free_lock = reg.getLock("other");
    EXPECT_TRUE(free_lock.try_lock());
    free_lock.unlock();

    lock.unlock();
}
