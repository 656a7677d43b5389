/// @file SpinLockTests.cpp
/// @brief Tests for JNAV::Sync::SpinLock and LockGuard.

#include <JNAV/Sync/LockGuard.hpp>
#include <JNAV/Sync/SpinLock.hpp>

#include <catch2/catch_test_macros.hpp>

#include <thread>
#include <vector>

using namespace JNAV::Sync;

static_assert(BasicLockableConcept<SpinLock>);
static_assert(TryLockableConcept<SpinLock>);

TEST_CASE("SpinLock TryLock fails while held", "[Sync][SpinLock]")
{
    SpinLock lock;

    REQUIRE(lock.TryLock());
    CHECK_FALSE(lock.TryLock());

    lock.Unlock();
    CHECK(lock.TryLock());
    lock.Unlock();
}

TEST_CASE("LockGuard releases on scope exit", "[Sync][SpinLock]")
{
    SpinLock lock;
    {
        LockGuard<SpinLock> guard(lock);
        CHECK_FALSE(lock.TryLock());
    }
    CHECK(lock.TryLock());
    lock.Unlock();
}

TEST_CASE("SpinLock serializes concurrent increments", "[Sync][SpinLock]")
{
    constexpr int threadCount   = 4;
    constexpr int perThreadIncs = 10000;

    SpinLock                 lock;
    int                      counter = 0;
    std::vector<std::thread> workers;
    workers.reserve(threadCount);

    for (int t = 0; t < threadCount; ++t)
    {
        workers.emplace_back([&] {
            for (int i = 0; i < perThreadIncs; ++i)
            {
                LockGuard<SpinLock> guard(lock);
                ++counter;
            }
        });
    }

    for (auto& worker: workers)
    {
        worker.join();
    }

    CHECK(counter == threadCount * perThreadIncs);
}
