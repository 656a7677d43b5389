#pragma once

#include <atomic>
#include <thread>

namespace JNAV::Sync
{
    /// @brief Spin lock guarding the short critical sections of lazily built node caches.
    class SpinLock
    {
    public:
        SpinLock()                           = default;
        SpinLock(const SpinLock&)            = delete;
        SpinLock& operator=(const SpinLock&) = delete;

        void Lock() noexcept
        {
            int backoff = 1;
            while (true)
            {
                bool wasLocked = m_locked.load(std::memory_order_relaxed);
                if (!wasLocked && m_locked.compare_exchange_weak(wasLocked, true, std::memory_order_acquire))
                    break;

                for (int i = 0; i < backoff; ++i)
                    std::this_thread::yield();

                if (backoff < 1024)
                    backoff *= 2;
            }
        }

        void Unlock() noexcept
        {
            m_locked.store(false, std::memory_order_release);
        }

        [[nodiscard]] bool TryLock() noexcept
        {
            bool expected = false;
            return m_locked.compare_exchange_strong(expected, true, std::memory_order_acquire);
        }

        void lock() noexcept { Lock(); }
        void unlock() noexcept { Unlock(); }
        [[nodiscard]] bool try_lock() noexcept { return TryLock(); }

    private:
        std::atomic<bool> m_locked {false};
    };
}// namespace JNAV::Sync
