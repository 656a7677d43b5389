/// @file LockGuard.hpp
/// @brief RAII scope lock for JNAV synchronization primitives.
#pragma once

#include <JNAV/Sync/Concepts.hpp>

namespace JNAV::Sync
{
    template<BasicLockableConcept TLockable>
    class LockGuard final
    {
    public:
        explicit LockGuard(TLockable& lockable)
            : m_lockable(lockable)
        {
            m_lockable.lock();
        }

        LockGuard(const LockGuard&)            = delete;
        LockGuard& operator=(const LockGuard&) = delete;
        LockGuard(LockGuard&&)                 = delete;
        LockGuard& operator=(LockGuard&&)      = delete;

        ~LockGuard()
        {
            m_lockable.unlock();
        }

    private:
        TLockable& m_lockable;
    };
}// namespace JNAV::Sync
