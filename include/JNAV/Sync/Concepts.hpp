/// @file Concepts.hpp
/// @brief Concepts for synchronization primitives.
#pragma once

#include <concepts>

namespace JNAV::Sync
{
    template<typename T>
    concept BasicLockableConcept = requires(T lockable) {
        lockable.lock();
        lockable.unlock();
    };

    template<typename T>
    concept TryLockableConcept = BasicLockableConcept<T> && requires(T lockable) {
        {
            lockable.try_lock()
        } -> std::convertible_to<bool>;
    };
}// namespace JNAV::Sync
