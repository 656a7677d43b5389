#pragma once

#ifndef JNAV_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(JNAV_SHARED_BUILD)
#define JNAV_API __declspec(dllexport)
#elif defined(JNAV_SHARED)
#define JNAV_API __declspec(dllimport)
#else
#define JNAV_API
#endif
#define JNAV_LOCAL
#else
#if defined(JNAV_SHARED_BUILD) || defined(JNAV_SHARED)
#define JNAV_API __attribute__((visibility("default")))
#else
#define JNAV_API
#endif
#define JNAV_LOCAL __attribute__((visibility("hidden")))
#endif
#endif
#ifndef JNAV_LOCAL
#define JNAV_LOCAL
#endif

namespace JNAV
{

    [[noreturn]] inline void Unreachable()
    {
#if defined(_MSC_VER) && !defined(__clang__)// MSVC
        __assume(false);
#else// GCC, Clang
        __builtin_unreachable();
#endif
    }

}// namespace JNAV
