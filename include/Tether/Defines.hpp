#pragma once

#if defined(_MSC_VER) && !defined(__clang__)
#define TETHER_ALWAYS_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#define TETHER_ALWAYS_INLINE inline __attribute__((always_inline))
#else
#define TETHER_ALWAYS_INLINE inline
#endif

#ifndef TETHER_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(TETHER_SHARED_BUILD)
#define TETHER_API __declspec(dllexport)
#elif defined(TETHER_SHARED)
#define TETHER_API __declspec(dllimport)
#else
#define TETHER_API
#endif
#define TETHER_LOCAL
#else
#if defined(TETHER_SHARED_BUILD) || defined(TETHER_SHARED)
#define TETHER_API __attribute__((visibility("default")))
#else
#define TETHER_API
#endif
#define TETHER_LOCAL __attribute__((visibility("hidden")))
#endif
#endif
#ifndef TETHER_LOCAL
#define TETHER_LOCAL
#endif

namespace Tether
{

    [[noreturn]] inline void Unreachable()
    {
#if defined(_MSC_VER) && !defined(__clang__)// MSVC
        __assume(false);
#else// GCC, Clang
        __builtin_unreachable();
#endif
    }

}// namespace Tether
