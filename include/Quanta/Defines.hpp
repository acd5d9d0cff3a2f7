#pragma once

#include <Quanta/Config.hpp>

#if defined(_MSC_VER) && !defined(__clang__)
#define QUANTA_ALWAYS_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#define QUANTA_ALWAYS_INLINE inline __attribute__((always_inline))
#else
#define QUANTA_ALWAYS_INLINE inline
#endif

#ifndef QUANTA_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(QUANTA_SHARED_BUILD)
#define QUANTA_API __declspec(dllexport)
#elif defined(QUANTA_SHARED)
#define QUANTA_API __declspec(dllimport)
#else
#define QUANTA_API
#endif
#define QUANTA_LOCAL
#else
#if defined(QUANTA_SHARED_BUILD) || defined(QUANTA_SHARED)
#define QUANTA_API __attribute__((visibility("default")))
#else
#define QUANTA_API
#endif
#define QUANTA_LOCAL __attribute__((visibility("hidden")))
#endif
#endif
#ifndef QUANTA_LOCAL
#define QUANTA_LOCAL
#endif

namespace Quanta
{

    [[noreturn]] inline void Unreachable()
    {
#if defined(_MSC_VER) && !defined(__clang__)// MSVC
        __assume(false);
#else// GCC, Clang
        __builtin_unreachable();
#endif
    }

    namespace detail
    {
        /// @brief Logs a fatal programming error at critical level and aborts the process.
        ///
        /// @details Used for declaration-time errors in the quantity catalog. These indicate a bug in
        /// the catalog, not bad user input, so they are never turned into recoverable values.
        [[noreturn]] QUANTA_API void FatalError(const char* message, const char* file, int line) noexcept;
    }// namespace detail

}// namespace Quanta

#define QUANTA_ABORT(message) ::Quanta::detail::FatalError((message), __FILE__, __LINE__)

#if QUANTA_ENABLE_ASSERTS
#define QUANTA_ASSERT(condition, message) \
    do                                    \
    {                                     \
        if (!(condition))                 \
            QUANTA_ABORT(message);        \
    } while (false)
#else
#define QUANTA_ASSERT(condition, message) ((void) 0)
#endif
