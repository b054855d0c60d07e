#pragma once

// =========================================================================================================
// Platform
// =========================================================================================================
// Compiler: exactly one of SK_COMPILER_MSVC, SK_COMPILER_CLANG, SK_COMPILER_GCC
//           plus SK_COMPILER_POSIX for the gcc-style ones
// OS:       SK_OS_LINUX where /proc can be queried, nothing else is distinguished

#if defined(_MSC_VER)
#define SK_COMPILER_MSVC
#elif defined(__clang__)
#define SK_COMPILER_CLANG
#define SK_COMPILER_POSIX
#elif defined(__GNUC__)
#define SK_COMPILER_GCC
#define SK_COMPILER_POSIX
#else
#error "snow-core supports msvc, clang and gcc"
#endif

#if defined(__linux__)
#define SK_OS_LINUX
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// CMake passes one of SK_DEBUG, SK_RELEASE, SK_RELWITHDEBINFO and optionally SK_ENABLE_ASSERT_IN_RELEASE.
// SK_ASSERT_ENABLED is always defined to 0 or 1 and may be overridden on the command line.

#ifndef SK_ASSERT_ENABLED
#if defined(SK_RELEASE) && !defined(SK_ENABLE_ASSERT_IN_RELEASE)
#define SK_ASSERT_ENABLED 0
#else
#define SK_ASSERT_ENABLED 1
#endif
#endif

// =========================================================================================================
// Helpers
// =========================================================================================================

// SK_COLD_FUNC - the function is on a failure path (assertions)
#ifdef SK_COMPILER_POSIX
#define SK_COLD_FUNC __attribute__((cold))
#else
#define SK_COLD_FUNC
#endif

// SK_MACRO_JOIN(a, b) - token concatenation after expanding a and b
// Usage: SK_MACRO_JOIN(_deferred_, __COUNTER__) -> _deferred_17
#define SK_MACRO_JOIN(arg1, arg2) SK_IMPL_MACRO_JOIN(arg1, arg2)
#define SK_IMPL_MACRO_JOIN(arg1, arg2) arg1##arg2

// SK_UNUSED(expr) - type-checks expr without evaluating it
// Used by stripped assertions so that their condition still has to compile.
#define SK_UNUSED(expr) (void)(sizeof((expr)))
