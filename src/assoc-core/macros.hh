#pragma once

// =========================================================================================================
// Toolchain and platform
// =========================================================================================================
// AC_COMPILER_MSVC or AC_COMPILER_POSIX (clang and gcc)
// AC_OS_LINUX on linux, used for debugger detection

#if defined(_MSC_VER)
#define AC_COMPILER_MSVC
#elif defined(__clang__) || defined(__GNUC__)
#define AC_COMPILER_POSIX
#else
#error "assoc-core supports msvc, clang and gcc"
#endif

#if defined(__linux__)
#define AC_OS_LINUX
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// The build system defines one of AC_DEBUG, AC_RELEASE, AC_RELWITHDEBINFO.
// AC_ENABLE_ASSERT_IN_RELEASE turns AC_ASSERT on in AC_RELEASE as well.
// AC_ASSERT_ENABLED (0 or 1) is derived here unless set explicitly.

#ifndef AC_ASSERT_ENABLED
#if defined(AC_DEBUG) || defined(AC_RELWITHDEBINFO) || defined(AC_ENABLE_ASSERT_IN_RELEASE)
#define AC_ASSERT_ENABLED 1
#else
#define AC_ASSERT_ENABLED 0
#endif
#endif

// =========================================================================================================
// Attributes
// =========================================================================================================

#if defined(AC_COMPILER_MSVC)
#define AC_FORCE_INLINE __forceinline
#define AC_COLD_FUNC
#else
// gcc wants the extra 'inline' next to always_inline
#define AC_FORCE_INLINE __attribute__((always_inline)) inline
#define AC_COLD_FUNC __attribute__((cold))
#endif

// type-checks expr without evaluating it
#define AC_UNUSED(expr) (void)(sizeof((expr)))
