#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: WR_COMPILER_MSVC, WR_COMPILER_CLANG, WR_COMPILER_GCC, WR_COMPILER_POSIX

#if defined(_MSC_VER)
#define WR_COMPILER_MSVC
#elif defined(__clang__)
#define WR_COMPILER_CLANG
#elif defined(__GNUC__)
#define WR_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(WR_COMPILER_CLANG) || defined(WR_COMPILER_GCC)
#define WR_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: WR_OS_WINDOWS, WR_OS_LINUX, WR_OS_APPLE, WR_OS_BSD
// Only the debugger detection in assert.cc is platform-specific.

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define WR_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define WR_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define WR_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define WR_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// From CMake: WR_DEBUG, WR_RELEASE, WR_RELWITHDEBINFO, optionally WR_ENABLE_ASSERT_IN_RELEASE
// Derived here: WR_ASSERT_ENABLED (0 or 1)
//
// Assertions stay active in debug and release-with-debug-info builds.
// Contract violations reported through wr::sequence_error are checked in every configuration.

#ifndef WR_ASSERT_ENABLED
#if defined(WR_DEBUG) || defined(WR_RELWITHDEBINFO) || defined(WR_ENABLE_ASSERT_IN_RELEASE)
#define WR_ASSERT_ENABLED 1
#elif defined(WR_RELEASE)
#define WR_ASSERT_ENABLED 0
#else
// no build type from CMake (e.g. header consumed by a foreign build): be safe
#define WR_ASSERT_ENABLED 1
#endif
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// WR_FORCE_INLINE - Force function to be inlined
#define WR_FORCE_INLINE WR_IMPL_FORCE_INLINE

// WR_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: WR_COLD_FUNC void handle_error() { ... }
#define WR_COLD_FUNC WR_IMPL_COLD_FUNC

// WR_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: expr is NOT evaluated, only its type is checked
#define WR_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(WR_COMPILER_MSVC)

#define WR_IMPL_FORCE_INLINE __forceinline
#define WR_IMPL_COLD_FUNC

#elif defined(WR_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define WR_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define WR_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif
