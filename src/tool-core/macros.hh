#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: TC_COMPILER_MSVC, TC_COMPILER_CLANG, TC_COMPILER_GCC, TC_COMPILER_MINGW, TC_COMPILER_POSIX

#if defined(_MSC_VER)
#define TC_COMPILER_MSVC
#elif defined(__clang__)
#define TC_COMPILER_CLANG
#elif defined(__GNUC__)
#define TC_COMPILER_GCC
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define TC_COMPILER_MINGW
#else
#error "Unknown compiler"
#endif

#if defined(TC_COMPILER_CLANG) || defined(TC_COMPILER_GCC) || defined(TC_COMPILER_MINGW)
#define TC_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: TC_OS_WINDOWS, TC_OS_LINUX, TC_OS_APPLE, TC_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define TC_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__) || defined(macintosh)
#define TC_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define TC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define TC_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// From CMake: TC_DEBUG, TC_RELEASE, TC_RELWITHDEBINFO, (optional) TC_ENABLE_ASSERT_IN_RELEASE
// Always defined: TC_ASSERT_ENABLED (0 or 1)

#ifndef TC_ASSERT_ENABLED
#if defined(TC_DEBUG) || defined(TC_RELWITHDEBINFO) || defined(TC_ENABLE_ASSERT_IN_RELEASE)
#define TC_ASSERT_ENABLED 1
#else
#define TC_ASSERT_ENABLED 0
#endif
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// TC_FORCE_INLINE - Force function to be inlined
#define TC_FORCE_INLINE TC_IMPL_FORCE_INLINE

// TC_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: TC_COLD_FUNC void handle_error() { ... }
#define TC_COLD_FUNC TC_IMPL_COLD_FUNC

// TC_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define TC_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(TC_COMPILER_MSVC)

#define TC_IMPL_FORCE_INLINE __forceinline
#define TC_IMPL_COLD_FUNC

#elif defined(TC_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define TC_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define TC_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif
