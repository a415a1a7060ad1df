#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: NSRB_COMPILER_MSVC, NSRB_COMPILER_CLANG, NSRB_COMPILER_GCC, NSRB_COMPILER_MINGW, NSRB_COMPILER_POSIX

#if defined(_MSC_VER)
#define NSRB_COMPILER_MSVC
#elif defined(__clang__)
#define NSRB_COMPILER_CLANG
#elif defined(__GNUC__)
#define NSRB_COMPILER_GCC
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define NSRB_COMPILER_MINGW
#else
#error "Unknown compiler"
#endif

#if defined(NSRB_COMPILER_CLANG) || defined(NSRB_COMPILER_GCC) || defined(NSRB_COMPILER_MINGW)
#define NSRB_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: NSRB_OS_WINDOWS, NSRB_OS_LINUX, NSRB_OS_APPLE, NSRB_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define NSRB_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__) || defined(macintosh)
#define NSRB_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define NSRB_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define NSRB_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// From CMake: NSRB_DEBUG, NSRB_RELEASE, NSRB_RELWITHDEBINFO
// Optional:   NSRB_ENABLE_ASSERT_IN_RELEASE
// Defined:    NSRB_ASSERT_ENABLED (0 or 1)

#if defined(NSRB_DEBUG) || defined(NSRB_RELWITHDEBINFO) || defined(NSRB_ENABLE_ASSERT_IN_RELEASE)
#define NSRB_ASSERT_ENABLED 1
#else
#define NSRB_ASSERT_ENABLED 0
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// NSRB_FORCE_INLINE - Force function to be inlined
// push/pop are marked with this, they are a handful of instructions each
#define NSRB_FORCE_INLINE NSRB_IMPL_FORCE_INLINE

// NSRB_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: NSRB_COLD_FUNC void handle_error() { ... }
#define NSRB_COLD_FUNC NSRB_IMPL_COLD_FUNC

// NSRB_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define NSRB_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(NSRB_COMPILER_MSVC)

#define NSRB_IMPL_FORCE_INLINE __forceinline
#define NSRB_IMPL_COLD_FUNC

#elif defined(NSRB_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define NSRB_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define NSRB_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif
