#pragma once

// =========================================================================================================
// Platform detection
// =========================================================================================================
// Exactly one of: GS_COMPILER_MSVC, GS_COMPILER_POSIX (clang, gcc, mingw)
// Conditionally defined: GS_OS_LINUX (debugger detection reads /proc)

#if defined(_MSC_VER)
#define GS_COMPILER_MSVC
#elif defined(__clang__) || defined(__GNUC__)
#define GS_COMPILER_POSIX
#else
#error "Unknown compiler"
#endif

#if defined(__linux__)
#define GS_OS_LINUX
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// From CMake: GS_DEBUG, GS_RELEASE, GS_RELWITHDEBINFO, GS_ENABLE_ASSERT_IN_RELEASE
// Always defined: GS_ASSERT_ENABLED (0 or 1)
//
// GS_ASSERT is active in debug and release-with-debug-info builds.
// Plain release builds strip it unless GS_ENABLE_ASSERT_IN_RELEASE is set.
// GS_ASSERT_ALWAYS ignores all of this.

#if defined(GS_RELEASE) && !defined(GS_ENABLE_ASSERT_IN_RELEASE)
#define GS_ASSERT_ENABLED 0
#else
#define GS_ASSERT_ENABLED 1
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// GS_FORCE_INLINE - Force function to be inlined
#define GS_FORCE_INLINE GS_IMPL_FORCE_INLINE

// GS_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: GS_COLD_FUNC void handle_error() { ... }
#define GS_COLD_FUNC GS_IMPL_COLD_FUNC

// GS_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Usage: GS_UNUSED(result);
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define GS_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(GS_COMPILER_MSVC)

#define GS_IMPL_FORCE_INLINE __forceinline
#define GS_IMPL_COLD_FUNC

#elif defined(GS_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define GS_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define GS_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif
