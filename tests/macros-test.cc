#include <genseq/macros.hh>
#include <nexus/test.hh>


// =========================================================================================================
// Preprocessor-level compile-time checks
// =========================================================================================================

// Test: Exactly-one compiler family is selected
#if defined(GS_COMPILER_MSVC) + defined(GS_COMPILER_POSIX) != 1
#error "Expected exactly one of GS_COMPILER_MSVC or GS_COMPILER_POSIX"
#endif

// Test: GS_OS_LINUX follows the target
#if defined(__linux__) != defined(GS_OS_LINUX)
#error "GS_OS_LINUX must be defined exactly on linux targets"
#endif

// Test: GS_ASSERT_ENABLED is always 0 or 1
#if !defined(GS_ASSERT_ENABLED) || (GS_ASSERT_ENABLED != 0 && GS_ASSERT_ENABLED != 1)
#error "GS_ASSERT_ENABLED must be defined as 0 or 1"
#endif

// Test: only plain release builds strip GS_ASSERT
#if defined(GS_RELEASE) && !defined(GS_ENABLE_ASSERT_IN_RELEASE)
#if GS_ASSERT_ENABLED
#error "GS_RELEASE without GS_ENABLE_ASSERT_IN_RELEASE must disable GS_ASSERT"
#endif
#else
#if !GS_ASSERT_ENABLED
#error "GS_ASSERT must stay enabled outside of plain release builds"
#endif
#endif

// Test: at most one build configuration
#if defined(GS_DEBUG) + defined(GS_RELEASE) + defined(GS_RELWITHDEBINFO) > 1
#error "Expected at most one of GS_DEBUG, GS_RELEASE, GS_RELWITHDEBINFO"
#endif


// =========================================================================================================
// Runtime checks
// =========================================================================================================

namespace
{
GS_FORCE_INLINE int forced_twice(int x) { return 2 * x; }

GS_COLD_FUNC int cold_negate(int x) { return -x; }
} // namespace

TEST("macros - function attributes keep semantics")
{
    CHECK(forced_twice(21) == 42);
    CHECK(cold_negate(5) == -5);
}

TEST("macros - GS_UNUSED does not evaluate its argument")
{
    int calls = 0;
    auto bump = [&] { return ++calls; };

    GS_UNUSED(bump());
    CHECK(calls == 0);
}
