#pragma once

// Lean header with minimal dependencies: every other genseq header can include it at no cost.
#include <genseq/macros.hh>
#include <genseq/source_location.hh>

// =========================================================================================================
// GS_ASSERT - precondition and invariant checks
//
// On failure the topmost handler of the assertion handler stack is called (see assert-handler.hh),
// the default one prints expression, message, location and a stack trace to stderr.
// If the handler returns, the program breaks into an attached debugger and aborts.
//
// Active unless GS_RELEASE is defined without GS_ENABLE_ASSERT_IN_RELEASE (see GS_ASSERT_ENABLED).
// The message must be a string literal. A stripped assertion still has to compile.
//
// Failed assertions are programmer errors, e.g. reading a traversal that was never advanced.
// The end of a sequence is not: it is reported through gs::optional / advance() returning false.
// Exceptions thrown by user callbacks are never caught here, they reach the caller unchanged.
//
// Usage:
//   GS_ASSERT(self.has_value(), "attempted to access value of empty optional");
//
#define GS_ASSERT(cond, msg) GS_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// GS_ASSERT_ALWAYS - Always-active assertion
//
// Like GS_ASSERT but remains active in all build configurations, including release builds.
// Use this for contract checks that must never be skipped, e.g. traversal access outside its valid window.
//
// Usage:
//   GS_ASSERT_ALWAYS(is_active(), "no current value");
//
#define GS_ASSERT_ALWAYS(cond, msg) GS_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// GS_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define GS_DEBUG_BREAK() GS_IMPL_DEBUG_BREAK()

// =========================================================================================================
// GS_BREAK_AND_ABORT - Debug break followed by program termination
//
// Used by GS_ASSERT after the handler returned.
// A handler that throws never reaches this point.
//
#define GS_BREAK_AND_ABORT() (GS_DEBUG_BREAK(), ::gs::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace gs::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler (see assert-handler.hh) or prints to stderr
// Note: does not abort, caller must follow with GS_BREAK_AND_ABORT()
GS_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, gs::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace gs::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef GS_COMPILER_MSVC

#define GS_IMPL_DEBUG_BREAK() (::gs::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(GS_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// NOTE: we don't want to pull in any posix header here, so we simply declare raise
extern "C" int raise(int) noexcept;
#define GS_IMPL_DEBUG_BREAK() (::gs::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#endif

#define GS_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::gs::impl::handle_assert_failure(#cond, msg, ::gs::source_location::current()); \
            GS_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if GS_ASSERT_ENABLED

#define GS_IMPL_ASSERT(cond, msg) GS_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the condition and message still have to compile
#define GS_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        GS_UNUSED(cond);          \
        GS_UNUSED(msg);           \
    } while (false)

#endif
