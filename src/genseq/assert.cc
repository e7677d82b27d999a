#include "assert.hh"

#include <genseq/assert-handler.hh>
#include <genseq/stacktrace.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <vector>

#ifdef GS_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef GS_OS_LINUX
#include <cstring>
#endif

namespace
{
// NOTE: not thread-safe, must be externally synchronized
std::vector<std::move_only_function<void(gs::impl::assertion_info const&)>> g_assertion_handlers;

void default_assert_handler(gs::impl::assertion_info const& info)
{
    std::cerr << "Assertion failed: " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";

    std::cerr << "\nStacktrace:\n";
    auto trace = gs::stacktrace::current();
    std::cerr << std::to_string(trace) << '\n';
}
} // namespace

void gs::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void gs::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

gs::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

gs::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

GS_COLD_FUNC void gs::impl::handle_assert_failure(char const* expression, char const* message, gs::source_location location)
{
    assertion_info const info{
        .expression = std::string(expression),
        .message = std::string(message),
        .location = location,
    };

    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // no abort here, it's outside
}

bool gs::impl::is_debugger_connected() noexcept
{
#ifdef GS_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(GS_OS_LINUX)
    // TracerPid in /proc/self/status is non-zero while a debugger is attached
    if (auto* f = std::fopen("/proc/self/status", "r"))
    {
        char buf[1024];
        while (std::fgets(buf, sizeof(buf), f))
        {
            if (std::strncmp(buf, "TracerPid:", 10) == 0)
            {
                int pid = 0;
                bool const parsed = std::sscanf(buf + 10, "%d", &pid) == 1;
                std::fclose(f);
                return parsed && pid != 0;
            }
        }
        std::fclose(f);
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void gs::impl::perform_abort() noexcept
{
    std::abort();
}
