#pragma once

#include <stacktrace>

namespace gs
{
/// Type alias for std::stacktrace
/// Snapshot of the call stack, printed by the default assertion handler
/// Usage:
///   gs::stacktrace trace = gs::stacktrace::current();
///   std::cerr << std::to_string(trace) << '\n';
using stacktrace = std::stacktrace;
} // namespace gs
