#pragma once

#include <source_location>

namespace gs
{
/// Type alias for std::source_location
/// Captured by assertions to report where a precondition was violated
/// Usage:
///   void check(gs::source_location loc = gs::source_location::current()) {
///       std::cerr << loc.file_name() << ":" << loc.line();
///   }
using source_location = std::source_location;
} // namespace gs
