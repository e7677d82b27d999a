#pragma once

#include <genseq/macros.hh>
#include <genseq/source_location.hh>

#include <functional>
#include <string>

namespace gs::impl
{
// Customizable assertion handler system
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = gs::impl::scoped_assertion_handler([](gs::impl::assertion_info const& info) {
//           log_assertion_failure(info);
//           throw usage_error{info.message};
//       });
//
//       // a traversal read outside its valid window now unwinds instead of aborting
//       auto const& v = cursor.current();
//   } // handler is automatically popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    gs::source_location location;
};

// Push a custom assertion handler onto the handler stack
// The handler will be called for all assertion failures until it is popped
// Handlers are allowed to throw exceptions as a way to unwind to some recovery point
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler from the stack
// NOTE: prefer scoped_assertion_handler, it also pops when a throwing handler unwinds
void pop_assertion_handler();

// RAII wrapper for pushing/popping assertion handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace gs::impl
