#pragma once

#include <nsrb/macros.hh>
#include <nsrb/source_location.hh>

#include <functional>
#include <string>

namespace nsrb::impl
{
// Customizable assertion handler stack
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = nsrb::impl::scoped_assertion_handler([](nsrb::impl::assertion_info const& info) {
//           log_assertion_failure(info);
//           throw assertion_failure_exception{info.message};
//       });
//
//       auto v = ring.pop().value(); // asserts on an empty ring, handler throws
//   } // handler is automatically popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    nsrb::source_location location;
};

// Push a custom assertion handler onto the handler stack
// Handlers are allowed to throw exceptions as a way to unwind to some recovery point
// If a handler returns normally, the program is still aborted
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler from the stack
// Does nothing if the stack is empty
void pop_assertion_handler();

// Number of handlers currently installed
[[nodiscard]] int assertion_handler_count();

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
} // namespace nsrb::impl
