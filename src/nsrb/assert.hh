#pragma once

// Lean header, included by every container in nsrb.
#include <nsrb/macros.hh>
#include <nsrb/source_location.hh>

// =========================================================================================================
// NSRB_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
//
// When assertions are active:
//   Assertions are enabled in NSRB_DEBUG and NSRB_RELWITHDEBINFO builds.
//   In NSRB_RELEASE builds, assertions are disabled unless NSRB_ENABLE_ASSERT_IN_RELEASE is defined.
//
// What assertions are for:
//   Assertions protect INVARIANTS and PRECONDITIONS, e.g. the index bounds of a checked buffer
//   or accessing the value of an empty optional returned by pop().
//
// What assertions are NOT for:
//   - popping from an empty ring (that returns an empty optional)
//   - pushing into a full ring (that evicts the oldest element)
//
// Capacity limits are NOT asserted at runtime: they are constraints on the buffer templates (see limits.hh).
//
// Usage:
//   NSRB_ASSERT(0 <= i && i < N, "index out of bounds");
//
#define NSRB_ASSERT(cond, msg) NSRB_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// NSRB_ASSERT_ALWAYS - Always-active assertion
//
// Like NSRB_ASSERT but remains active in all build configurations, including release builds.
//
#define NSRB_ASSERT_ALWAYS(cond, msg) NSRB_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// NSRB_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define NSRB_DEBUG_BREAK() NSRB_IMPL_DEBUG_BREAK()

// =========================================================================================================
// NSRB_BREAK_AND_ABORT - Debug break followed by program termination
//
#define NSRB_BREAK_AND_ABORT() (NSRB_DEBUG_BREAK(), ::nsrb::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace nsrb::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler (see assert-handler.hh) or prints to stderr
// Note: does not abort, caller must follow with NSRB_BREAK_AND_ABORT()
NSRB_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, nsrb::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace nsrb::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef NSRB_COMPILER_MSVC

#define NSRB_IMPL_DEBUG_BREAK() (::nsrb::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(NSRB_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// NOTE: we don't want to pull in any posix header here, so we simply declare raise
extern "C" int raise(int) noexcept;
#define NSRB_IMPL_DEBUG_BREAK() (::nsrb::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define NSRB_IMPL_DEBUG_BREAK() void(0)

#endif

#define NSRB_IMPL_ASSERT_ALWAYS(cond, msg)                                                       \
    do                                                                                           \
    {                                                                                            \
        if (!(cond)) [[unlikely]]                                                                \
        {                                                                                        \
            ::nsrb::impl::handle_assert_failure(#cond, msg, ::nsrb::source_location::current()); \
            NSRB_BREAK_AND_ABORT();                                                              \
        }                                                                                        \
    } while (false)

#if NSRB_ASSERT_ENABLED

#define NSRB_IMPL_ASSERT(cond, msg) NSRB_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// Stripped, but the condition and message still have to compile
#define NSRB_IMPL_ASSERT(cond, msg) \
    do                              \
    {                               \
        NSRB_UNUSED(cond);          \
        NSRB_UNUSED(msg);           \
    } while (false)

#endif
