#include "assert.hh"

#include <nsrb/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <utility>
#include <vector>

#ifdef NSRB_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef NSRB_COMPILER_POSIX
#include <cstring>
#endif

namespace
{
// NOTE: This is not thread-safe and must be externally synchronized
std::vector<std::move_only_function<void(nsrb::impl::assertion_info const&)>> g_assertion_handlers;

void default_assert_handler(nsrb::impl::assertion_info const& info)
{
    std::cerr << "Assertion failed: " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";
}
} // namespace

void nsrb::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void nsrb::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

int nsrb::impl::assertion_handler_count()
{
    return int(g_assertion_handlers.size());
}

nsrb::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

nsrb::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

NSRB_COLD_FUNC void nsrb::impl::handle_assert_failure(char const* expression, char const* message, nsrb::source_location location)
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

bool nsrb::impl::is_debugger_connected() noexcept
{
#ifdef NSRB_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(NSRB_OS_LINUX)
    // Check /proc/self/status for TracerPid
    if (auto* f = std::fopen("/proc/self/status", "r"))
    {
        char buf[1024];
        while (std::fgets(buf, sizeof(buf), f))
        {
            if (std::strncmp(buf, "TracerPid:", 10) == 0)
            {
                int pid = 0;
                if (std::sscanf(buf + 10, "%d", &pid) != 1)
                    pid = 0;
                std::fclose(f);
                return pid != 0;
            }
        }
        std::fclose(f);
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void nsrb::impl::perform_abort() noexcept
{
    std::abort();
}
