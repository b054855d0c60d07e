#include "assert.hh"

#include <snow-core/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <vector>

#ifdef SK_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef SK_COMPILER_POSIX
#include <unistd.h>

#include <cstring>
#endif

namespace
{
// NOTE: not thread-safe, must be externally synchronized
std::vector<std::move_only_function<void(sk::impl::assertion_info const&)>> g_assertion_handlers;

void default_assert_handler(sk::impl::assertion_info const& info)
{
    std::cerr << "Assertion failed: " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";
    std::cerr.flush();
}
} // namespace

void sk::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void sk::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

sk::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

sk::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

SK_COLD_FUNC void sk::impl::handle_assert_failure(char const* expression, char const* message, sk::source_location location)
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

bool sk::impl::is_debugger_connected() noexcept
{
#ifdef SK_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(SK_OS_LINUX)
    // TracerPid in /proc/self/status is non-zero while a debugger is attached
    if (auto* f = std::fopen("/proc/self/status", "r"))
    {
        char buf[1024];
        while (std::fgets(buf, sizeof(buf), f))
        {
            if (std::strncmp(buf, "TracerPid:", 10) == 0)
            {
                int pid = 0;
                auto const parsed = std::sscanf(buf + 10, "%d", &pid) == 1;
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

[[noreturn]] void sk::impl::perform_abort() noexcept
{
    std::abort();
}
