#include "assert.hh"

#include <assoc-core/assert-handler.hh>
#include <assoc-core/stacktrace.hh>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>

#ifdef AC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
using handler_t = std::move_only_function<void(ac::impl::assertion_info const&)>;

// innermost handler is back()
std::vector<handler_t>& assertion_handlers()
{
    static std::vector<handler_t> handlers;
    return handlers;
}

void print_to_stderr(ac::impl::assertion_info const& info)
{
    auto const& loc = info.location;
    std::cerr << "assertion failed: " << info.expression << '\n'
              << "  message:  " << info.message << '\n'
              << "  location: " << loc.file_name() << ':' << loc.line() << ':' << loc.column() << '\n'
              << "  function: " << loc.function_name() << '\n'
              << "stacktrace:\n"
              << std::to_string(ac::stacktrace::current()) << std::endl;
}

#ifdef AC_OS_LINUX
// "TracerPid:\t<pid>" in /proc/self/status, non-zero while a debugger is attached
bool is_traced_linux()
{
    auto const file = std::fopen("/proc/self/status", "r");
    if (file == nullptr)
        return false;

    auto tracer = 0;
    char line[256];
    while (std::fgets(line, sizeof(line), file) != nullptr)
    {
        if (std::strncmp(line, "TracerPid:", 10) != 0)
            continue;

        if (std::sscanf(line + 10, "%d", &tracer) != 1)
            tracer = 0;
        break;
    }

    std::fclose(file);
    return tracer != 0;
}
#endif
} // namespace

void ac::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    AC_ASSERT_ALWAYS(handler != nullptr, "assertion handler must be callable");
    assertion_handlers().push_back(std::move(handler));
}

void ac::impl::pop_assertion_handler()
{
    auto& handlers = assertion_handlers();
    AC_ASSERT_ALWAYS(!handlers.empty(), "unbalanced pop_assertion_handler");
    handlers.pop_back();
}

ac::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

ac::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

void ac::impl::handle_assert_failure(char const* expression, char const* message, ac::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    auto& handlers = assertion_handlers();
    if (handlers.empty())
        print_to_stderr(info);
    else
        handlers.back()(info); // may throw to unwind
}

bool ac::impl::is_debugger_connected() noexcept
{
#if defined(AC_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(AC_OS_LINUX)
    return is_traced_linux();
#else
    return false;
#endif
}

void ac::impl::perform_abort() noexcept
{
    std::abort();
}
