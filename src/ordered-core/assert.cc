#include "assert.hh"

#include <ordered-core/assert-handler.hh>

#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#ifdef OC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
// installed handlers, innermost last
// process-global and unsynchronized, callers serialize installation themselves
std::vector<oc::impl::assertion_handler>& handler_stack()
{
    static std::vector<oc::impl::assertion_handler> handlers;
    return handlers;
}

// used when no handler is installed
void print_to_stderr(oc::impl::assertion_info const& info)
{
    auto const& loc = info.location;
    std::cerr << loc.file_name() << ':' << loc.line() << ':' << loc.column() << ": assertion `" << info.expression
              << "` failed: " << info.message << '\n'
              << "    in " << loc.function_name() << std::endl;
}

#ifdef OC_OS_LINUX
// pid of the attached tracer from /proc/self/status, 0 if none
int tracer_pid()
{
    std::ifstream status("/proc/self/status");
    std::string line;
    while (std::getline(status, line))
    {
        constexpr std::string_view prefix = "TracerPid:";
        if (line.starts_with(prefix))
            return std::atoi(line.c_str() + prefix.size());
    }
    return 0;
}
#endif
} // namespace

void oc::impl::push_assertion_handler(assertion_handler handler)
{
    handler_stack().push_back(std::move(handler));
}

void oc::impl::pop_assertion_handler()
{
    auto& handlers = handler_stack();
    if (!handlers.empty())
        handlers.pop_back();
}

int oc::impl::assertion_handler_count()
{
    return int(handler_stack().size());
}

oc::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    push_assertion_handler(std::move(handler));
}

oc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

void oc::impl::handle_assert_failure(char const* expression, char const* message, oc::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    auto& handlers = handler_stack();
    if (handlers.empty())
        print_to_stderr(info);
    else
        handlers.back()(info); // may throw, the caller aborts only if it returns
}

bool oc::impl::is_debugger_connected() noexcept
{
#if defined(OC_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(OC_OS_LINUX)
    try
    {
        return tracer_pid() != 0;
    }
    catch (std::exception const&)
    {
        return false;
    }
#else
    return false;
#endif
}

void oc::impl::perform_abort() noexcept
{
    std::abort();
}
