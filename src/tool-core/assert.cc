#include "assert.hh"

#include <tool-core/assert-handler.hh>
#include <tool-core/utility.hh>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#ifdef TC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
std::vector<tc::impl::assertion_handler>& thread_handlers()
{
    thread_local std::vector<tc::impl::assertion_handler> handlers;
    return handlers;
}

void report_to_stderr(tc::impl::assertion_info const& info)
{
    // one write per report so that failures on different threads do not interleave
    std::ostringstream report;
    report << "[tool-core] assertion failed: " << info.expression << '\n'
           << "  message:  " << info.message << '\n'
           << "  at:       " << info.location.file_name() << ':' << info.location.line() << " in "
           << info.location.function_name() << '\n'
           << "  thread:   " << info.thread << '\n';
    std::cerr << report.str() << std::flush;
}
} // namespace

void tc::impl::push_assertion_handler(assertion_handler handler)
{
    thread_handlers().push_back(tc::move(handler));
}

void tc::impl::pop_assertion_handler()
{
    auto& handlers = thread_handlers();
    if (!handlers.empty())
        handlers.pop_back();
}

int tc::impl::assertion_handler_count()
{
    return int(thread_handlers().size());
}

tc::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    push_assertion_handler(tc::move(handler));
}

tc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

TC_COLD_FUNC void tc::impl::handle_assert_failure(char const* expression, char const* message, std::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
        .thread = std::this_thread::get_id(),
    };

    auto& handlers = thread_handlers();
    if (handlers.empty())
        report_to_stderr(info);
    else
        handlers.back()(info);
}

bool tc::impl::is_debugger_connected() noexcept
{
#ifdef TC_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(TC_OS_LINUX)
    // "TracerPid: <pid>" is non-zero while a tracer is attached
    std::ifstream status("/proc/self/status");
    std::string key;
    while (status >> key)
    {
        if (key == "TracerPid:")
        {
            int pid = 0;
            status >> pid;
            return pid != 0;
        }
        status.ignore(4096, '\n');
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void tc::impl::perform_abort() noexcept
{
    std::abort();
}
