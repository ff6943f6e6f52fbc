#pragma once

#include <tool-core/assert.hh>
#include <tool-core/utility.hh>

#include <chrono>
#include <thread>

namespace tc
{
/// Waits for the given duration on the calling thread, then returns f(args...)
/// tool-core spawns no threads: the wait blocks the caller.
/// Arguments are forwarded unchanged, exceptions from f propagate unchanged.
/// Usage:
///   tc::delay(log_line, std::chrono::milliseconds(500), "a", "b"); // calls log_line("a", "b") after 500ms
/// Precondition: wait >= 0
template <class F, class Rep, class Period, class... Args>
decltype(auto) delay(F&& f, std::chrono::duration<Rep, Period> wait, Args&&... args)
{
    TC_ASSERT(wait >= wait.zero(), "delay: wait must not be negative");
    TC_ASSERT(tc::has_callable_target(f), "delay requires a callable target");

    std::this_thread::sleep_for(wait);
    return tc::invoke(tc::forward<F>(f), tc::forward<Args>(args)...);
}
} // namespace tc
